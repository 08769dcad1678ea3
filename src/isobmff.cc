// This file is part of Reelstore, a deduplicating store for large media files.
// Copyright (C) 2016 Lamb <slamb@slamb.org>
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// In addition, as a special exception, the copyright holders give
// permission to link the code of portions of this program with the
// OpenSSL library under certain conditions as described in each
// individual source file, and distribute linked combinations including
// the two.
//
// You must obey the GNU General Public License in all respects for all
// of the code used other than OpenSSL. If you modify file(s) with this
// exception, you may extend this exception to your version of the
// file(s), but you are not obligated to do so. If you do not wish to do
// so, delete this exception statement from your version. If you delete
// this exception statement from all source files in the program, then
// also delete it here.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
// isobmff.cc: implementation of isobmff.h interface.
//
// This will make the most sense when read side-by-side with ISO/IEC
// 14496-12:2015, in particular section 8.7 ("Sample Table Boxes").

#include "isobmff.h"

#include <string.h>

#include <algorithm>
#include <limits>

#include <glog/logging.h>

#include "coding.h"
#include "string.h"

namespace reelstore {

namespace {

const int64_t kMaxMovieSize = INT64_C(1) << 30;
const size_t kMaxBoxes = 1 << 20;

bool IsContainerType(uint32_t type) {
  switch (type) {
    case FourCC("moov"):
    case FourCC("trak"):
    case FourCC("mdia"):
    case FourCC("minf"):
    case FourCC("stbl"):
    case FourCC("edts"):
    case FourCC("dinf"):
    case FourCC("mvex"):
    case FourCC("moof"):
    case FourCC("traf"):
      return true;
  }
  return false;
}

// Types a file may plausibly start with. Anything else is not treated as
// ISOBMFF at all, so it isn't worth a warning.
bool IsLeadingType(uint32_t type) {
  return type == FourCC("ftyp") || type == FourCC("moov") ||
         type == FourCC("wide");
}

// Sequential big-endian reads from a box body.
class BodyReader {
 public:
  explicit BodyReader(re2::StringPiece in) : in_(in) {}

  bool Skip(size_t n) {
    if (in_.size() < n) {
      return false;
    }
    in_.remove_prefix(n);
    return true;
  }

  bool U32(uint32_t *out) {
    if (in_.size() < 4) {
      return false;
    }
    *out = LoadU32(in_.data());
    in_.remove_prefix(4);
    return true;
  }

  bool U64(uint64_t *out) {
    if (in_.size() < 8) {
      return false;
    }
    *out = LoadU64(in_.data());
    in_.remove_prefix(8);
    return true;
  }

  size_t remaining() const { return in_.size(); }

 private:
  re2::StringPiece in_;
};

// Reads the version/flags word and the entry count of a table full box,
// checking that |entry_size| * count bytes follow.
bool ReadTableHeader(const BoxTree &tree, int i, size_t entry_size,
                     BodyReader *r, uint32_t *count,
                     std::string *error_message) {
  if (!r->Skip(4) || !r->U32(count)) {
    *error_message = StrCat(FourCCToString(tree.box(i).type), " at offset ",
                            tree.box(i).pos, " is truncated");
    return false;
  }
  if (static_cast<uint64_t>(*count) * entry_size > r->remaining()) {
    *error_message =
        StrCat(FourCCToString(tree.box(i).type), " at offset ",
               tree.box(i).pos, " claims ", *count,
               " entries but has room for ", r->remaining() / entry_size);
    return false;
  }
  return true;
}

struct SampleToChunkEntry {
  uint32_t first_chunk;
  uint32_t samples_per_chunk;
};

bool ParseSampleTable(const BoxTree &tree, int stbl, int64_t file_size,
                      MovieInfo *info, std::string *error_message) {
  const int stsz = tree.FindChild(stbl, FourCC("stsz"));
  const int stsc = tree.FindChild(stbl, FourCC("stsc"));
  const int stco = tree.FindChild(stbl, FourCC("stco"));
  const int co64 = tree.FindChild(stbl, FourCC("co64"));
  const int stss = tree.FindChild(stbl, FourCC("stss"));
  if (stsz < 0 || stsc < 0 || (stco < 0 && co64 < 0)) {
    *error_message = "video sample table lacks stsz, stsc, or stco/co64";
    return false;
  }

  // Sample sizes.
  std::vector<uint32_t> sizes;
  {
    BodyReader r(tree.Contents(stsz));
    uint32_t uniform_size;
    uint32_t count;
    if (!r.Skip(4) || !r.U32(&uniform_size) || !r.U32(&count)) {
      *error_message = "stsz is truncated";
      return false;
    }
    if (uniform_size == 0 && static_cast<uint64_t>(count) * 4 > r.remaining()) {
      *error_message = StrCat("stsz claims ", count,
                              " samples but has room for ", r.remaining() / 4);
      return false;
    }
    if (static_cast<uint64_t>(count) * uniform_size >
        static_cast<uint64_t>(file_size)) {
      *error_message = StrCat("stsz claims ", count, " samples of ",
                              uniform_size, " bytes in a file of ", file_size,
                              " bytes");
      return false;
    }
    sizes.resize(count, uniform_size);
    if (uniform_size == 0) {
      for (uint32_t i = 0; i < count; ++i) {
        r.U32(&sizes[i]);
      }
    }
  }

  // Chunk offsets.
  std::vector<int64_t> chunk_offsets;
  {
    const bool is_64 = stco < 0;
    const int box = is_64 ? co64 : stco;
    BodyReader r(tree.Contents(box));
    uint32_t count;
    if (!ReadTableHeader(tree, box, is_64 ? 8 : 4, &r, &count,
                         error_message)) {
      return false;
    }
    chunk_offsets.resize(count);
    for (uint32_t i = 0; i < count; ++i) {
      if (is_64) {
        uint64_t v;
        r.U64(&v);
        chunk_offsets[i] = static_cast<int64_t>(v);
      } else {
        uint32_t v;
        r.U32(&v);
        chunk_offsets[i] = v;
      }
    }
  }

  // Sample-to-chunk.
  std::vector<SampleToChunkEntry> stsc_entries;
  {
    BodyReader r(tree.Contents(stsc));
    uint32_t count;
    if (!ReadTableHeader(tree, stsc, 12, &r, &count, error_message)) {
      return false;
    }
    stsc_entries.resize(count);
    for (uint32_t i = 0; i < count; ++i) {
      auto &e = stsc_entries[i];
      r.U32(&e.first_chunk);
      r.U32(&e.samples_per_chunk);
      r.Skip(4);  // sample_description_index
      uint32_t min_first = i == 0 ? 1 : stsc_entries[i - 1].first_chunk + 1;
      if ((i == 0 && e.first_chunk != 1) || e.first_chunk < min_first) {
        *error_message = StrCat("stsc entry ", i, " has bad first_chunk ",
                                e.first_chunk);
        return false;
      }
    }
  }

  // Byte offset of sample N = its chunk's offset plus the sizes of the
  // preceding samples in the same chunk.
  std::vector<int64_t> sample_offsets(sizes.size());
  size_t sample = 0;
  for (size_t i = 0; i < stsc_entries.size(); ++i) {
    uint32_t end_chunk = i + 1 < stsc_entries.size()
                             ? stsc_entries[i + 1].first_chunk
                             : static_cast<uint32_t>(chunk_offsets.size() + 1);
    for (uint32_t c = stsc_entries[i].first_chunk; c < end_chunk; ++c) {
      if (c > chunk_offsets.size()) {
        *error_message = StrCat("stsc references chunk ", c, " of ",
                                chunk_offsets.size());
        return false;
      }
      int64_t pos = chunk_offsets[c - 1];
      for (uint32_t s = 0; s < stsc_entries[i].samples_per_chunk; ++s) {
        if (sample >= sizes.size()) {
          *error_message = StrCat("stsc describes more than the ", sizes.size(),
                                  " samples in stsz");
          return false;
        }
        if (pos < 0 || pos > file_size - sizes[sample]) {
          *error_message = StrCat("sample ", sample + 1, " at offset ", pos,
                                  " with size ", sizes[sample],
                                  " is outside the file");
          return false;
        }
        sample_offsets[sample] = pos;
        pos += sizes[sample];
        ++sample;
      }
    }
  }
  if (sample != sizes.size()) {
    *error_message = StrCat("stsc describes ", sample, " samples; stsz has ",
                            sizes.size());
    return false;
  }

  info->has_video = true;
  info->frame_count = sizes.size();
  info->keyframes.clear();
  if (stss < 0) {
    info->all_frames_are_keyframes = true;
    for (size_t i = 0; i < sizes.size(); ++i) {
      info->keyframes.emplace_back(sample_offsets[i], sizes[i], i + 1);
    }
  } else {
    info->all_frames_are_keyframes = false;
    BodyReader r(tree.Contents(stss));
    uint32_t count;
    if (!ReadTableHeader(tree, stss, 4, &r, &count, error_message)) {
      return false;
    }
    for (uint32_t i = 0; i < count; ++i) {
      uint32_t n;
      r.U32(&n);
      if (n == 0 || n > sizes.size()) {
        *error_message = StrCat("stss entry ", i, " names sample ", n, " of ",
                                sizes.size());
        return false;
      }
      info->keyframes.emplace_back(sample_offsets[n - 1], sizes[n - 1], n);
    }
  }
  std::sort(info->keyframes.begin(), info->keyframes.end(),
            [](const KeyframeInfo &a, const KeyframeInfo &b) {
              return a.byte_offset < b.byte_offset;
            });
  VLOG(1) << "video track: " << info->frame_count << " frames, "
          << info->keyframes.size() << " keyframes";
  return true;
}

// Applies |delta| to every chunk offset table in |moov|, writing only if
// |write| is true.
bool VisitChunkOffsets(int64_t delta, bool write, const BoxTree &tree,
                       std::string *moov, std::string *error_message) {
  for (size_t i = 0; i < tree.boxes().size(); ++i) {
    const Box &box = tree.box(i);
    const bool is_64 = box.type == FourCC("co64");
    if (box.type != FourCC("stco") && !is_64) {
      continue;
    }
    BodyReader r(tree.Contents(i));
    uint32_t count;
    if (!ReadTableHeader(tree, i, is_64 ? 8 : 4, &r, &count, error_message)) {
      return false;
    }
    char *entries = &(*moov)[box.data_pos() + 8];
    for (uint32_t j = 0; j < count; ++j) {
      int64_t old_value =
          is_64 ? static_cast<int64_t>(LoadU64(entries + 8 * j))
                : static_cast<int64_t>(LoadU32(entries + 4 * j));
      int64_t new_value = old_value + delta;
      if (new_value < 0) {
        *error_message =
            StrCat(FourCCToString(box.type), " entry ", j, " offset ",
                   old_value, " would become negative (", new_value, ")");
        return false;
      }
      if (!is_64 && new_value > std::numeric_limits<uint32_t>::max()) {
        *error_message = StrCat("stco entry ", j, " offset ", new_value,
                                " overflows 32 bits");
        return false;
      }
      if (write) {
        if (is_64) {
          StoreU64(static_cast<uint64_t>(new_value), entries + 8 * j);
        } else {
          StoreU32(static_cast<uint32_t>(new_value), entries + 4 * j);
        }
      }
    }
  }
  return true;
}

enum class ScanResult { kOk, kParseError, kIoError };

ScanResult ScanContainer(File *file, int64_t file_size, StructureMap *map,
                         std::string *error_message) {
  std::vector<Box> top;
  int64_t pos = 0;
  while (pos < file_size) {
    std::string header;
    size_t want = std::min(file_size - pos, INT64_C(16));
    int ret = PreadFully(file, pos, want, &header);
    if (ret != 0) {
      *error_message =
          StrCat("reading box header at offset ", pos, ": ", strerror(ret));
      return ScanResult::kIoError;
    }
    Box box;
    if (!ParseBoxHeader(header, pos, file_size, &box, error_message)) {
      return ScanResult::kParseError;
    }
    VLOG(2) << FourCCToString(box.type) << " at " << box.pos << " size "
            << box.size;
    top.push_back(box);
    if (top.size() > kMaxBoxes) {
      *error_message = StrCat("more than ", kMaxBoxes, " top-level boxes");
      return ScanResult::kParseError;
    }
    pos = box.end();
  }

  int num_mdat = 0;
  int num_moov = 0;
  bool fragmented = false;
  const Box *moov = nullptr;
  const Box *mdat = nullptr;
  for (const auto &box : top) {
    if (box.type == FourCC("mdat")) {
      ++num_mdat;
      mdat = &box;
    } else if (box.type == FourCC("moov")) {
      ++num_moov;
      moov = &box;
    } else if (box.type == FourCC("moof")) {
      fragmented = true;
    }
  }
  if (num_moov > 1) {
    *error_message = StrCat("file has ", num_moov, " moov boxes");
    return ScanResult::kParseError;
  }

  if (moov != nullptr) {
    if (moov->size > kMaxMovieSize) {
      *error_message = StrCat("moov of ", moov->size, " bytes is too large");
      return ScanResult::kParseError;
    }
    int ret = PreadFully(file, moov->pos, moov->size, &map->moov);
    if (ret != 0) {
      *error_message = StrCat("reading moov at offset ", moov->pos, ": ",
                              strerror(ret));
      return ScanResult::kIoError;
    }
    map->moov_pos = moov->pos;
    if (!ParseMovie(map->moov, moov->pos, file_size, &map->movie,
                    error_message)) {
      return ScanResult::kParseError;
    }
  }

  for (const auto &box : top) {
    if (box.type == FourCC("mdat")) {
      map->regions.emplace_back(ByteRange(box.pos, box.data_pos()),
                                RegionKind::kMetadata, box.type);
      if (box.data_pos() < box.end()) {
        map->regions.emplace_back(ByteRange(box.data_pos(), box.end()),
                                  RegionKind::kPayload, box.type);
      }
    } else {
      map->regions.emplace_back(ByteRange(box.pos, box.end()),
                                RegionKind::kMetadata, box.type);
    }
  }
  if (num_mdat == 1 && !fragmented) {
    map->single_payload_pos = mdat->data_pos();
  }
  map->is_container = true;
  return ScanResult::kOk;
}

void MakePassthrough(int64_t file_size, StructureMap *map) {
  *map = StructureMap();
  if (file_size > 0) {
    map->regions.emplace_back(ByteRange(0, file_size), RegionKind::kPayload, 0);
  }
}

}  // namespace

std::string FourCCToString(uint32_t type) {
  std::string out(4, '.');
  for (int i = 0; i < 4; ++i) {
    char c = static_cast<char>(type >> (24 - 8 * i));
    if (c >= 0x20 && c < 0x7f) {
      out[i] = c;
    }
  }
  return out;
}

bool ParseBoxHeader(re2::StringPiece in, int64_t pos, int64_t limit, Box *box,
                    std::string *error_message) {
  if (in.size() < 8) {
    *error_message = StrCat("box header at offset ", pos, " is truncated");
    return false;
  }
  uint32_t size32 = LoadU32(in.data());
  box->type = LoadU32(in.data() + 4);
  box->pos = pos;
  box->header_size = 8;
  if (size32 == 1) {
    if (in.size() < 16) {
      *error_message = StrCat("extended box header at offset ", pos,
                              " is truncated");
      return false;
    }
    uint64_t size64 = LoadU64(in.data() + 8);
    if (size64 > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      *error_message = StrCat(FourCCToString(box->type), " at offset ", pos,
                              " has absurd size ", size64);
      return false;
    }
    box->size = static_cast<int64_t>(size64);
    box->header_size = 16;
  } else if (size32 == 0) {
    box->size = limit - pos;
  } else {
    box->size = size32;
  }
  if (box->size < box->header_size) {
    *error_message =
        StrCat(FourCCToString(box->type), " at offset ", pos, " has size ",
               box->size, ", smaller than its header");
    return false;
  }
  if (box->size > limit - pos) {
    *error_message =
        StrCat(FourCCToString(box->type), " at offset ", pos, " with size ",
               box->size, " extends past end at ", limit);
    return false;
  }
  return true;
}

bool BoxTree::Parse(re2::StringPiece data, int64_t base,
                    std::string *error_message) {
  boxes_.clear();
  data_ = data;
  base_ = base;

  // Breadth-first: each container's children are appended contiguously once
  // the container itself has been reached.
  auto parse_children = [this, error_message](int parent, int64_t begin,
                                              int64_t end) -> bool {
    int64_t pos = begin;
    while (end - pos >= 8) {
      Box box;
      if (!ParseBoxHeader(data_.substr(pos - base_, 16), pos, end, &box,
                          error_message)) {
        return false;
      }
      box.parent = parent;
      boxes_.push_back(box);
      if (boxes_.size() > kMaxBoxes) {
        *error_message = StrCat("more than ", kMaxBoxes, " boxes");
        return false;
      }
      pos = box.end();
    }
    if (pos != end) {
      VLOG(2) << "ignoring " << (end - pos) << " trailing bytes at " << pos;
    }
    return true;
  };

  if (!parse_children(-1, base, base + data.size())) {
    return false;
  }
  num_roots_ = boxes_.size();
  for (size_t i = 0; i < boxes_.size(); ++i) {
    if (!IsContainerType(boxes_[i].type)) {
      continue;
    }
    int begin = boxes_.size();
    if (!parse_children(i, boxes_[i].data_pos(), boxes_[i].end())) {
      return false;
    }
    boxes_[i].children_begin = begin;
    boxes_[i].children_end = boxes_.size();
  }
  return true;
}

int BoxTree::FindChild(int parent, uint32_t type) const {
  int begin = parent < 0 ? 0 : boxes_[parent].children_begin;
  int end = parent < 0 ? num_roots_ : boxes_[parent].children_end;
  for (int i = begin; i < end; ++i) {
    if (boxes_[i].type == type) {
      return i;
    }
  }
  return -1;
}

std::vector<int> BoxTree::FindChildren(int parent, uint32_t type) const {
  int begin = parent < 0 ? 0 : boxes_[parent].children_begin;
  int end = parent < 0 ? num_roots_ : boxes_[parent].children_end;
  std::vector<int> out;
  for (int i = begin; i < end; ++i) {
    if (boxes_[i].type == type) {
      out.push_back(i);
    }
  }
  return out;
}

re2::StringPiece BoxTree::Contents(int i) const {
  const Box &box = boxes_[i];
  return data_.substr(box.data_pos() - base_, box.size - box.header_size);
}

bool ParseMovie(re2::StringPiece moov, int64_t moov_pos, int64_t file_size,
                MovieInfo *info, std::string *error_message) {
  *info = MovieInfo();
  BoxTree tree;
  if (!tree.Parse(moov, moov_pos, error_message)) {
    return false;
  }
  int moov_box = tree.FindChild(-1, FourCC("moov"));
  if (moov_box < 0 || tree.num_roots() != 1) {
    *error_message = "expected a single moov box";
    return false;
  }
  for (int trak : tree.FindChildren(moov_box, FourCC("trak"))) {
    int mdia = tree.FindChild(trak, FourCC("mdia"));
    int hdlr = mdia < 0 ? -1 : tree.FindChild(mdia, FourCC("hdlr"));
    if (hdlr < 0) {
      continue;
    }
    BodyReader r(tree.Contents(hdlr));
    uint32_t handler_type;
    if (!r.Skip(8) || !r.U32(&handler_type)) {
      *error_message = StrCat("hdlr at offset ", tree.box(hdlr).pos,
                              " is truncated");
      return false;
    }
    if (handler_type != FourCC("vide")) {
      continue;
    }
    int minf = tree.FindChild(mdia, FourCC("minf"));
    int stbl = minf < 0 ? -1 : tree.FindChild(minf, FourCC("stbl"));
    if (stbl < 0) {
      *error_message = "video track has no sample table";
      return false;
    }
    return ParseSampleTable(tree, stbl, file_size, info, error_message);
  }
  VLOG(1) << "no video track";
  return true;
}

bool RebaseChunkOffsets(int64_t delta, std::string *moov,
                        std::string *error_message) {
  BoxTree tree;
  if (!tree.Parse(*moov, 0, error_message)) {
    return false;
  }

  // Check every entry before changing any.
  return VisitChunkOffsets(delta, false, tree, moov, error_message) &&
         VisitChunkOffsets(delta, true, tree, moov, error_message);
}

std::vector<ByteRange> StructureMap::metadata_regions() const {
  std::vector<ByteRange> out;
  for (const auto &r : regions) {
    if (r.kind == RegionKind::kMetadata) {
      out.push_back(r.range);
    }
  }
  return out;
}

std::vector<ByteRange> StructureMap::payload_regions() const {
  std::vector<ByteRange> out;
  for (const auto &r : regions) {
    if (r.kind == RegionKind::kPayload) {
      out.push_back(r.range);
    }
  }
  return out;
}

bool ExtractStructure(File *file, int64_t file_size, re2::StringPiece name,
                      StructureMap *map, std::string *error_message) {
  MakePassthrough(file_size, map);
  if (file_size < 8) {
    return true;
  }
  std::string first;
  int ret = PreadFully(file, 0, 8, &first);
  if (ret != 0) {
    *error_message = StrCat("reading ", name, ": ", strerror(ret));
    return false;
  }
  if (!IsLeadingType(LoadU32(first.data() + 4))) {
    VLOG(1) << name << ": not ISOBMFF";
    return true;
  }

  StructureMap container;
  std::string scan_error;
  switch (ScanContainer(file, file_size, &container, &scan_error)) {
    case ScanResult::kOk:
      *map = std::move(container);
      VLOG(1) << name << ": " << map->regions.size() << " regions, "
              << map->movie.keyframes.size() << " keyframes";
      return true;
    case ScanResult::kIoError:
      *error_message = StrCat(name, ": ", scan_error);
      return false;
    case ScanResult::kParseError:
      LOG(WARNING) << name << ": unable to parse as ISOBMFF (" << scan_error
                   << "); storing as a single payload region";
      return true;
  }
  return true;
}

std::string EncodeMdatHeader(int64_t payload_size) {
  std::string out;
  if (payload_size + 8 <= std::numeric_limits<uint32_t>::max()) {
    AppendU32(static_cast<uint32_t>(payload_size + 8), &out);
    out.append("mdat");
  } else {
    AppendU32(1, &out);
    out.append("mdat");
    AppendU64(static_cast<uint64_t>(payload_size + 16), &out);
  }
  return out;
}

}  // namespace reelstore
