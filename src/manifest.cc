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
// manifest.cc: implementation of manifest.h interface.

#include "manifest.h"

#include <string.h>

#include <algorithm>
#include <set>

#include <glog/logging.h>

#include "coding.h"
#include "string.h"

namespace reelstore {

namespace {

const uint64_t kEntryVersion = 1;

// Flags in the serialized entry.
const uint64_t kEntryOffsetsNormalized = 1;

const int64_t kMaxReadSize = 16 << 20;

bool DecodeAddress(re2::StringPiece *in, ContentAddress *address,
                   std::string *error_message) {
  if (in->size() < ContentAddress::kSize) {
    *error_message = "truncated content address";
    return false;
  }
  if (!ContentAddress::FromBytes(in->substr(0, ContentAddress::kSize),
                                 address)) {
    *error_message = "malformed content address";
    return false;
  }
  in->remove_prefix(ContentAddress::kSize);
  return true;
}

// Decodes a varint no larger than |max|.
bool DecodeBounded(re2::StringPiece *in, uint64_t max, const char *what,
                   uint64_t *out, std::string *error_message) {
  if (!DecodeVar64(in, out, error_message)) {
    *error_message = StrCat(what, ": ", *error_message);
    return false;
  }
  if (*out > max) {
    *error_message = StrCat(what, " ", *out, " exceeds limit ", max);
    return false;
  }
  return true;
}

const uint64_t kMaxInt64 = static_cast<uint64_t>(INT64_MAX);

// Sets the chunk ranges of every region. Returns false if a region is empty
// or doesn't begin and end on a chunk boundary.
bool AssignRegionChunks(ManifestEntry *entry, std::string *error_message) {
  size_t c = 0;
  for (ManifestRegion &region : entry->regions) {
    if (region.range.size() <= 0) {
      *error_message = StrCat("region ", region.range.DebugString(), " (",
                              FourCCToString(region.box_type), ") is empty");
      return false;
    }
    if (c >= entry->chunks.size() ||
        entry->chunks[c].offset != region.range.begin) {
      *error_message = StrCat("region ", region.range.DebugString(), " (",
                              FourCCToString(region.box_type),
                              ") doesn't start on a chunk boundary");
      return false;
    }
    region.first_chunk = c;
    while (c < entry->chunks.size() &&
           entry->chunks[c].offset < region.range.end) {
      ++c;
    }
    if (c == region.first_chunk) {
      *error_message = StrCat("region ", region.range.DebugString(), " (",
                              FourCCToString(region.box_type),
                              ") covers no chunks");
      return false;
    }
    const ChunkRef &last = entry->chunks[c - 1];
    if (last.offset + last.length != region.range.end) {
      *error_message = StrCat("region ", region.range.DebugString(), " (",
                              FourCCToString(region.box_type),
                              ") doesn't end on a chunk boundary");
      return false;
    }
    region.end_chunk = c;
  }
  if (c != entry->chunks.size()) {
    *error_message = "regions don't cover every chunk";
    return false;
  }
  return true;
}

// Checks that the chunks are contiguous from 0 and total |entry->size|.
bool CheckChunks(const ManifestEntry &entry, std::string *error_message) {
  int64_t pos = 0;
  for (size_t i = 0; i < entry.chunks.size(); ++i) {
    const ChunkRef &c = entry.chunks[i];
    if (c.offset != pos || c.length <= 0) {
      *error_message = StrCat("chunk ", i, " at offset ", c.offset,
                              " length ", c.length, " doesn't follow ", pos);
      return false;
    }
    if ((c.flags & ~ChunkRef::kAllFlags) != 0) {
      *error_message = StrCat("chunk ", i, " has unknown flags ", c.flags);
      return false;
    }
    pos += c.length;
  }
  if (pos != entry.size) {
    *error_message =
        StrCat("chunks total ", pos, " bytes; file is ", entry.size);
    return false;
  }
  return true;
}

}  // namespace

constexpr uint32_t ChunkRef::kAllFlags;
constexpr uint32_t ManifestRecord::kVersion;

bool BuildManifestEntry(const std::string &path, const FileMetadata &metadata,
                        const ContentAddress &full_content_hash,
                        std::vector<ChunkRef> chunks, const StructureMap &map,
                        bool offsets_normalized, ManifestEntry *entry,
                        std::string *error_message) {
  ManifestEntry out;
  out.path = path;
  out.full_content_hash = full_content_hash;
  out.file_metadata = metadata;
  out.chunks = std::move(chunks);
  for (const auto &c : out.chunks) {
    out.size += c.length;
  }
  if (!CheckChunks(out, error_message)) {
    return false;
  }
  if (map.is_container) {
    for (const Region &r : map.regions) {
      out.regions.emplace_back(r.range, r.kind, r.box_type);
    }
    if (!AssignRegionChunks(&out, error_message)) {
      return false;
    }
    out.payload_pos = map.single_payload_pos;
    out.offsets_normalized = offsets_normalized;
    if (map.movie.has_video) {
      out.asset_metadata["video_frames"] = StrCat(map.movie.frame_count);
      out.asset_metadata["video_keyframes"] =
          StrCat(map.movie.keyframes.size());
    }
  }
  if (offsets_normalized && out.payload_pos < 0) {
    *error_message = "normalized offsets need a single mdat payload";
    return false;
  }
  *entry = std::move(out);
  return true;
}

int FindChunkForOffset(const ManifestEntry &entry, int64_t offset) {
  if (offset < 0 || offset >= entry.size) {
    return -1;
  }
  auto it = std::upper_bound(
      entry.chunks.begin(), entry.chunks.end(), offset,
      [](int64_t off, const ChunkRef &c) { return off < c.offset + c.length; });
  return it == entry.chunks.end() ? -1
                                  : static_cast<int>(it - entry.chunks.begin());
}

void EncodeManifestEntry(const ManifestEntry &entry, std::string *out) {
  AppendVar64(kEntryVersion, out);
  AppendLengthPrefixed(entry.path, out);
  AppendVar64(entry.size, out);
  out->append(entry.full_content_hash.as_piece().data(),
              ContentAddress::kSize);
  AppendVar64(entry.file_metadata.mode, out);
  AppendVar64(entry.file_metadata.mtime_sec, out);
  AppendVar64(entry.offsets_normalized ? kEntryOffsetsNormalized : 0, out);
  AppendVar64(entry.payload_pos + 1, out);
  AppendVar64(entry.chunks.size(), out);
  for (const ChunkRef &c : entry.chunks) {
    out->append(c.address.as_piece().data(), ContentAddress::kSize);
    AppendVar64(c.length, out);
    AppendVar64(c.flags, out);
  }
  AppendVar64(entry.regions.size(), out);
  for (const ManifestRegion &r : entry.regions) {
    AppendVar64(static_cast<uint64_t>(r.kind), out);
    AppendVar64(r.box_type, out);
    AppendVar64(r.range.size(), out);
  }
  AppendVar64(entry.asset_metadata.size(), out);
  for (const auto &kv : entry.asset_metadata) {
    AppendLengthPrefixed(kv.first, out);
    AppendLengthPrefixed(kv.second, out);
  }
}

bool DecodeManifestEntry(re2::StringPiece in, ManifestEntry *entry,
                         std::string *error_message) {
  ManifestEntry out;
  uint64_t version;
  if (!DecodeVar64(&in, &version, error_message)) {
    *error_message = StrCat("manifest entry version: ", *error_message);
    return false;
  }
  if (version != kEntryVersion) {
    *error_message = StrCat("unsupported manifest entry version ", version);
    return false;
  }
  re2::StringPiece path;
  if (!DecodeLengthPrefixed(&in, &path, error_message)) {
    *error_message = StrCat("path: ", *error_message);
    return false;
  }
  out.path = path.as_string();

  uint64_t size, mode, mtime, flags, payload_pos_plus_one, num_chunks;
  if (!DecodeBounded(&in, kMaxInt64, "size", &size, error_message) ||
      !DecodeAddress(&in, &out.full_content_hash, error_message) ||
      !DecodeBounded(&in, UINT32_MAX, "mode", &mode, error_message) ||
      !DecodeBounded(&in, kMaxInt64, "mtime", &mtime, error_message) ||
      !DecodeBounded(&in, kEntryOffsetsNormalized, "flags", &flags,
                     error_message) ||
      !DecodeBounded(&in, size + 1, "payload position", &payload_pos_plus_one,
                     error_message) ||
      !DecodeBounded(&in, size, "chunk count", &num_chunks, error_message)) {
    return false;
  }
  out.size = static_cast<int64_t>(size);
  out.file_metadata.mode = static_cast<uint32_t>(mode);
  out.file_metadata.mtime_sec = static_cast<int64_t>(mtime);
  out.offsets_normalized = (flags & kEntryOffsetsNormalized) != 0;
  out.payload_pos = static_cast<int64_t>(payload_pos_plus_one) - 1;

  int64_t pos = 0;
  out.chunks.reserve(num_chunks);
  for (uint64_t i = 0; i < num_chunks; ++i) {
    ChunkRef c;
    uint64_t length, chunk_flags;
    if (!DecodeAddress(&in, &c.address, error_message) ||
        !DecodeBounded(&in, size, "chunk length", &length, error_message) ||
        !DecodeBounded(&in, ChunkRef::kAllFlags, "chunk flags", &chunk_flags,
                       error_message)) {
      *error_message = StrCat("chunk ", i, ": ", *error_message);
      return false;
    }
    c.offset = pos;
    c.length = static_cast<int64_t>(length);
    c.flags = static_cast<uint32_t>(chunk_flags);
    pos += c.length;
    if (pos > out.size) {
      *error_message = StrCat("chunk ", i, " ends at ", pos,
                              ", past the end of the ", out.size,
                              "-byte file");
      return false;
    }
    out.chunks.push_back(c);
  }
  if (!CheckChunks(out, error_message)) {
    return false;
  }

  uint64_t num_regions;
  if (!DecodeBounded(&in, num_chunks, "region count", &num_regions,
                     error_message)) {
    return false;
  }
  pos = 0;
  for (uint64_t i = 0; i < num_regions; ++i) {
    uint64_t kind, box_type, region_size;
    if (!DecodeBounded(&in, static_cast<uint64_t>(RegionKind::kPayload),
                       "region kind", &kind, error_message) ||
        !DecodeBounded(&in, UINT32_MAX, "box type", &box_type,
                       error_message) ||
        !DecodeBounded(&in, size, "region size", &region_size,
                       error_message)) {
      *error_message = StrCat("region ", i, ": ", *error_message);
      return false;
    }
    if (region_size == 0) {
      *error_message = StrCat("region ", i, " is empty");
      return false;
    }
    out.regions.emplace_back(
        ByteRange(pos, pos + static_cast<int64_t>(region_size)),
        static_cast<RegionKind>(kind), static_cast<uint32_t>(box_type));
    pos += region_size;
    if (pos > out.size) {
      *error_message = StrCat("region ", i, " extends past end of file");
      return false;
    }
  }
  if (!out.regions.empty() && !AssignRegionChunks(&out, error_message)) {
    return false;
  }
  if (out.offsets_normalized && (out.regions.empty() || out.payload_pos < 0)) {
    *error_message = "normalized offsets need a container with one mdat";
    return false;
  }

  uint64_t num_metadata;
  if (!DecodeBounded(&in, in.size(), "asset metadata count", &num_metadata,
                     error_message)) {
    return false;
  }
  for (uint64_t i = 0; i < num_metadata; ++i) {
    re2::StringPiece key, value;
    if (!DecodeLengthPrefixed(&in, &key, error_message) ||
        !DecodeLengthPrefixed(&in, &value, error_message)) {
      *error_message = StrCat("asset metadata ", i, ": ", *error_message);
      return false;
    }
    out.asset_metadata[key.as_string()] = value.as_string();
  }
  if (!in.empty()) {
    *error_message = StrCat(in.size(), " bytes of trailing garbage");
    return false;
  }
  *entry = std::move(out);
  return true;
}

void ComputeManifestStats(ManifestRecord *record) {
  ManifestStats stats;
  std::set<ContentAddress> unique;
  for (const ManifestEntry &e : record->entries) {
    ++stats.files;
    stats.bytes += e.size;
    stats.chunk_refs += e.chunks.size();
    for (const ChunkRef &c : e.chunks) {
      unique.insert(c.address);
    }
  }
  stats.unique_chunks = unique.size();
  record->stats = stats;
}

void EncodeManifestRecord(const ManifestRecord &record, std::string *out) {
  AppendVar64(ManifestRecord::kVersion, out);
  AppendLengthPrefixed(record.repository_id.binary_view(), out);
  out->append(record.commit.as_piece().data(), ContentAddress::kSize);
  AppendVar64(record.has_parent ? 1 : 0, out);
  if (record.has_parent) {
    out->append(record.parent.as_piece().data(), ContentAddress::kSize);
  }
  AppendVar64(record.entries.size(), out);
  std::string encoded;
  for (const ManifestEntry &e : record.entries) {
    encoded.clear();
    EncodeManifestEntry(e, &encoded);
    AppendLengthPrefixed(encoded, out);
  }
  AppendVar64(record.stats.files, out);
  AppendVar64(record.stats.bytes, out);
  AppendVar64(record.stats.chunk_refs, out);
  AppendVar64(record.stats.unique_chunks, out);
  AppendLengthPrefixed(record.signature, out);
}

bool DecodeManifestRecord(re2::StringPiece in, ManifestRecord *record,
                          std::string *error_message) {
  ManifestRecord out;
  uint64_t version;
  if (!DecodeVar64(&in, &version, error_message)) {
    *error_message = StrCat("manifest record version: ", *error_message);
    return false;
  }
  if (version != ManifestRecord::kVersion) {
    *error_message = StrCat("unsupported manifest record version ", version);
    return false;
  }
  re2::StringPiece repository_id;
  if (!DecodeLengthPrefixed(&in, &repository_id, error_message)) {
    *error_message = StrCat("repository id: ", *error_message);
    return false;
  }
  if (!out.repository_id.ParseBinary(repository_id)) {
    *error_message = "malformed repository id";
    return false;
  }
  uint64_t has_parent, num_entries;
  if (!DecodeAddress(&in, &out.commit, error_message) ||
      !DecodeBounded(&in, 1, "parent flag", &has_parent, error_message)) {
    return false;
  }
  out.has_parent = has_parent != 0;
  if (out.has_parent && !DecodeAddress(&in, &out.parent, error_message)) {
    return false;
  }
  if (!DecodeBounded(&in, in.size(), "entry count", &num_entries,
                     error_message)) {
    return false;
  }
  for (uint64_t i = 0; i < num_entries; ++i) {
    re2::StringPiece encoded;
    ManifestEntry entry;
    if (!DecodeLengthPrefixed(&in, &encoded, error_message) ||
        !DecodeManifestEntry(encoded, &entry, error_message)) {
      *error_message = StrCat("entry ", i, ": ", *error_message);
      return false;
    }
    if (!out.entries.empty() && !(out.entries.back().path < entry.path)) {
      *error_message = StrCat("entry ", i, " path \"", entry.path,
                              "\" is out of order");
      return false;
    }
    out.entries.push_back(std::move(entry));
  }
  uint64_t files, bytes, chunk_refs, unique_chunks;
  if (!DecodeBounded(&in, kMaxInt64, "file count", &files, error_message) ||
      !DecodeBounded(&in, kMaxInt64, "byte count", &bytes, error_message) ||
      !DecodeBounded(&in, kMaxInt64, "chunk ref count", &chunk_refs,
                     error_message) ||
      !DecodeBounded(&in, kMaxInt64, "unique chunk count", &unique_chunks,
                     error_message)) {
    return false;
  }
  ComputeManifestStats(&out);
  if (out.stats.files != static_cast<int64_t>(files) ||
      out.stats.bytes != static_cast<int64_t>(bytes) ||
      out.stats.chunk_refs != static_cast<int64_t>(chunk_refs) ||
      out.stats.unique_chunks != static_cast<int64_t>(unique_chunks)) {
    *error_message = "aggregate stats don't match entries";
    return false;
  }
  re2::StringPiece signature;
  if (!DecodeLengthPrefixed(&in, &signature, error_message)) {
    *error_message = StrCat("signature: ", *error_message);
    return false;
  }
  out.signature = signature.as_string();
  if (!in.empty()) {
    *error_message = StrCat(in.size(), " bytes of trailing garbage");
    return false;
  }
  *record = std::move(out);
  return true;
}

ContentAddress ComputeCommitHash(const Hasher &hasher,
                                 const ManifestRecord &record) {
  ManifestRecord unsigned_record = record;
  unsigned_record.commit = ContentAddress();
  unsigned_record.signature.clear();
  std::string encoded;
  EncodeManifestRecord(unsigned_record, &encoded);
  return hasher.Hash(encoded);
}

ErrorKind VirtualFile::Open(ChunkStore *store, const ManifestEntry *entry,
                            Layout layout,
                            std::unique_ptr<VirtualFile> *file,
                            std::string *error_message) {
  std::unique_ptr<VirtualFile> f(new VirtualFile(store, entry, layout));
  if (layout == Layout::kFastStart &&
      !(entry->is_container() && entry->offsets_normalized)) {
    *error_message = StrCat(entry->path,
                            ": fast-start layout needs a container with "
                            "normalized chunk offsets");
    return ErrorKind::kInvariantViolation;
  }
  if (!entry->offsets_normalized) {
    f->AppendChunks(0, entry->chunks.size());
    *file = std::move(f);
    return ErrorKind::kOk;
  }

  const ManifestRegion *moov = nullptr;
  const ManifestRegion *mdat_header = nullptr;
  const ManifestRegion *payload = nullptr;
  for (const ManifestRegion &r : entry->regions) {
    if (r.box_type == FourCC("moov")) {
      moov = &r;
    } else if (r.box_type == FourCC("mdat")) {
      if (r.kind == RegionKind::kMetadata) {
        mdat_header = &r;
      } else {
        payload = &r;
      }
    }
  }
  if (moov == nullptr || mdat_header == nullptr) {
    *error_message = StrCat(entry->path, ": normalized manifest lacks ",
                            moov == nullptr ? "moov" : "mdat");
    return ErrorKind::kInvariantViolation;
  }
  std::string moov_data;
  ErrorKind kind = f->FetchRegion(*moov, &moov_data, error_message);
  if (kind != ErrorKind::kOk) {
    return kind;
  }
  const int64_t payload_size = payload == nullptr ? 0 : payload->range.size();

  if (layout == Layout::kOriginal) {
    if (!RebaseChunkOffsets(entry->payload_pos, &moov_data, error_message)) {
      *error_message = StrCat(entry->path, ": ", *error_message);
      return ErrorKind::kCorruption;
    }
    for (const ManifestRegion &r : entry->regions) {
      if (&r == moov) {
        f->AppendOwned(std::move(moov_data));
      } else {
        f->AppendChunks(r.first_chunk, r.end_chunk);
      }
    }
    *file = std::move(f);
    return ErrorKind::kOk;
  }

  // Fast start: ftyp, moov, other metadata, mdat.
  std::vector<const ManifestRegion *> others;
  int64_t pos = moov->range.size();
  for (const ManifestRegion &r : entry->regions) {
    if (&r == moov || r.box_type == FourCC("mdat")) {
      continue;
    }
    others.push_back(&r);
    pos += r.range.size();
  }
  std::stable_partition(others.begin(), others.end(),
                        [](const ManifestRegion *r) {
                          return r->box_type == FourCC("ftyp");
                        });
  std::string header = EncodeMdatHeader(payload_size);
  const int64_t new_payload_pos = pos + header.size();
  if (!RebaseChunkOffsets(new_payload_pos, &moov_data, error_message)) {
    *error_message = StrCat(entry->path, ": fast-start layout: ",
                            *error_message);
    return ErrorKind::kInvariantViolation;
  }
  bool moov_added = false;
  for (const ManifestRegion *r : others) {
    if (!moov_added && r->box_type != FourCC("ftyp")) {
      f->AppendOwned(std::move(moov_data));
      moov_added = true;
    }
    f->AppendChunks(r->first_chunk, r->end_chunk);
  }
  if (!moov_added) {
    f->AppendOwned(std::move(moov_data));
  }
  f->AppendOwned(std::move(header));
  if (payload != nullptr) {
    f->AppendChunks(payload->first_chunk, payload->end_chunk);
  }
  CHECK_EQ(new_payload_pos + payload_size, f->size());
  *file = std::move(f);
  return ErrorKind::kOk;
}

void VirtualFile::AppendChunks(size_t first, size_t end) {
  for (size_t i = first; i < end; ++i) {
    const ChunkRef *ref = &entry_->chunks[i];
    FillerFileSlice *slice = new FillerFileSlice;
    owned_slices_.emplace_back(slice);
    slice->Init(ref->length,
                [this, ref](std::string *data,
                            std::string *error_message) -> bool {
                  ErrorKind kind = FetchChunk(*ref, data, error_message);
                  if (kind != ErrorKind::kOk) {
                    fetch_error_ = kind;
                    return false;
                  }
                  return true;
                });
    slices_.Append(slice, FileSlices::kLazy);
  }
}

void VirtualFile::AppendOwned(std::string data) {
  std::string *owned = new std::string(std::move(data));
  owned_data_.emplace_back(owned);
  StringPieceSlice *slice = new StringPieceSlice(*owned);
  owned_slices_.emplace_back(slice);
  slices_.Append(slice);
}

ErrorKind VirtualFile::FetchChunk(const ChunkRef &ref, std::string *data,
                                  std::string *error_message) {
  ErrorKind kind = store_->Get(ref.address, data, error_message);
  if (kind == ErrorKind::kNotFound) {
    *error_message = StrCat(entry_->path, ": manifest references absent chunk ",
                            ref.address.ToHex(), " at offset ", ref.offset);
    return ErrorKind::kInvariantViolation;
  }
  if (kind == ErrorKind::kOk &&
      static_cast<int64_t>(data->size()) != ref.length) {
    *error_message = StrCat(entry_->path, ": chunk ", ref.address.ToHex(),
                            " is ", data->size(), " bytes; manifest expects ",
                            ref.length);
    return ErrorKind::kInvariantViolation;
  }
  return kind;
}

ErrorKind VirtualFile::FetchRegion(const ManifestRegion &region,
                                   std::string *out,
                                   std::string *error_message) {
  out->clear();
  std::string data;
  for (size_t i = region.first_chunk; i < region.end_chunk; ++i) {
    ErrorKind kind = FetchChunk(entry_->chunks[i], &data, error_message);
    if (kind != ErrorKind::kOk) {
      return kind;
    }
    out->append(data);
  }
  return ErrorKind::kOk;
}

ErrorKind VirtualFile::ReadAt(int64_t offset, int64_t length,
                              std::string *out, std::string *error_message) {
  if (offset < 0 || length < 0) {
    *error_message = StrCat("invalid read of ", length, " bytes at ", offset);
    return ErrorKind::kInvariantViolation;
  }
  const int64_t begin = std::min(offset, size());
  ByteRange range(begin, begin + std::min(length, size() - begin));
  fetch_error_ = ErrorKind::kOk;
  if (!ReadSliceRange(slices_, range, out, error_message)) {
    return fetch_error_ == ErrorKind::kOk ? ErrorKind::kIoError
                                          : fetch_error_;
  }
  return ErrorKind::kOk;
}

ErrorKind VirtualFile::WriteTo(File *out, std::string *error_message) {
  std::unique_ptr<Digest> digest = store_->hasher()->NewDigest();
  std::string buf;
  for (int64_t pos = 0; pos < size(); pos += buf.size()) {
    ErrorKind kind = ReadAt(pos, kMaxReadSize, &buf, error_message);
    if (kind != ErrorKind::kOk) {
      return kind;
    }
    digest->Update(buf);
    int ret = WriteAll(out, buf);
    if (ret != 0) {
      *error_message = StrCat("writing ", entry_->path, ": ", strerror(ret));
      return ErrorKind::kIoError;
    }
  }
  if (layout_ == Layout::kOriginal) {
    ContentAddress actual;
    CHECK(ContentAddress::FromBytes(digest->Finalize(), &actual));
    if (actual != entry_->full_content_hash) {
      *error_message = StrCat(entry_->path, ": reconstructed file hashes to ",
                              actual.ToHex(), "; expected ",
                              entry_->full_content_hash.ToHex());
      return ErrorKind::kCorruption;
    }
  }
  return ErrorKind::kOk;
}

}  // namespace reelstore
