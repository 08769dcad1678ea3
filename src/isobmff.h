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
// isobmff.h: structure extraction for ISO/IEC 14496-12 (.mp4, .mov) files.
//
// A container file is split into metadata regions, which are stored verbatim
// as their own chunks, and payload regions (the contents of "mdat" boxes),
// which are chunked and deduplicated. The video track's sample tables are
// read to find keyframe byte offsets for the keyframe aligner.
//
// Extraction never fails on malformed input: a file which starts like an
// ISOBMFF file but can't be parsed is logged at WARNING and treated as a
// single payload region with no keyframes, the same as any other file.

#ifndef REELSTORE_ISOBMFF_H
#define REELSTORE_ISOBMFF_H

#include <stdint.h>

#include <string>
#include <vector>

#include <re2/stringpiece.h>

#include "filesystem.h"
#include "slices.h"

namespace reelstore {

constexpr uint32_t FourCC(const char (&s)[5]) {
  return (static_cast<uint32_t>(static_cast<uint8_t>(s[0])) << 24) |
         (static_cast<uint32_t>(static_cast<uint8_t>(s[1])) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(s[2])) << 8) |
         static_cast<uint32_t>(static_cast<uint8_t>(s[3]));
}

// Renders a box type for log and error messages, replacing non-printable
// bytes with ".".
std::string FourCCToString(uint32_t type);

// One box in a BoxTree's arena.
struct Box {
  uint32_t type = 0;
  int64_t pos = 0;   // absolute file offset of the box header.
  int64_t size = 0;  // including the header.
  int header_size = 8;
  int parent = -1;  // arena index, or -1 for a root.

  // Children occupy arena indices [children_begin, children_end).
  int children_begin = 0;
  int children_end = 0;

  int64_t data_pos() const { return pos + header_size; }
  int64_t end() const { return pos + size; }
};

// Parses the box header at the start of |in|, which is at absolute offset
// |pos|. |limit| is the absolute end of the enclosing box or file, used for
// size == 0 and to reject boxes which extend past it.
// Returns false with |error_message| filled if the header is short or
// inconsistent.
bool ParseBoxHeader(re2::StringPiece in, int64_t pos, int64_t limit, Box *box,
                    std::string *error_message);

// The box hierarchy of an in-memory buffer, as an arena indexed by position.
// Known container types (moov, trak, mdia, minf, stbl, edts, dinf, mvex,
// moof, traf) are descended into iteratively; other boxes are leaves.
class BoxTree {
 public:
  BoxTree() {}
  BoxTree(const BoxTree &) = delete;
  void operator=(const BoxTree &) = delete;

  // |data| must outlive the BoxTree; its first byte is at absolute offset
  // |base|.
  bool Parse(re2::StringPiece data, int64_t base, std::string *error_message);

  const std::vector<Box> &boxes() const { return boxes_; }
  const Box &box(int i) const { return boxes_[i]; }

  // Roots are [0, num_roots()).
  int num_roots() const { return num_roots_; }

  // Returns the arena index of the first child of |parent| (or root, if
  // |parent| is -1) with the given type, or -1.
  int FindChild(int parent, uint32_t type) const;

  // Returns all children of |parent| with the given type.
  std::vector<int> FindChildren(int parent, uint32_t type) const;

  // The body of box |i| (after its header).
  re2::StringPiece Contents(int i) const;

 private:
  std::vector<Box> boxes_;
  int num_roots_ = 0;
  re2::StringPiece data_;
  int64_t base_ = 0;
};

// A sync sample of the video track.
struct KeyframeInfo {
  KeyframeInfo() {}
  KeyframeInfo(int64_t byte_offset, int64_t size, int64_t frame_number)
      : byte_offset(byte_offset), size(size), frame_number(frame_number) {}

  int64_t byte_offset = 0;  // absolute, in the original file.
  int64_t size = 0;
  int64_t frame_number = 0;  // 1-based sample number, as in stss.

  bool operator==(const KeyframeInfo &o) const {
    return byte_offset == o.byte_offset && size == o.size &&
           frame_number == o.frame_number;
  }
};

// What the movie box says about the first video track.
struct MovieInfo {
  bool has_video = false;

  // Sorted by byte_offset.
  std::vector<KeyframeInfo> keyframes;

  int64_t frame_count = 0;

  // True if there is no stss box, meaning every sample is a sync sample
  // (intra-only codecs).
  bool all_frames_are_keyframes = false;
};

// Parses a complete "moov" box located at |moov_pos| in a file of
// |file_size| bytes.
bool ParseMovie(re2::StringPiece moov, int64_t moov_pos, int64_t file_size,
                MovieInfo *info, std::string *error_message);

// Adds |delta| to every stco and co64 entry in the given "moov" box, in place.
// Fails without modifying |moov| if an entry would become negative or an stco
// entry would no longer fit in 32 bits; the message names the entry.
bool RebaseChunkOffsets(int64_t delta, std::string *moov,
                        std::string *error_message);

enum class RegionKind { kMetadata = 0, kPayload = 1 };

struct Region {
  Region() {}
  Region(ByteRange range, RegionKind kind, uint32_t box_type)
      : range(range), kind(kind), box_type(box_type) {}

  ByteRange range;
  RegionKind kind = RegionKind::kPayload;

  // Type of the top-level box this region belongs to, or 0 for
  // non-container files. An mdat contributes a metadata region for its
  // header and a payload region for its body.
  uint32_t box_type = 0;
};

struct StructureMap {
  // False for files which aren't ISOBMFF or couldn't be parsed.
  bool is_container = false;

  // Consecutive regions covering the whole file.
  std::vector<Region> regions;

  MovieInfo movie;

  // The raw "moov" box, if there is exactly one.
  std::string moov;
  int64_t moov_pos = -1;

  // Absolute offset of the payload of the only mdat box, or -1 if there are
  // several mdat boxes or the file is fragmented. Chunk offsets can only be
  // normalized when this is set.
  int64_t single_payload_pos = -1;

  std::vector<ByteRange> metadata_regions() const;
  std::vector<ByteRange> payload_regions() const;
};

// Fills |map| with the structure of |file|, |file_size| bytes long. |name|
// is used only for log messages.
// Returns false only on I/O error; malformed containers degrade as described
// above.
bool ExtractStructure(File *file, int64_t file_size, re2::StringPiece name,
                      StructureMap *map, std::string *error_message);

// Returns the encoded mdat header for a payload of |payload_size| bytes:
// 8 bytes when the box size fits in 32 bits, 16 otherwise.
std::string EncodeMdatHeader(int64_t payload_size);

}  // namespace reelstore

#endif  // REELSTORE_ISOBMFF_H
