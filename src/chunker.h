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
// chunker.h: FastCDC content-defined chunking.
//
// Boundaries are chosen by a gear hash over the content (see gear.h), so an
// insertion or deletion moves only the boundaries near it. Between min_size
// and avg_size a boundary requires the top (bits + normalization) bits of the
// hash to be zero, where bits = round(log2(avg_size)); past avg_size only the
// top (bits - normalization) bits. The stricter first mask makes early cuts
// rare and the looser second mask makes late cuts common, which pulls chunk
// sizes toward avg_size. At max_size a cut is forced.

#ifndef REELSTORE_CHUNKER_H
#define REELSTORE_CHUNKER_H

#include <stdint.h>

#include <string>
#include <vector>

#include <re2/stringpiece.h>

#include "reader.h"
#include "slices.h"

namespace reelstore {

constexpr uint32_t kMinChunkSizeLimit = 64;
constexpr uint32_t kMaxChunkSizeLimit = UINT32_C(1) << 30;

struct ChunkerConfig {
  ChunkerConfig() {}
  ChunkerConfig(uint32_t min_size, uint32_t avg_size, uint32_t max_size,
                int normalization)
      : min_size(min_size),
        avg_size(avg_size),
        max_size(max_size),
        normalization(normalization) {}

  uint32_t min_size = 256 << 10;
  uint32_t avg_size = 1 << 20;
  uint32_t max_size = 4 << 20;
  int normalization = 2;

  bool operator==(const ChunkerConfig &o) const {
    return min_size == o.min_size && avg_size == o.avg_size &&
           max_size == o.max_size && normalization == o.normalization;
  }

  std::string DebugString() const;

  // General-purpose files: 256 KiB / 1 MiB / 4 MiB.
  static ChunkerConfig Default() { return ChunkerConfig(); }

  // Video payloads: 2 MiB / 8 MiB / 16 MiB.
  static ChunkerConfig Video() {
    return ChunkerConfig(2 << 20, 8 << 20, 16 << 20, 2);
  }

  // Small files: 16 KiB / 64 KiB / 256 KiB.
  static ChunkerConfig Small() {
    return ChunkerConfig(16 << 10, 64 << 10, 256 << 10, 2);
  }
};

// Checks that 64 <= min <= avg <= max <= 1 GiB and that normalization is in
// [0, 3] and less than log2(avg).
bool ValidateChunkerConfig(const ChunkerConfig &config,
                           std::string *error_message);

// Parses a profile name: "default", "video", or "small".
bool ParseChunkingProfile(re2::StringPiece name, ChunkerConfig *config,
                          std::string *error_message);

// Push-style boundary search over bytes already in memory.
class BoundaryFinder {
 public:
  // PRE: ValidateChunkerConfig(config) succeeds.
  explicit BoundaryFinder(const ChunkerConfig &config);

  // Returns the length of the chunk starting at data[0]. |data| must hold at
  // least max_size bytes unless it extends to the end of the input.
  // Returns data.size() if that is at most min_size.
  size_t Cut(re2::StringPiece data) const;

  const ChunkerConfig &config() const { return config_; }
  uint64_t mask_s() const { return mask_s_; }
  uint64_t mask_l() const { return mask_l_; }

 private:
  ChunkerConfig config_;
  uint64_t mask_s_;
  uint64_t mask_l_;
};

// Returns the chunks of |data| as consecutive byte ranges covering it exactly.
std::vector<ByteRange> ChunkBuffer(const ChunkerConfig &config,
                                   re2::StringPiece data);

struct Chunk {
  int64_t offset = 0;  // relative to the start of the reader's input.
  std::string data;
};

// Pull-style streaming chunker. Memory use is bounded by max_size plus one
// read; the input is never held in full.
class Chunker {
 public:
  // |reader| must outlive the Chunker.
  // PRE: ValidateChunkerConfig(config) succeeds.
  Chunker(const ChunkerConfig &config, ByteReader *reader);
  Chunker(const Chunker &) = delete;
  void operator=(const Chunker &) = delete;

  // Fills |chunk| with the next chunk and returns true. Returns false at the
  // end of input (leaving |error_message| empty) or on a read error.
  bool Next(Chunk *chunk, std::string *error_message);

  int64_t bytes_consumed() const { return offset_; }

 private:
  bool Fill(std::string *error_message);

  BoundaryFinder finder_;
  ByteReader *reader_;
  size_t read_size_;
  std::string buf_;
  size_t pos_ = 0;  // start of unconsumed bytes within buf_.
  int64_t offset_ = 0;
  bool eof_ = false;
};

}  // namespace reelstore

#endif  // REELSTORE_CHUNKER_H
