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
// chunker.cc: see chunker.h.

#include "chunker.h"

#include <math.h>

#include <glog/logging.h>

#include "gear.h"
#include "string.h"

namespace reelstore {

namespace {

int MaskBits(uint32_t avg_size) {
  return static_cast<int>(lround(log2(static_cast<double>(avg_size))));
}

// A mask of the |n| most significant bits. Gear hash high bits depend on the
// whole 64-byte window; low bits only on the last few bytes.
uint64_t TopBits(int n) {
  return n <= 0 ? 0 : ~UINT64_C(0) << (64 - n);
}

}  // namespace

std::string ChunkerConfig::DebugString() const {
  return StrCat("min=", min_size, " avg=", avg_size, " max=", max_size,
                " normalization=", normalization);
}

bool ValidateChunkerConfig(const ChunkerConfig &config,
                           std::string *error_message) {
  if (config.min_size < kMinChunkSizeLimit) {
    *error_message = StrCat("min_size ", config.min_size,
                            " is below the limit of ", kMinChunkSizeLimit);
    return false;
  }
  if (config.min_size > config.avg_size || config.avg_size > config.max_size) {
    *error_message = StrCat("sizes must satisfy min <= avg <= max; got ",
                            config.DebugString());
    return false;
  }
  if (config.max_size > kMaxChunkSizeLimit) {
    *error_message = StrCat("max_size ", config.max_size,
                            " exceeds the limit of ", kMaxChunkSizeLimit);
    return false;
  }
  if (config.normalization < 0 || config.normalization > 3 ||
      config.normalization >= MaskBits(config.avg_size)) {
    *error_message = StrCat("normalization ", config.normalization,
                            " out of range for ", config.DebugString());
    return false;
  }
  return true;
}

bool ParseChunkingProfile(re2::StringPiece name, ChunkerConfig *config,
                          std::string *error_message) {
  std::string lower = AsciiToLower(name);
  if (lower == "default") {
    *config = ChunkerConfig::Default();
  } else if (lower == "video") {
    *config = ChunkerConfig::Video();
  } else if (lower == "small") {
    *config = ChunkerConfig::Small();
  } else {
    *error_message = StrCat("unknown chunking profile \"", name, "\"");
    return false;
  }
  return true;
}

BoundaryFinder::BoundaryFinder(const ChunkerConfig &config) : config_(config) {
  std::string error_message;
  CHECK(ValidateChunkerConfig(config, &error_message)) << error_message;
  int bits = MaskBits(config.avg_size);
  mask_s_ = TopBits(bits + config.normalization);
  mask_l_ = TopBits(bits - config.normalization);
}

size_t BoundaryFinder::Cut(re2::StringPiece data) const {
  size_t n = data.size();
  if (n <= config_.min_size) {
    return n;
  }
  if (n > config_.max_size) {
    n = config_.max_size;
  }
  const size_t normal = config_.avg_size < n ? config_.avg_size : n;
  auto p = reinterpret_cast<const uint8_t *>(data.data());

  // The hash at min_size depends only on the preceding window, so skip
  // hashing the rest of the minimum.
  GearHash h;
  size_t i = config_.min_size > static_cast<uint32_t>(GearHash::kWindow)
                 ? config_.min_size - GearHash::kWindow
                 : 0;
  for (; i < config_.min_size; ++i) {
    h.Roll(p[i]);
  }
  for (; i < normal; ++i) {
    if ((h.Roll(p[i]) & mask_s_) == 0) {
      return i + 1;
    }
  }
  for (; i < n; ++i) {
    if ((h.Roll(p[i]) & mask_l_) == 0) {
      return i + 1;
    }
  }
  return n;
}

std::vector<ByteRange> ChunkBuffer(const ChunkerConfig &config,
                                   re2::StringPiece data) {
  BoundaryFinder finder(config);
  std::vector<ByteRange> out;
  int64_t pos = 0;
  while (!data.empty()) {
    size_t len = finder.Cut(data);
    out.emplace_back(pos, pos + len);
    pos += len;
    data.remove_prefix(len);
  }
  return out;
}

Chunker::Chunker(const ChunkerConfig &config, ByteReader *reader)
    : finder_(config), reader_(reader) {
  read_size_ = config.max_size < (1 << 20) ? config.max_size : (1 << 20);
}

bool Chunker::Fill(std::string *error_message) {
  const size_t max_size = finder_.config().max_size;
  if (pos_ > 0) {
    buf_.erase(0, pos_);
    pos_ = 0;
  }
  while (!eof_ && buf_.size() < max_size) {
    size_t old_size = buf_.size();
    buf_.resize(old_size + read_size_);
    int64_t n = reader_->Read(&buf_[old_size], read_size_, error_message);
    if (n < 0) {
      buf_.resize(old_size);
      return false;
    }
    buf_.resize(old_size + n);
    if (n == 0) {
      eof_ = true;
    }
  }
  return true;
}

bool Chunker::Next(Chunk *chunk, std::string *error_message) {
  error_message->clear();
  if (buf_.size() - pos_ < finder_.config().max_size && !eof_) {
    if (!Fill(error_message)) {
      return false;
    }
  }
  re2::StringPiece avail(buf_.data() + pos_, buf_.size() - pos_);
  if (avail.empty()) {
    return false;
  }
  size_t len = finder_.Cut(avail);
  chunk->offset = offset_;
  chunk->data.assign(avail.data(), len);
  pos_ += len;
  offset_ += len;
  VLOG(3) << "chunk at " << chunk->offset << " len " << len;
  return true;
}

}  // namespace reelstore
