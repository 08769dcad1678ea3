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
// keyframe-aligner.h: moves content-defined chunk boundaries onto nearby
// video keyframes, so that chunks of a video payload tend to start at a
// point where decoding can begin.
//
// Each boundary from the chunker is compared with the nearest keyframe
// offset. The move is accepted only if it is within max_shift bytes, the
// chunk it closes stays within [absolute_min, max_size], and the score
// (1 - |distance| / max_shift) * weight exceeds score_threshold. The weight
// is keyframe_weight reduced by the variation in keyframe spacing, so
// irregular (variable frame rate) keyframes pull boundaries less.
//
// Two cases bypass the per-boundary search. Intra-only video, in which every
// frame is a keyframe, is cut directly at frame boundaries, grouping frames
// to approach avg_size. Any chunk which ends up larger than max_size (a
// keyframe gap longer than max_size, for example) is split evenly. Finally
// chunks smaller than min_size are merged into a neighbor where that fits.

#ifndef REELSTORE_KEYFRAME_ALIGNER_H
#define REELSTORE_KEYFRAME_ALIGNER_H

#include <stdint.h>

#include <string>
#include <vector>

#include "chunker.h"
#include "slices.h"

namespace reelstore {

struct AlignerConfig {
  // If false, boundaries are left exactly as the chunker chose them.
  bool prefer_keyframe = true;

  int64_t max_shift = 0;
  int64_t absolute_min = 0;
  double keyframe_weight = 1.0;
  double score_threshold = 0.3;

  // Lower the weight by the coefficient of variation of keyframe spacing.
  bool adapt_to_spacing = true;

  // max_shift = avg_size / 4, absolute_min = min_size / 2.
  static AlignerConfig ForChunker(const ChunkerConfig &chunker);
};

bool ValidateAlignerConfig(const AlignerConfig &config,
                           const ChunkerConfig &chunker,
                           std::string *error_message);

struct AlignedChunk {
  AlignedChunk() {}
  AlignedChunk(ByteRange range, bool starts_at_keyframe)
      : range(range), starts_at_keyframe(starts_at_keyframe) {}

  ByteRange range;
  bool starts_at_keyframe = false;
};

// One boundary moved onto a keyframe.
struct AlignmentShift {
  int64_t original = 0;
  int64_t adjusted = 0;
  int64_t chunk_size = 0;  // size of the chunk it closed, when accepted.
};

struct AlignmentResult {
  std::vector<AlignedChunk> chunks;
  std::vector<AlignmentShift> shifts;
  int64_t rejected = 0;
  int64_t splits = 0;  // boundaries inserted into oversized chunks.
  int64_t merges = 0;  // boundaries removed to join undersized chunks.
  double weight = 0;   // effective keyframe weight.
};

class KeyframeAligner {
 public:
  // PRE: ValidateAlignerConfig(config, chunker) succeeds.
  KeyframeAligner(const ChunkerConfig &chunker, const AlignerConfig &config);

  // |ends| are the chunker's chunk end offsets: strictly increasing, the last
  // being the total size. |keyframes| are keyframe start offsets relative to
  // the same origin, sorted. If |intra_only|, every frame is a keyframe and
  // |keyframes| lists every frame.
  AlignmentResult Align(const std::vector<int64_t> &ends,
                        const std::vector<int64_t> &keyframes,
                        bool intra_only) const;

  // Returns the coefficient of variation (stddev / mean) of the gaps between
  // consecutive keyframes, or 0 with fewer than three keyframes.
  static double SpacingVariation(const std::vector<int64_t> &keyframes);

 private:
  std::vector<int64_t> AlignToNearest(const std::vector<int64_t> &ends,
                                      const std::vector<int64_t> &keyframes,
                                      double weight,
                                      AlignmentResult *result) const;
  std::vector<int64_t> GroupFrames(int64_t total,
                                   const std::vector<int64_t> &frames) const;
  void SplitOversized(std::vector<int64_t> *ends,
                      AlignmentResult *result) const;
  void MergeUndersized(const std::vector<int64_t> &keyframes,
                       std::vector<int64_t> *ends,
                       AlignmentResult *result) const;

  ChunkerConfig chunker_;
  AlignerConfig config_;
};

}  // namespace reelstore

#endif  // REELSTORE_KEYFRAME_ALIGNER_H
