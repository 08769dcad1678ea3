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
// keyframe-aligner.cc: implementation of keyframe-aligner.h interface.

#include "keyframe-aligner.h"

#include <math.h>

#include <algorithm>

#include <glog/logging.h>

#include "string.h"

namespace reelstore {

namespace {

// Returns the keyframe closest to |offset|, or -1 if there are none. Ties go
// to the earlier keyframe.
int64_t Nearest(const std::vector<int64_t> &keyframes, int64_t offset) {
  auto it = std::lower_bound(keyframes.begin(), keyframes.end(), offset);
  if (it == keyframes.end()) {
    return keyframes.empty() ? -1 : keyframes.back();
  }
  if (it == keyframes.begin() || *it == offset) {
    return *it;
  }
  int64_t before = *(it - 1);
  return (offset - before <= *it - offset) ? before : *it;
}

bool IsKeyframe(const std::vector<int64_t> &keyframes, int64_t offset) {
  return std::binary_search(keyframes.begin(), keyframes.end(), offset);
}

}  // namespace

AlignerConfig AlignerConfig::ForChunker(const ChunkerConfig &chunker) {
  AlignerConfig config;
  config.max_shift = chunker.avg_size / 4;
  config.absolute_min = chunker.min_size / 2;
  return config;
}

bool ValidateAlignerConfig(const AlignerConfig &config,
                           const ChunkerConfig &chunker,
                           std::string *error_message) {
  if (!config.prefer_keyframe) {
    return true;
  }
  if (config.max_shift <= 0) {
    *error_message =
        StrCat("max_shift ", config.max_shift, " must be positive");
    return false;
  }
  if (config.absolute_min < 1 || config.absolute_min > chunker.min_size) {
    *error_message = StrCat("absolute_min ", config.absolute_min,
                            " must be in [1, ", chunker.min_size, "]");
    return false;
  }
  if (!(config.keyframe_weight >= 0)) {
    *error_message = "keyframe_weight must be non-negative";
    return false;
  }
  if (!(config.score_threshold >= 0 && config.score_threshold < 1)) {
    *error_message = "score_threshold must be in [0, 1)";
    return false;
  }
  return true;
}

KeyframeAligner::KeyframeAligner(const ChunkerConfig &chunker,
                                 const AlignerConfig &config)
    : chunker_(chunker), config_(config) {
  std::string error_message;
  CHECK(ValidateAlignerConfig(config, chunker, &error_message))
      << error_message;
}

double KeyframeAligner::SpacingVariation(
    const std::vector<int64_t> &keyframes) {
  if (keyframes.size() < 3) {
    return 0;
  }
  const size_t n = keyframes.size() - 1;
  double mean = static_cast<double>(keyframes.back() - keyframes.front()) / n;
  if (mean <= 0) {
    return 0;
  }
  double sum_sq = 0;
  for (size_t i = 0; i < n; ++i) {
    double d = (keyframes[i + 1] - keyframes[i]) - mean;
    sum_sq += d * d;
  }
  return sqrt(sum_sq / n) / mean;
}

AlignmentResult KeyframeAligner::Align(const std::vector<int64_t> &ends,
                                       const std::vector<int64_t> &keyframes,
                                       bool intra_only) const {
  AlignmentResult result;
  if (ends.empty()) {
    return result;
  }
  const int64_t total = ends.back();
  std::vector<int64_t> out;
  if (!config_.prefer_keyframe || keyframes.empty()) {
    out = ends;
  } else {
    result.weight = config_.keyframe_weight;
    if (config_.adapt_to_spacing) {
      result.weight /= 1 + SpacingVariation(keyframes);
    }
    out = intra_only ? GroupFrames(total, keyframes)
                     : AlignToNearest(ends, keyframes, result.weight, &result);
    SplitOversized(&out, &result);
    MergeUndersized(keyframes, &out, &result);
  }

  int64_t begin = 0;
  for (int64_t end : out) {
    result.chunks.emplace_back(ByteRange(begin, end),
                               IsKeyframe(keyframes, begin));
    begin = end;
  }
  VLOG(1) << "aligned " << ends.size() << " boundaries to " << out.size()
          << ": " << result.shifts.size() << " shifted, " << result.rejected
          << " rejected, " << result.splits << " splits, " << result.merges
          << " merges";
  return result;
}

std::vector<int64_t> KeyframeAligner::AlignToNearest(
    const std::vector<int64_t> &ends, const std::vector<int64_t> &keyframes,
    double weight, AlignmentResult *result) const {
  const int64_t total = ends.back();
  std::vector<int64_t> out;
  int64_t prev = 0;
  for (size_t i = 0; i + 1 < ends.size(); ++i) {
    const int64_t b = ends[i];
    if (b <= prev) {
      continue;  // overtaken by an earlier shift.
    }
    const int64_t k = Nearest(keyframes, b);
    if (k == b) {
      out.push_back(b);
      prev = b;
      continue;
    }
    const int64_t distance = k > b ? k - b : b - k;
    const int64_t size = k - prev;
    const double score =
        (1.0 - static_cast<double>(distance) / config_.max_shift) * weight;
    if (k > prev && k < total && distance <= config_.max_shift &&
        size >= config_.absolute_min && size <= chunker_.max_size &&
        score > config_.score_threshold) {
      AlignmentShift shift;
      shift.original = b;
      shift.adjusted = k;
      shift.chunk_size = size;
      result->shifts.push_back(shift);
      out.push_back(k);
      prev = k;
    } else {
      ++result->rejected;
      out.push_back(b);
      prev = b;
    }
  }
  out.push_back(total);
  return out;
}

std::vector<int64_t> KeyframeAligner::GroupFrames(
    int64_t total, const std::vector<int64_t> &frames) const {
  std::vector<int64_t> candidates;
  for (int64_t f : frames) {
    if (f > 0 && f < total) {
      candidates.push_back(f);
    }
  }
  candidates.push_back(total);

  std::vector<int64_t> out;
  int64_t start = 0;
  while (start < total) {
    auto lo = std::lower_bound(candidates.begin(), candidates.end(),
                               start + chunker_.min_size);
    auto hi = std::upper_bound(candidates.begin(), candidates.end(),
                               start + chunker_.max_size);
    int64_t cut;
    if (lo < hi) {
      // The frame boundary closest to avg_size within [min_size, max_size].
      const int64_t target = start + chunker_.avg_size;
      auto it = std::lower_bound(lo, hi, target);
      if (it == hi) {
        cut = *(hi - 1);
      } else if (it == lo) {
        cut = *it;
      } else {
        cut = (*it - target <= target - *(it - 1)) ? *it : *(it - 1);
      }
    } else {
      auto next = std::upper_bound(candidates.begin(), candidates.end(), start);
      if (*next <= start + chunker_.max_size) {
        cut = *(hi - 1);  // short of min_size; merged later if possible.
      } else {
        cut = *next;  // one frame larger than max_size; split later.
      }
    }
    out.push_back(cut);
    start = cut;
  }
  return out;
}

void KeyframeAligner::SplitOversized(std::vector<int64_t> *ends,
                                     AlignmentResult *result) const {
  const int64_t max_size = chunker_.max_size;
  std::vector<int64_t> out;
  int64_t begin = 0;
  for (int64_t end : *ends) {
    const int64_t size = end - begin;
    if (size > max_size) {
      const int64_t n = (size + max_size - 1) / max_size;
      for (int64_t j = 1; j < n; ++j) {
        out.push_back(begin + size * j / n);
      }
      result->splits += n - 1;
    }
    out.push_back(end);
    begin = end;
  }
  ends->swap(out);
}

void KeyframeAligner::MergeUndersized(const std::vector<int64_t> &keyframes,
                                      std::vector<int64_t> *ends,
                                      AlignmentResult *result) const {
  const int64_t min_size = chunker_.min_size;
  const int64_t max_size = chunker_.max_size;
  std::vector<int64_t> &e = *ends;
  size_t i = 0;
  while (i < e.size() && e.size() > 1) {
    const int64_t begin = i == 0 ? 0 : e[i - 1];
    if (e[i] - begin >= min_size) {
      ++i;
      continue;
    }
    const bool can_prev =
        i > 0 && e[i] - (i >= 2 ? e[i - 2] : 0) <= max_size;
    const bool can_next = i + 1 < e.size() && e[i + 1] - begin <= max_size;

    // Prefer to drop whichever boundary isn't on a keyframe.
    const bool start_is_keyframe = i > 0 && IsKeyframe(keyframes, begin);
    const bool end_is_keyframe =
        i + 1 < e.size() && IsKeyframe(keyframes, e[i]);
    if (can_prev && (!can_next || !start_is_keyframe || end_is_keyframe)) {
      e.erase(e.begin() + (i - 1));
      ++result->merges;
      --i;
    } else if (can_next) {
      e.erase(e.begin() + i);
      ++result->merges;
    } else {
      ++i;
    }
  }
}

}  // namespace reelstore
