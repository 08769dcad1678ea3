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
// keyframe-aligner-test.cc: tests of the keyframe-aligner.h interface.

#include <stdlib.h>

#include <random>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "keyframe-aligner.h"
#include "testutil.h"

DECLARE_bool(alsologtostderr);

using testing::ElementsAre;

namespace reelstore {
namespace {

const ChunkerConfig kChunker(1000, 4000, 8000, 2);

AlignerConfig TestConfig() {
  AlignerConfig config;
  config.max_shift = 1000;
  config.absolute_min = 500;
  config.adapt_to_spacing = false;
  return config;
}

std::vector<int64_t> Ends(const AlignmentResult &result) {
  std::vector<int64_t> out;
  for (const auto &c : result.chunks) {
    out.push_back(c.range.end);
  }
  return out;
}

std::vector<bool> Starts(const AlignmentResult &result) {
  std::vector<bool> out;
  for (const auto &c : result.chunks) {
    out.push_back(c.starts_at_keyframe);
  }
  return out;
}

TEST(AlignerConfigTest, Validation) {
  std::string error_message;
  EXPECT_TRUE(ValidateAlignerConfig(TestConfig(), kChunker, &error_message));

  AlignerConfig config = TestConfig();
  config.max_shift = 0;
  EXPECT_FALSE(ValidateAlignerConfig(config, kChunker, &error_message));
  EXPECT_EQ("max_shift 0 must be positive", error_message);

  config = TestConfig();
  config.absolute_min = 2000;
  EXPECT_FALSE(ValidateAlignerConfig(config, kChunker, &error_message));
  EXPECT_EQ("absolute_min 2000 must be in [1, 1000]", error_message);

  config = TestConfig();
  config.score_threshold = 1;
  EXPECT_FALSE(ValidateAlignerConfig(config, kChunker, &error_message));

  config.prefer_keyframe = false;
  EXPECT_TRUE(ValidateAlignerConfig(config, kChunker, &error_message));

  AlignerConfig video = AlignerConfig::ForChunker(ChunkerConfig::Video());
  EXPECT_EQ(2 << 20, video.max_shift);
  EXPECT_EQ(1 << 20, video.absolute_min);
  EXPECT_TRUE(
      ValidateAlignerConfig(video, ChunkerConfig::Video(), &error_message));
}

TEST(KeyframeAlignerTest, ShiftsToNearbyKeyframe) {
  KeyframeAligner aligner(kChunker, TestConfig());
  AlignmentResult r =
      aligner.Align({4000, 8000, 12000}, {0, 4200, 9000}, false);

  // 4000 moves 200 bytes to 4200. 8000 is exactly max_shift from 9000, which
  // scores 0.
  EXPECT_THAT(Ends(r), ElementsAre(4200, 8000, 12000));
  EXPECT_THAT(Starts(r), ElementsAre(true, true, false));
  ASSERT_EQ(1u, r.shifts.size());
  EXPECT_EQ(4000, r.shifts[0].original);
  EXPECT_EQ(4200, r.shifts[0].adjusted);
  EXPECT_EQ(4200, r.shifts[0].chunk_size);
  EXPECT_EQ(1, r.rejected);
}

TEST(KeyframeAlignerTest, ScoreThreshold) {
  KeyframeAligner aligner(kChunker, TestConfig());
  EXPECT_THAT(Ends(aligner.Align({4000, 10000}, {4690}, false)),
              ElementsAre(4690, 10000));  // score 0.31
  EXPECT_THAT(Ends(aligner.Align({4000, 10000}, {4710}, false)),
              ElementsAre(4000, 10000));  // score 0.29

  AlignerConfig strict = TestConfig();
  strict.score_threshold = 0.5;
  KeyframeAligner strict_aligner(kChunker, strict);
  EXPECT_THAT(Ends(strict_aligner.Align({4000, 10000}, {4400}, false)),
              ElementsAre(4400, 10000));  // score 0.6
  EXPECT_THAT(Ends(strict_aligner.Align({4000, 10000}, {4600}, false)),
              ElementsAre(4000, 10000));  // score 0.4
}

TEST(KeyframeAlignerTest, SizeLimits) {
  KeyframeAligner aligner(kChunker, TestConfig());

  // Below absolute_min.
  AlignmentResult r = aligner.Align({1000, 6000}, {400}, false);
  EXPECT_THAT(Ends(r), ElementsAre(1000, 6000));
  EXPECT_TRUE(r.shifts.empty());

  // Above max_size.
  r = aligner.Align({7500, 12000}, {8100}, false);
  EXPECT_THAT(Ends(r), ElementsAre(7500, 12000));
  EXPECT_TRUE(r.shifts.empty());
}

TEST(KeyframeAlignerTest, MergesUndersizedKeepingKeyframeBoundary) {
  KeyframeAligner aligner(kChunker, TestConfig());

  // 4000 moves to 4300, leaving [4300, 4900) under min_size. Its start is a
  // keyframe, so it merges forward.
  AlignmentResult r = aligner.Align({4000, 4900, 10000}, {4300}, false);
  EXPECT_THAT(Ends(r), ElementsAre(4300, 10000));
  EXPECT_THAT(Starts(r), ElementsAre(false, true));
  EXPECT_EQ(1, r.merges);
}

TEST(KeyframeAlignerTest, IntraOnlyGroupsFrames) {
  KeyframeAligner aligner(kChunker, TestConfig());
  std::vector<int64_t> frames;
  for (int64_t f = 0; f < 30000; f += 1500) {
    frames.push_back(f);
  }
  AlignmentResult r = aligner.Align({30000}, frames, true);
  EXPECT_THAT(Ends(r),
              ElementsAre(4500, 9000, 13500, 18000, 22500, 27000, 30000));
  for (const auto &c : r.chunks) {
    EXPECT_TRUE(c.starts_at_keyframe) << c.range;
  }
}

TEST(KeyframeAlignerTest, OversizedFrameIsSplitEvenly) {
  KeyframeAligner aligner(kChunker, TestConfig());
  AlignmentResult r = aligner.Align({23000}, {0, 1500, 21500}, true);
  EXPECT_THAT(Ends(r), ElementsAre(1500, 8166, 14833, 21500, 23000));
  EXPECT_THAT(Starts(r), ElementsAre(true, true, false, false, true));
  EXPECT_EQ(2, r.splits);
}

TEST(KeyframeAlignerTest, NothingToAlign) {
  KeyframeAligner aligner(kChunker, TestConfig());
  EXPECT_THAT(Ends(aligner.Align({4000, 9000}, {}, false)),
              ElementsAre(4000, 9000));
  EXPECT_TRUE(aligner.Align({}, {0}, false).chunks.empty());

  AlignerConfig off = TestConfig();
  off.prefer_keyframe = false;
  KeyframeAligner off_aligner(kChunker, off);
  AlignmentResult r = off_aligner.Align({4000, 9000}, {0, 4100}, false);
  EXPECT_THAT(Ends(r), ElementsAre(4000, 9000));
  EXPECT_THAT(Starts(r), ElementsAre(true, false));
}

TEST(KeyframeAlignerTest, IrregularSpacingLowersWeight) {
  EXPECT_EQ(0, KeyframeAligner::SpacingVariation({0, 100, 200, 300}));
  EXPECT_EQ(0, KeyframeAligner::SpacingVariation({0, 100}));
  EXPECT_NEAR(1.0 / 3, KeyframeAligner::SpacingVariation({0, 100, 300}),
              1e-9);

  // Gaps of 1000 and 2000: variation 1/3, weight 0.75.
  const std::vector<int64_t> keyframes = {0, 1000, 3000};
  AlignerConfig adaptive = TestConfig();
  adaptive.adapt_to_spacing = true;
  KeyframeAligner adaptive_aligner(kChunker, adaptive);
  KeyframeAligner fixed_aligner(kChunker, TestConfig());

  AlignmentResult r = adaptive_aligner.Align({3550, 9000}, keyframes, false);
  EXPECT_NEAR(0.75, r.weight, 1e-9);
  EXPECT_THAT(Ends(r), ElementsAre(3000, 9000));  // 0.45 * 0.75 > 0.3

  EXPECT_THAT(Ends(adaptive_aligner.Align({3650, 9000}, keyframes, false)),
              ElementsAre(3650, 9000));  // 0.35 * 0.75 < 0.3
  EXPECT_THAT(Ends(fixed_aligner.Align({3650, 9000}, keyframes, false)),
              ElementsAre(3000, 9000));
}

TEST(KeyframeAlignerTest, AlignmentBoundsHoldOnRandomInput) {
  const AlignerConfig config = TestConfig();
  KeyframeAligner aligner(kChunker, config);
  std::mt19937 gen(7);
  for (int trial = 0; trial < 20; ++trial) {
    std::string data = RandomBytes(200000, trial);
    std::vector<int64_t> ends;
    for (const auto &r : ChunkBuffer(kChunker, data)) {
      ends.push_back(r.end);
    }
    std::vector<int64_t> keyframes;
    for (int64_t k = 0; k < 200000; k += 1500 + gen() % 5000) {
      keyframes.push_back(k);
    }
    AlignmentResult r = aligner.Align(ends, keyframes, false);
    for (const auto &s : r.shifts) {
      EXPECT_LE(std::abs(s.adjusted - s.original), config.max_shift);
      EXPECT_GE(s.chunk_size, config.absolute_min);
      EXPECT_LE(s.chunk_size, kChunker.max_size);
    }
    int64_t pos = 0;
    for (const auto &c : r.chunks) {
      EXPECT_EQ(pos, c.range.begin);
      EXPECT_GT(c.range.size(), 0);
      EXPECT_LE(c.range.size(), kChunker.max_size);
      pos = c.range.end;
    }
    EXPECT_EQ(200000, pos);
  }
}

}  // namespace
}  // namespace reelstore

int main(int argc, char **argv) {
  FLAGS_alsologtostderr = true;
  google::ParseCommandLineFlags(&argc, &argv, true);
  testing::InitGoogleTest(&argc, argv);
  google::InitGoogleLogging(argv[0]);
  return RUN_ALL_TESTS();
}
