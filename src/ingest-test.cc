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
// ingest-test.cc: tests of the ingest.h interface.

#include <fcntl.h>

#include <algorithm>
#include <set>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "ingest.h"
#include "string.h"
#include "testutil.h"

DECLARE_bool(alsologtostderr);

using testing::HasSubstr;

namespace reelstore {
namespace {

class IngestTest : public testing::Test {
 protected:
  IngestTest()
      : clock_(1000000),
        hasher_(HashAlgorithm::kBlake3),
        store_(GetRealFilesystem(), &clock_, &hasher_) {
    options_.chunker = ChunkerConfig::Small();
    options_.container_chunker = ChunkerConfig::Small();
  }

  void SetUp() override {
    tmpdir_ = PrepareTempDirOrDie("ingest");
    std::string error_message;
    ASSERT_TRUE(store_.Open(tmpdir_ + "/store", true, &error_message))
        << error_message;
  }

  ManifestEntry Ingest(re2::StringPiece data, IngestStats *stats = nullptr) {
    std::string path = StrCat(tmpdir_, "/in", ++files_);
    WriteFileOrDie(path, data);
    std::unique_ptr<File> f;
    CHECK_EQ(0, GetRealFilesystem()->Open(path.c_str(), O_RDONLY, &f));
    Ingester ingester(&store_, options_);
    ManifestEntry entry;
    std::string error_message;
    ErrorKind kind =
        ingester.Ingest(f.get(), path, &entry, stats, &error_message);
    CHECK(kind == ErrorKind::kOk) << error_message;
    return entry;
  }

  std::string Reconstruct(const ManifestEntry &entry, Layout layout) {
    std::unique_ptr<VirtualFile> file;
    std::string error_message;
    CHECK(VirtualFile::Open(&store_, &entry, layout, &file, &error_message) ==
          ErrorKind::kOk)
        << error_message;
    std::string out;
    CHECK(file->ReadAt(0, file->size(), &out, &error_message) ==
          ErrorKind::kOk)
        << error_message;
    return out;
  }

  int64_t Refcount(const ContentAddress &address) {
    int64_t refcount = -1;
    std::string error_message;
    CHECK(store_.GetRefcount(address, &refcount, &error_message) ==
          ErrorKind::kOk)
        << error_message;
    return refcount;
  }

  std::string tmpdir_;
  int files_ = 0;
  SimulatedClock clock_;
  Hasher hasher_;
  ChunkStore store_;
  IngestOptions options_;
};

TEST(IngestOptionsTest, Validation) {
  IngestOptions options;
  std::string error_message;
  EXPECT_TRUE(ValidateIngestOptions(options, &error_message)) << error_message;

  AlignerConfig effective =
      EffectiveAlignerConfig(options, ChunkerConfig::Video());
  EXPECT_EQ((8 << 20) / 4, effective.max_shift);
  EXPECT_EQ((2 << 20) / 2, effective.absolute_min);

  options.aligner.absolute_min = 64 << 20;
  EXPECT_FALSE(ValidateIngestOptions(options, &error_message));
  EXPECT_THAT(error_message, HasSubstr("absolute_min"));

  options.aligner.prefer_keyframe = false;
  EXPECT_TRUE(ValidateIngestOptions(options, &error_message)) << error_message;

  options.chunker.max_size = options.chunker.avg_size - 1;
  EXPECT_FALSE(ValidateIngestOptions(options, &error_message));
}

TEST_F(IngestTest, EmptyFile) {
  ManifestEntry entry = Ingest("");
  EXPECT_EQ(0, entry.size);
  EXPECT_TRUE(entry.chunks.empty());
  EXPECT_EQ(hasher_.Hash(""), entry.full_content_hash);
  EXPECT_EQ("", Reconstruct(entry, Layout::kOriginal));
}

TEST_F(IngestTest, OneByteFile) {
  ManifestEntry entry = Ingest("x");
  ASSERT_EQ(1u, entry.chunks.size());
  EXPECT_EQ(1, entry.chunks[0].length);
  EXPECT_EQ(hasher_.Hash("x"), entry.chunks[0].address);
  EXPECT_EQ("x", Reconstruct(entry, Layout::kOriginal));
}

TEST_F(IngestTest, PlainFileChunksRespectSizeBounds) {
  std::string data = RandomBytes(2 << 20, 1);
  IngestStats stats;
  ManifestEntry entry = Ingest(data, &stats);
  EXPECT_FALSE(entry.is_container());
  EXPECT_EQ(hasher_.Hash(data), entry.full_content_hash);
  ASSERT_GT(entry.chunks.size(), 2u);
  EXPECT_EQ(static_cast<int64_t>(entry.chunks.size()), stats.chunks);
  EXPECT_EQ(0, stats.metadata_chunks);
  const ChunkerConfig &config = options_.chunker;
  for (size_t i = 0; i < entry.chunks.size(); ++i) {
    const ChunkRef &c = entry.chunks[i];
    SCOPED_TRACE(i);
    EXPECT_EQ(0u, c.flags);
    EXPECT_LE(c.length, config.max_size);
    if (i + 1 < entry.chunks.size()) {
      EXPECT_GE(c.length, config.min_size);
    }
    EXPECT_EQ(hasher_.Hash(re2::StringPiece(data).substr(c.offset, c.length)),
              c.address);
    EXPECT_EQ(1, Refcount(c.address));
  }
  EXPECT_EQ(data, Reconstruct(entry, Layout::kOriginal));
}

TEST_F(IngestTest, PlanningStoresNothing) {
  std::string data = RandomBytes(1 << 20, 7);
  ManifestEntry stored = Ingest(data);

  std::string path = StrCat(tmpdir_, "/planned");
  WriteFileOrDie(path, data);
  std::unique_ptr<File> f;
  ASSERT_EQ(0, GetRealFilesystem()->Open(path.c_str(), O_RDONLY, &f));
  Ingester planner(&hasher_, options_);
  ManifestEntry planned;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk,
            planner.Ingest(f.get(), path, &planned, nullptr, &error_message))
      << error_message;
  EXPECT_TRUE(stored.chunks == planned.chunks);
  EXPECT_EQ(stored.full_content_hash, planned.full_content_hash);
  for (const auto &c : planned.chunks) {
    EXPECT_EQ(1, Refcount(c.address));
  }
}

TEST_F(IngestTest, ReingestSharesChunks) {
  std::string data = RandomBytes(1 << 20, 2);
  ManifestEntry a = Ingest(data);
  ManifestEntry b = Ingest(data);
  ASSERT_EQ(a.chunks.size(), b.chunks.size());
  for (size_t i = 0; i < a.chunks.size(); ++i) {
    EXPECT_EQ(a.chunks[i], b.chunks[i]);
    EXPECT_EQ(2, Refcount(a.chunks[i].address));
  }
}

TEST_F(IngestTest, InsertionOnlyDisturbsNearbyChunks) {
  std::string data = RandomBytes(2 << 20, 3);
  std::string edited = data;
  edited.insert(1 << 20, "inserted bytes");
  ManifestEntry a = Ingest(data);
  ManifestEntry b = Ingest(edited);
  std::set<ContentAddress> before;
  for (const auto &c : a.chunks) before.insert(c.address);
  size_t shared = 0;
  for (const auto &c : b.chunks) shared += before.count(c.address);
  EXPECT_GE(shared + 3, b.chunks.size());
}

TEST_F(IngestTest, ContainerChunksStartAtKeyframes) {
  TestMp4Options mp4_options;
  mp4_options.sample_sizes.assign(400, 2000);
  for (uint32_t i = 1; i <= 400; i += 30) {
    mp4_options.sync_samples.push_back(i);
  }
  TestMp4 mp4 = MakeTestMp4(mp4_options);
  std::set<int64_t> keyframes;
  for (uint32_t s : mp4_options.sync_samples) {
    keyframes.insert(mp4.sample_offsets[s - 1]);
  }

  IngestStats stats;
  ManifestEntry entry = Ingest(mp4.data, &stats);
  ASSERT_TRUE(entry.is_container());
  EXPECT_TRUE(entry.offsets_normalized);
  EXPECT_EQ(mp4.mdat_data_pos, entry.payload_pos);
  EXPECT_EQ(hasher_.Hash(mp4.data), entry.full_content_hash);
  EXPECT_GT(stats.keyframe_aligned_chunks, 0);
  EXPECT_EQ("400", entry.asset_metadata["video_frames"]);

  for (const auto &c : entry.chunks) {
    bool in_payload = c.offset >= mp4.mdat_data_pos && c.offset < mp4.mdat_end;
    EXPECT_EQ(!in_payload, (c.flags & ChunkRef::kMetadata) != 0) << c.offset;
    if (c.flags & ChunkRef::kKeyframeAligned) {
      EXPECT_EQ(1u, keyframes.count(c.offset)) << c.offset;
    }
  }
  auto payload = std::find_if(entry.regions.begin(), entry.regions.end(),
                              [](const ManifestRegion &r) {
                                return r.kind == RegionKind::kPayload;
                              });
  ASSERT_TRUE(payload != entry.regions.end());
  const ChunkRef &first_payload = entry.chunks[payload->first_chunk];
  EXPECT_EQ(mp4.mdat_data_pos, first_payload.offset);
  EXPECT_TRUE(first_payload.flags & ChunkRef::kKeyframeAligned);

  EXPECT_EQ(mp4.data, Reconstruct(entry, Layout::kOriginal));
}

TEST_F(IngestTest, IntraOnlyChunksEndOnFrames) {
  TestMp4Options mp4_options;
  mp4_options.sample_sizes.assign(300, 3000);
  mp4_options.write_stss = false;
  TestMp4 mp4 = MakeTestMp4(mp4_options);
  std::set<int64_t> frames(mp4.sample_offsets.begin(),
                           mp4.sample_offsets.end());

  ManifestEntry entry = Ingest(mp4.data);
  for (const auto &c : entry.chunks) {
    if (c.flags & ChunkRef::kMetadata) continue;
    EXPECT_EQ(1u, frames.count(c.offset)) << c.offset;
    EXPECT_TRUE(c.flags & ChunkRef::kKeyframeAligned) << c.offset;
  }
  EXPECT_EQ(mp4.data, Reconstruct(entry, Layout::kOriginal));
}

TEST_F(IngestTest, AlignmentCanBeDisabled) {
  TestMp4Options mp4_options;
  mp4_options.sample_sizes.assign(300, 2000);
  mp4_options.sync_samples = {1, 31, 61, 91, 121, 151, 181, 211, 241, 271};
  TestMp4 mp4 = MakeTestMp4(mp4_options);

  options_.aligner.prefer_keyframe = false;
  IngestStats stats;
  ManifestEntry entry = Ingest(mp4.data, &stats);
  EXPECT_EQ(0, stats.keyframe_aligned_chunks);
  EXPECT_EQ(0, stats.shifts);
  EXPECT_EQ(mp4.data, Reconstruct(entry, Layout::kOriginal));
}

TEST_F(IngestTest, MovedMoovStillDeduplicates) {
  TestMp4Options mp4_options;
  mp4_options.sample_sizes.assign(300, 2500);
  mp4_options.sync_samples = {1, 61, 121, 181, 241};
  TestMp4 moov_last = MakeTestMp4(mp4_options);
  mp4_options.moov_first = true;
  TestMp4 moov_first = MakeTestMp4(mp4_options);
  ASSERT_NE(moov_last.mdat_data_pos, moov_first.mdat_data_pos);

  ManifestEntry a = Ingest(moov_last.data);
  ManifestEntry b = Ingest(moov_first.data);
  ASSERT_TRUE(a.offsets_normalized);
  ASSERT_TRUE(b.offsets_normalized);

  // Identical payload chunking and an identical normalized moov.
  std::vector<ContentAddress> a_payload, b_payload;
  ContentAddress a_moov, b_moov;
  for (const auto &c : a.chunks) {
    if (!(c.flags & ChunkRef::kMetadata)) a_payload.push_back(c.address);
    if (c.offset == moov_last.moov_pos) a_moov = c.address;
  }
  for (const auto &c : b.chunks) {
    if (!(c.flags & ChunkRef::kMetadata)) b_payload.push_back(c.address);
    if (c.offset == moov_first.moov_pos) b_moov = c.address;
  }
  EXPECT_EQ(a_payload, b_payload);
  EXPECT_EQ(a_moov, b_moov);
  EXPECT_EQ(2, Refcount(a_moov));

  EXPECT_EQ(moov_last.data, Reconstruct(a, Layout::kOriginal));
  EXPECT_EQ(moov_first.data, Reconstruct(b, Layout::kOriginal));

  // Either one can be served in fast-start order.
  std::string fast = Reconstruct(a, Layout::kFastStart);
  EXPECT_EQ(moov_last.data.size(), fast.size());
  EXPECT_EQ(moov_first.data, fast);
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
