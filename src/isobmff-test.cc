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
// isobmff-test.cc: tests of the isobmff.h interface.

#include <errno.h>
#include <stdint.h>
#include <fcntl.h>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "isobmff.h"
#include "string.h"
#include "testutil.h"

DECLARE_bool(alsologtostderr);

using testing::_;
using testing::AnyNumber;
using testing::HasSubstr;
using testing::Return;

namespace reelstore {
namespace {

std::vector<uint32_t> VaryingSizes(int n) {
  std::vector<uint32_t> out;
  for (int i = 0; i < n; ++i) {
    out.push_back(1000 + 37 * i);
  }
  return out;
}

class IsobmffTest : public testing::Test {
 protected:
  IsobmffTest() { test_dir_ = PrepareTempDirOrDie("isobmff"); }

  // Writes |data| to a file and extracts its structure, which must not hit
  // an I/O error.
  StructureMap Extract(re2::StringPiece data) {
    std::string path = StrCat(test_dir_, "/f", ++files_);
    WriteFileOrDie(path, data);
    std::unique_ptr<File> f;
    CHECK_EQ(0, GetRealFilesystem()->Open(path.c_str(), O_RDONLY, &f));
    StructureMap map;
    std::string error_message;
    CHECK(ExtractStructure(f.get(), data.size(), path, &map, &error_message))
        << error_message;
    return map;
  }

  std::string test_dir_;
  int files_ = 0;
};

TEST(BoxHeaderTest, Sizes) {
  Box box;
  std::string error_message;

  ASSERT_TRUE(ParseBoxHeader(re2::StringPiece("\x00\x00\x00\x10" "free", 8),
                             100, 1000, &box, &error_message));
  EXPECT_EQ(FourCC("free"), box.type);
  EXPECT_EQ(100, box.pos);
  EXPECT_EQ(16, box.size);
  EXPECT_EQ(8, box.header_size);
  EXPECT_EQ(108, box.data_pos());

  // size == 1: a 64-bit size follows the type.
  ASSERT_TRUE(ParseBoxHeader(
      re2::StringPiece("\x00\x00\x00\x01" "mdat"
                       "\x00\x00\x00\x01\x00\x00\x00\x00",
                       16),
      0, INT64_C(1) << 40, &box, &error_message));
  EXPECT_EQ(INT64_C(1) << 32, box.size);
  EXPECT_EQ(16, box.header_size);

  // size == 0: to the end of the enclosing space.
  ASSERT_TRUE(ParseBoxHeader(re2::StringPiece("\x00\x00\x00\x00" "mdat", 8), 40,
                             1000, &box, &error_message));
  EXPECT_EQ(960, box.size);
}

TEST(BoxHeaderTest, Errors) {
  Box box;
  std::string error_message;
  EXPECT_FALSE(ParseBoxHeader(re2::StringPiece("\x00\x00\x00", 3), 5, 100,
                              &box, &error_message));
  EXPECT_EQ("box header at offset 5 is truncated", error_message);

  EXPECT_FALSE(ParseBoxHeader(re2::StringPiece("\x00\x00\x00\x04" "free", 8),
                              0, 100, &box, &error_message));
  EXPECT_EQ("free at offset 0 has size 4, smaller than its header",
            error_message);

  EXPECT_FALSE(ParseBoxHeader(re2::StringPiece("\x00\x00\x01\x00" "moov", 8),
                              10, 100, &box, &error_message));
  EXPECT_EQ("moov at offset 10 with size 256 extends past end at 100",
            error_message);

  EXPECT_FALSE(ParseBoxHeader(re2::StringPiece("\x00\x00\x00\x01" "mdat", 8),
                              0, 100, &box, &error_message));
  EXPECT_EQ("extended box header at offset 0 is truncated", error_message);

  EXPECT_EQ("a.\x7e" "b", FourCCToString(0x61017e62));
}

TEST(BoxTreeTest, ArenaLayout) {
  TestMp4Options options;
  options.sample_sizes = VaryingSizes(20);
  TestMp4 mp4 = MakeTestMp4(options);
  re2::StringPiece moov(mp4.data);
  moov = moov.substr(mp4.moov_pos, mp4.moov_end - mp4.moov_pos);

  BoxTree tree;
  std::string error_message;
  ASSERT_TRUE(tree.Parse(moov, mp4.moov_pos, &error_message)) << error_message;
  ASSERT_EQ(1, tree.num_roots());
  int m = tree.FindChild(-1, FourCC("moov"));
  ASSERT_EQ(0, m);
  int trak = tree.FindChild(m, FourCC("trak"));
  ASSERT_GE(trak, 0);
  EXPECT_EQ(m, tree.box(trak).parent);
  EXPECT_EQ(-1, tree.FindChild(m, FourCC("mdat")));
  int mdia = tree.FindChild(trak, FourCC("mdia"));
  int minf = tree.FindChild(mdia, FourCC("minf"));
  int stbl = tree.FindChild(minf, FourCC("stbl"));
  ASSERT_GE(stbl, 0);
  int stco = tree.FindChild(stbl, FourCC("stco"));
  ASSERT_GE(stco, 0);

  // Children are contiguous and lie within their parent.
  for (size_t i = 0; i < tree.boxes().size(); ++i) {
    const Box &b = tree.box(i);
    for (int c = b.children_begin; c < b.children_end; ++c) {
      EXPECT_EQ(static_cast<int>(i), tree.box(c).parent);
      EXPECT_GE(tree.box(c).pos, b.data_pos());
      EXPECT_LE(tree.box(c).end(), b.end());
    }
  }

  // stco: version/flags, count = 2 chunks, then the offsets.
  re2::StringPiece contents = tree.Contents(stco);
  ASSERT_EQ(4u + 4 + 2 * 4, contents.size());
  EXPECT_EQ(2u, LoadU32(contents.data() + 4));
  EXPECT_EQ(static_cast<uint32_t>(mp4.mdat_data_pos),
            LoadU32(contents.data() + 8));
}

TEST(BoxTreeTest, DeepNestingIsIterative) {
  const int kDepth = 5000;
  std::string data;
  {
    std::vector<std::unique_ptr<ScopedBox>> boxes;
    for (int i = 0; i < kDepth; ++i) {
      boxes.emplace_back(new ScopedBox(&data, "trak"));
    }
    while (!boxes.empty()) {
      boxes.pop_back();  // closes innermost first.
    }
  }
  BoxTree tree;
  std::string error_message;
  ASSERT_TRUE(tree.Parse(data, 0, &error_message)) << error_message;
  EXPECT_EQ(static_cast<size_t>(kDepth), tree.boxes().size());
  EXPECT_EQ(kDepth - 2, tree.box(kDepth - 1).parent);
}

TEST_F(IsobmffTest, KeyframesFromSyncSamples) {
  TestMp4Options options;
  options.sample_sizes = VaryingSizes(90);
  options.sync_samples = {1, 30, 60};
  TestMp4 mp4 = MakeTestMp4(options);

  StructureMap map = Extract(mp4.data);
  ASSERT_TRUE(map.is_container);
  ASSERT_TRUE(map.movie.has_video);
  EXPECT_FALSE(map.movie.all_frames_are_keyframes);
  EXPECT_EQ(90, map.movie.frame_count);
  ASSERT_EQ(3u, map.movie.keyframes.size());
  EXPECT_EQ(KeyframeInfo(mp4.sample_offsets[0], 1000, 1),
            map.movie.keyframes[0]);
  EXPECT_EQ(KeyframeInfo(mp4.sample_offsets[29], 1000 + 37 * 29, 30),
            map.movie.keyframes[1]);
  EXPECT_EQ(KeyframeInfo(mp4.sample_offsets[59], 1000 + 37 * 59, 60),
            map.movie.keyframes[2]);

  // Sample 30 is the last of the third stsc chunk; sample 60 the last of the
  // sixth.
  int64_t expected = mp4.mdat_data_pos;
  for (int i = 0; i < 29; ++i) {
    expected += 1000 + 37 * i;
  }
  EXPECT_EQ(expected, map.movie.keyframes[1].byte_offset);

  // ftyp, mdat header, mdat payload, moov.
  ASSERT_EQ(4u, map.regions.size());
  EXPECT_EQ(ByteRange(0, 24), map.regions[0].range);
  EXPECT_EQ(FourCC("ftyp"), map.regions[0].box_type);
  EXPECT_EQ(ByteRange(mp4.mdat_pos, mp4.mdat_data_pos), map.regions[1].range);
  EXPECT_EQ(RegionKind::kMetadata, map.regions[1].kind);
  EXPECT_EQ(ByteRange(mp4.mdat_data_pos, mp4.mdat_end), map.regions[2].range);
  EXPECT_EQ(RegionKind::kPayload, map.regions[2].kind);
  EXPECT_EQ(ByteRange(mp4.moov_pos, mp4.moov_end), map.regions[3].range);
  EXPECT_EQ(FourCC("moov"), map.regions[3].box_type);

  EXPECT_EQ(mp4.mdat_data_pos, map.single_payload_pos);
  EXPECT_EQ(mp4.moov_pos, map.moov_pos);
  EXPECT_EQ(mp4.data.substr(mp4.moov_pos), map.moov);
  EXPECT_EQ(1u, map.payload_regions().size());
  EXPECT_EQ(3u, map.metadata_regions().size());
}

TEST_F(IsobmffTest, NoStssMeansEveryFrameIsAKeyframe) {
  TestMp4Options options;
  options.sample_sizes = VaryingSizes(25);
  options.write_stss = false;
  TestMp4 mp4 = MakeTestMp4(options);

  StructureMap map = Extract(mp4.data);
  ASSERT_TRUE(map.is_container);
  EXPECT_TRUE(map.movie.all_frames_are_keyframes);
  ASSERT_EQ(25u, map.movie.keyframes.size());
  for (int i = 0; i < 25; ++i) {
    EXPECT_EQ(mp4.sample_offsets[i], map.movie.keyframes[i].byte_offset);
    EXPECT_EQ(i + 1, map.movie.keyframes[i].frame_number);
  }
}

TEST_F(IsobmffTest, Co64AudioAndUniformSizes) {
  TestMp4Options options;
  options.sample_sizes = std::vector<uint32_t>(35, 2000);
  options.uniform_stsz = true;
  options.use_co64 = true;
  options.audio_track = true;
  options.moov_first = true;
  options.free_box = true;
  options.sync_samples = {1, 11, 21, 31};
  TestMp4 mp4 = MakeTestMp4(options);

  StructureMap map = Extract(mp4.data);
  ASSERT_TRUE(map.is_container);
  ASSERT_EQ(4u, map.movie.keyframes.size());
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(mp4.sample_offsets[10 * i], map.movie.keyframes[i].byte_offset);
    EXPECT_EQ(2000, map.movie.keyframes[i].size);
  }

  // ftyp, free, moov, mdat header, payload.
  ASSERT_EQ(5u, map.regions.size());
  EXPECT_EQ(FourCC("free"), map.regions[1].box_type);
  EXPECT_EQ(FourCC("moov"), map.regions[2].box_type);
  EXPECT_EQ(ByteRange(mp4.mdat_data_pos, mp4.mdat_end), map.regions[4].range);
}

TEST_F(IsobmffTest, NonContainerIsPassedThrough) {
  StructureMap map = Extract(RandomBytes(5000, 1));
  EXPECT_FALSE(map.is_container);
  ASSERT_EQ(1u, map.regions.size());
  EXPECT_EQ(ByteRange(0, 5000), map.regions[0].range);
  EXPECT_EQ(RegionKind::kPayload, map.regions[0].kind);
  EXPECT_TRUE(map.movie.keyframes.empty());

  EXPECT_TRUE(Extract("").regions.empty());
  EXPECT_EQ(1u, Extract("tiny").regions.size());
}

TEST_F(IsobmffTest, MalformedContainerDegrades) {
  TestMp4Options options;
  options.sample_sizes = VaryingSizes(30);
  options.sync_samples = {1, 11};
  TestMp4 mp4 = MakeTestMp4(options);

  // Cut the file off partway through moov.
  std::string truncated = mp4.data.substr(0, mp4.moov_pos + 50);
  {
    ScopedMockLog log;
    EXPECT_CALL(log, Log(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(
        log, Log(google::WARNING, _,
                 HasSubstr("unable to parse as ISOBMFF (moov at offset")));
    log.Start();
    StructureMap map = Extract(truncated);
    EXPECT_FALSE(map.is_container);
    ASSERT_EQ(1u, map.regions.size());
    EXPECT_EQ(ByteRange(0, truncated.size()), map.regions[0].range);
    EXPECT_TRUE(map.movie.keyframes.empty());
    EXPECT_TRUE(map.moov.empty());
  }

  // A sync sample number beyond the sample count.
  TestMp4Options bad_options = options;
  bad_options.sync_samples = {1, 31};
  TestMp4 bad = MakeTestMp4(bad_options);
  {
    ScopedMockLog log;
    EXPECT_CALL(log, Log(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(log, Log(google::WARNING, _,
                         HasSubstr("stss entry 1 names sample 31 of 30")));
    log.Start();
    StructureMap map = Extract(bad.data);
    EXPECT_FALSE(map.is_container);
  }
}

TEST_F(IsobmffTest, ChunkOffsetNearInt64MaxDegrades) {
  TestMp4Options options;
  options.sample_sizes = std::vector<uint32_t>(5, 1000);
  options.samples_per_chunk = 5;
  options.use_co64 = true;
  options.sync_samples = {1};
  TestMp4 mp4 = MakeTestMp4(options);

  // Point the only chunk just below INT64_MAX. The entry follows the box
  // header, version/flags, and entry count.
  size_t co64 = mp4.data.find("co64", mp4.moov_pos);
  ASSERT_NE(std::string::npos, co64);
  const uint64_t kOffset = static_cast<uint64_t>(INT64_MAX) - 10;
  StoreU64(kOffset, &mp4.data[co64 + 12]);

  ScopedMockLog log;
  EXPECT_CALL(log, Log(_, _, _)).Times(AnyNumber());
  EXPECT_CALL(log,
              Log(google::WARNING, _,
                  HasSubstr(StrCat("sample 1 at offset ", kOffset,
                                   " with size 1000 is outside the file"))));
  log.Start();
  StructureMap map = Extract(mp4.data);
  EXPECT_FALSE(map.is_container);
  EXPECT_TRUE(map.movie.keyframes.empty());
}

TEST_F(IsobmffTest, MultipleMdatPreventsNormalization) {
  TestMp4Options options;
  options.sample_sizes = VaryingSizes(10);
  TestMp4 mp4 = MakeTestMp4(options);
  std::string data = mp4.data;
  {
    ScopedBox extra(&data, "mdat");
    data.append("more payload");
  }
  StructureMap map = Extract(data);
  ASSERT_TRUE(map.is_container);
  EXPECT_EQ(-1, map.single_payload_pos);
  EXPECT_EQ(2u, map.payload_regions().size());
}

TEST_F(IsobmffTest, IoErrorIsReported) {
  testing::StrictMock<MockFile> file;
  EXPECT_CALL(file, Pread(_, _, 0, _)).WillOnce(Return(EIO));
  StructureMap map;
  std::string error_message;
  EXPECT_FALSE(
      ExtractStructure(&file, 1000, "movie.mp4", &map, &error_message));
  EXPECT_EQ("reading movie.mp4: Input/output error", error_message);
}

TEST(RebaseChunkOffsetsTest, NormalizeAndRestore) {
  TestMp4Options options;
  options.sample_sizes = VaryingSizes(40);
  options.sync_samples = {1, 21};
  TestMp4 mp4 = MakeTestMp4(options);
  const std::string original =
      mp4.data.substr(mp4.moov_pos, mp4.moov_end - mp4.moov_pos);
  std::string moov = original;
  std::string error_message;

  ASSERT_TRUE(RebaseChunkOffsets(-mp4.mdat_data_pos, &moov, &error_message))
      << error_message;
  EXPECT_NE(original, moov);
  EXPECT_EQ(original.size(), moov.size());
  MovieInfo info;
  ASSERT_TRUE(ParseMovie(moov, 0, mp4.data.size(), &info, &error_message))
      << error_message;
  ASSERT_EQ(2u, info.keyframes.size());
  EXPECT_EQ(0, info.keyframes[0].byte_offset);
  EXPECT_EQ(mp4.sample_offsets[20] - mp4.mdat_data_pos,
            info.keyframes[1].byte_offset);

  ASSERT_TRUE(RebaseChunkOffsets(mp4.mdat_data_pos, &moov, &error_message));
  EXPECT_EQ(original, moov);
}

TEST(RebaseChunkOffsetsTest, Errors) {
  TestMp4Options options;
  options.sample_sizes = VaryingSizes(20);
  TestMp4 mp4 = MakeTestMp4(options);
  const std::string original =
      mp4.data.substr(mp4.moov_pos, mp4.moov_end - mp4.moov_pos);
  std::string moov = original;
  std::string error_message;

  EXPECT_FALSE(
      RebaseChunkOffsets(-mp4.mdat_data_pos - 1, &moov, &error_message));
  EXPECT_EQ(StrCat("stco entry 0 offset ", mp4.mdat_data_pos,
                   " would become negative (-1)"),
            error_message);
  EXPECT_EQ(original, moov);

  EXPECT_FALSE(RebaseChunkOffsets(INT64_C(1) << 32, &moov, &error_message));
  EXPECT_EQ(StrCat("stco entry 0 offset ",
                   (INT64_C(1) << 32) + mp4.mdat_data_pos,
                   " overflows 32 bits"),
            error_message);
  EXPECT_EQ(original, moov);

  // co64 has room.
  options.use_co64 = true;
  TestMp4 mp4_64 = MakeTestMp4(options);
  std::string moov64 =
      mp4_64.data.substr(mp4_64.moov_pos, mp4_64.moov_end - mp4_64.moov_pos);
  EXPECT_TRUE(RebaseChunkOffsets(INT64_C(1) << 32, &moov64, &error_message));
}

TEST(MdatHeaderTest, Encoding) {
  EXPECT_EQ(std::string("\x00\x00\x00\x0c" "mdat", 8), EncodeMdatHeader(4));
  EXPECT_EQ(std::string("\x00\x00\x00\x01" "mdat"
                        "\x00\x00\x00\x01\x00\x00\x00\x08",
                        16),
            EncodeMdatHeader(INT64_C(0xfffffff8)));
  EXPECT_EQ(std::string("\xff\xff\xff\xff" "mdat", 8),
            EncodeMdatHeader(INT64_C(0xfffffff7)));
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
