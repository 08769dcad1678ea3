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
// chunker-test.cc: tests of the chunker.h, reader.h, and gear.h interfaces.

#include <errno.h>
#include <fcntl.h>
#include <string.h>

#include <algorithm>
#include <set>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "chunker.h"
#include "crypto.h"
#include "gear.h"
#include "reader.h"
#include "string.h"
#include "testutil.h"

DECLARE_bool(alsologtostderr);

using testing::_;
using testing::ElementsAre;
using testing::Return;

namespace reelstore {
namespace {

// Ends of each chunk, the form used by the boundary properties.
std::vector<int64_t> Ends(const std::vector<ByteRange> &ranges) {
  std::vector<int64_t> out;
  for (const auto &r : ranges) {
    out.push_back(r.end);
  }
  return out;
}

// Reads |data| a few bytes at a time to exercise the chunker's buffering.
class TrickleReader : public ByteReader {
 public:
  explicit TrickleReader(re2::StringPiece data) : data_(data) {}

  int64_t Read(char *buf, size_t size, std::string *) final {
    size_t n = std::min(std::min(size, data_.size()), next_size_);
    next_size_ = next_size_ % 4093 + 1;
    memcpy(buf, data_.data(), n);
    data_.remove_prefix(n);
    return n;
  }

 private:
  re2::StringPiece data_;
  size_t next_size_ = 1;
};

class FailingReader : public ByteReader {
 public:
  int64_t Read(char *, size_t, std::string *error_message) final {
    *error_message = "disk on fire";
    return -1;
  }
};

std::vector<ByteRange> ChunkStream(const ChunkerConfig &config,
                                   ByteReader *reader) {
  Chunker chunker(config, reader);
  std::vector<ByteRange> out;
  Chunk chunk;
  std::string error_message;
  while (chunker.Next(&chunk, &error_message)) {
    out.emplace_back(chunk.offset, chunk.offset + chunk.data.size());
  }
  CHECK(error_message.empty()) << error_message;
  return out;
}

TEST(GearTest, TableMatchesGenerator) {
  for (int i = 0; i < 256; ++i) {
    ASSERT_EQ(kGearTable[i], GenerateGearEntry(i)) << "entry " << i;
  }
}

TEST(GearTest, WindowIsSixtyFourBytes) {
  std::string a = RandomBytes(200, 1);
  std::string b = RandomBytes(100, 2) + a.substr(100);
  GearHash ha;
  GearHash hb;
  for (size_t i = 0; i < a.size(); ++i) {
    ha.Roll(a[i]);
    hb.Roll(b[i]);
    if (i >= 163) {
      EXPECT_EQ(ha.value(), hb.value()) << i;
    }
  }
}

TEST(ChunkerConfigTest, Validate) {
  std::string error_message;
  EXPECT_TRUE(ValidateChunkerConfig(ChunkerConfig::Default(), &error_message));
  EXPECT_TRUE(ValidateChunkerConfig(ChunkerConfig::Video(), &error_message));
  EXPECT_TRUE(ValidateChunkerConfig(ChunkerConfig::Small(), &error_message));
  EXPECT_TRUE(
      ValidateChunkerConfig(ChunkerConfig(64, 64, 64, 0), &error_message));

  EXPECT_FALSE(
      ValidateChunkerConfig(ChunkerConfig(63, 64, 128, 0), &error_message));
  EXPECT_EQ("min_size 63 is below the limit of 64", error_message);
  EXPECT_FALSE(ValidateChunkerConfig(ChunkerConfig(4096, 1024, 8192, 2),
                                     &error_message));
  EXPECT_THAT(error_message, testing::HasSubstr("min <= avg <= max"));
  EXPECT_FALSE(ValidateChunkerConfig(
      ChunkerConfig(4096, 8192, (1u << 30) + 1, 2), &error_message));
  EXPECT_FALSE(
      ValidateChunkerConfig(ChunkerConfig(64, 1024, 8192, 4), &error_message));
  EXPECT_FALSE(
      ValidateChunkerConfig(ChunkerConfig(64, 1024, 8192, -1), &error_message));
}

TEST(ChunkerConfigTest, Profiles) {
  ChunkerConfig config;
  std::string error_message;
  ASSERT_TRUE(ParseChunkingProfile("Video", &config, &error_message));
  EXPECT_EQ(ChunkerConfig(2 << 20, 8 << 20, 16 << 20, 2), config);
  ASSERT_TRUE(ParseChunkingProfile("small", &config, &error_message));
  EXPECT_EQ(ChunkerConfig(16 << 10, 64 << 10, 256 << 10, 2), config);
  ASSERT_TRUE(ParseChunkingProfile("default", &config, &error_message));
  EXPECT_EQ(ChunkerConfig(256 << 10, 1 << 20, 4 << 20, 2), config);
  EXPECT_FALSE(ParseChunkingProfile("huge", &config, &error_message));
  EXPECT_EQ("unknown chunking profile \"huge\"", error_message);
}

TEST(BoundaryFinderTest, Masks) {
  BoundaryFinder finder(ChunkerConfig::Small());  // log2(64 KiB) = 16.
  EXPECT_EQ(~UINT64_C(0) << (64 - 18), finder.mask_s());
  EXPECT_EQ(~UINT64_C(0) << (64 - 14), finder.mask_l());

  BoundaryFinder unnormalized(ChunkerConfig(64, 4096, 8192, 0));
  EXPECT_EQ(unnormalized.mask_s(), unnormalized.mask_l());
}

TEST(BoundaryFinderTest, GoldenBoundaries) {
  // These pin the gear table and cut rules; a change here breaks
  // deduplication against existing stores.
  std::string data = RandomBytes(2 << 20, 42);
  auto small = Ends(ChunkBuffer(ChunkerConfig::Small(), data));
  ASSERT_GE(small.size(), 4u);
  EXPECT_THAT(std::vector<int64_t>(small.begin(), small.begin() + 4),
              ElementsAre(73563, 154311, 247318, 324198));
  EXPECT_THAT(Ends(ChunkBuffer(ChunkerConfig::Default(), data)),
              ElementsAre(630779, 1653162, 2097152));
}

TEST(BoundaryFinderTest, SizeBounds) {
  const ChunkerConfig config = ChunkerConfig::Small();
  std::string data = RandomBytes(3 << 20, 5);
  auto ranges = ChunkBuffer(config, data);
  ASSERT_FALSE(ranges.empty());
  int64_t pos = 0;
  for (size_t i = 0; i < ranges.size(); ++i) {
    EXPECT_EQ(pos, ranges[i].begin);
    EXPECT_LE(ranges[i].size(), config.max_size);
    if (i + 1 < ranges.size()) {
      EXPECT_GT(ranges[i].size(), config.min_size);
    }
    pos = ranges[i].end;
  }
  EXPECT_EQ(static_cast<int64_t>(data.size()), pos);
}

TEST(BoundaryFinderTest, EdgeSizes) {
  const ChunkerConfig config = ChunkerConfig::Small();
  EXPECT_TRUE(ChunkBuffer(config, "").empty());
  EXPECT_THAT(ChunkBuffer(config, "x"), ElementsAre(ByteRange(0, 1)));
  std::string at_min(config.min_size, 'a');
  EXPECT_THAT(ChunkBuffer(config, at_min),
              ElementsAre(ByteRange(0, config.min_size)));

  // Zeros never satisfy either mask, so cuts fall at max_size.
  std::string zeros(config.max_size + 1, '\0');
  EXPECT_THAT(ChunkBuffer(config, zeros),
              ElementsAre(ByteRange(0, config.max_size),
                          ByteRange(config.max_size, config.max_size + 1)));
}

TEST(ChunkerTest, TenMebibytesOfZeros) {
  std::string zeros(10 << 20, '\0');
  StringReader r1(zeros);
  auto first = ChunkStream(ChunkerConfig::Small(), &r1);
  EXPECT_GE(first.size(), 40u);
  EXPECT_LE(first.size(), 640u);
  StringReader r2(zeros);
  EXPECT_EQ(first, ChunkStream(ChunkerConfig::Small(), &r2));
}

TEST(ChunkerTest, StreamingMatchesBuffer) {
  std::string data = RandomBytes(3 << 20, 9);
  auto expected = ChunkBuffer(ChunkerConfig::Small(), data);
  StringReader whole(data);
  EXPECT_EQ(expected, ChunkStream(ChunkerConfig::Small(), &whole));
  TrickleReader trickle(data);
  EXPECT_EQ(expected, ChunkStream(ChunkerConfig::Small(), &trickle));
}

TEST(ChunkerTest, ChunkDataMatchesInput) {
  std::string data = RandomBytes(700000, 3);
  StringReader reader(data);
  Chunker chunker(ChunkerConfig::Small(), &reader);
  Chunk chunk;
  std::string error_message;
  std::string rebuilt;
  while (chunker.Next(&chunk, &error_message)) {
    EXPECT_EQ(static_cast<int64_t>(rebuilt.size()), chunk.offset);
    rebuilt.append(chunk.data);
  }
  EXPECT_EQ("", error_message);
  EXPECT_TRUE(rebuilt == data);
  EXPECT_EQ(static_cast<int64_t>(data.size()), chunker.bytes_consumed());
}

TEST(ChunkerTest, ReadErrorIsReported) {
  FailingReader reader;
  Chunker chunker(ChunkerConfig::Small(), &reader);
  Chunk chunk;
  std::string error_message;
  EXPECT_FALSE(chunker.Next(&chunk, &error_message));
  EXPECT_EQ("disk on fire", error_message);
}

void ExpectShiftResistant(const std::string &x, const std::string &x2,
                          int64_t pos, int64_t shift) {
  const ChunkerConfig config = ChunkerConfig::Small();
  auto before = Ends(ChunkBuffer(config, x));
  auto after = Ends(ChunkBuffer(config, x2));
  std::set<int64_t> after_set(after.begin(), after.end());
  for (int64_t b : before) {
    if (b <= pos) {
      EXPECT_EQ(1u, after_set.count(b)) << "boundary " << b;
    } else if (b > pos + static_cast<int64_t>(config.max_size)) {
      EXPECT_EQ(1u, after_set.count(b + shift)) << "boundary " << b;
    }
  }
}

TEST(ChunkerTest, ShiftResistance) {
  std::string x = RandomBytes(2 << 20, 42);

  const int64_t kInsertAt = 700000;
  std::string inserted = RandomBytes(5000, 43);
  std::string x_ins = x.substr(0, kInsertAt) + inserted + x.substr(kInsertAt);
  ExpectShiftResistant(x, x_ins, kInsertAt, inserted.size());

  const int64_t kDeleteAt = 1000000;
  std::string x_del = x.substr(0, kDeleteAt) + x.substr(kDeleteAt + 777);
  ExpectShiftResistant(x, x_del, kDeleteAt, -777);
}

TEST(ReaderTest, DigestingReaderHashesEverything) {
  std::string data = RandomBytes(100000, 11);
  StringReader inner(data);
  Hasher hasher(HashAlgorithm::kBlake3);
  auto digest = hasher.NewDigest();
  DigestingReader reader(&inner, digest.get());
  char buf[3000];
  std::string error_message;
  while (reader.Read(buf, sizeof(buf), &error_message) > 0) {
  }
  EXPECT_EQ(static_cast<int64_t>(data.size()), reader.bytes_read());
  EXPECT_EQ(hasher.Hash(data).ToHex(), ToHex(digest->Finalize()));
}

TEST(ReaderTest, FileRangeReaderErrors) {
  testing::StrictMock<MockFile> file;
  EXPECT_CALL(file, Pread(_, 10, 5, _)).WillOnce(Return(EIO));
  FileRangeReader reader(&file, ByteRange(5, 15));
  char buf[10];
  std::string error_message;
  EXPECT_EQ(-1, reader.Read(buf, sizeof(buf), &error_message));
  EXPECT_EQ("pread at offset 5: Input/output error", error_message);

  testing::StrictMock<MockFile> short_file;
  EXPECT_CALL(short_file, Pread(_, 10, 0, _))
      .WillOnce(testing::DoAll(testing::SetArgPointee<3>(0), Return(0)));
  FileRangeReader short_reader(&short_file, ByteRange(0, 10));
  EXPECT_EQ(-1, short_reader.Read(buf, sizeof(buf), &error_message));
  EXPECT_EQ("unexpected end of file at offset 0; expected 10 more bytes",
            error_message);
}

TEST(ReaderTest, FileRangeReaderStopsAtEnd) {
  std::string dir = PrepareTempDirOrDie("chunker-reader");
  std::string path = StrCat(dir, "/f");
  WriteFileOrDie(path, "0123456789");
  std::unique_ptr<File> f;
  ASSERT_EQ(0, GetRealFilesystem()->Open(path.c_str(), O_RDONLY, &f));
  FileRangeReader reader(f.get(), ByteRange(2, 7));
  char buf[16];
  std::string error_message;
  ASSERT_EQ(5, reader.Read(buf, sizeof(buf), &error_message));
  EXPECT_EQ("23456", std::string(buf, 5));
  EXPECT_EQ(0, reader.Read(buf, sizeof(buf), &error_message));
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
