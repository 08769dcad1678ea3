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
// slices-test.cc: tests of the slices.h interface.

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "slices.h"
#include "string.h"

DECLARE_bool(alsologtostderr);

using testing::_;
using testing::AnyNumber;
using testing::DoAll;
using testing::Return;
using testing::SetArgPointee;

namespace reelstore {
namespace {

class MockFileSlice : public FileSlice {
 public:
  MOCK_CONST_METHOD0(size, int64_t());
  MOCK_CONST_METHOD3(AddRange, int64_t(ByteRange, EvBuffer *, std::string *));
};

class FileSlicesTest : public testing::Test {
 protected:
  FileSlicesTest() {
    EXPECT_CALL(a_, size()).Times(AnyNumber()).WillRepeatedly(Return(5));
    EXPECT_CALL(b_, size()).Times(AnyNumber()).WillRepeatedly(Return(13));
    EXPECT_CALL(c_, size()).Times(AnyNumber()).WillRepeatedly(Return(7));
    EXPECT_CALL(d_, size()).Times(AnyNumber()).WillRepeatedly(Return(17));
    EXPECT_CALL(e_, size()).Times(AnyNumber()).WillRepeatedly(Return(19));

    slices_.Append(&a_);
    slices_.Append(&b_);
    slices_.Append(&c_);
    slices_.Append(&d_);
    slices_.Append(&e_);
  }

  FileSlices slices_;
  testing::StrictMock<MockFileSlice> a_;
  testing::StrictMock<MockFileSlice> b_;
  testing::StrictMock<MockFileSlice> c_;
  testing::StrictMock<MockFileSlice> d_;
  testing::StrictMock<MockFileSlice> e_;
};

TEST_F(FileSlicesTest, Size) {
  EXPECT_EQ(5 + 13 + 7 + 17 + 19, slices_.size());
}

TEST_F(FileSlicesTest, ExactSlice) {
  // Exactly slice b.
  std::string error_message;
  EXPECT_CALL(b_, AddRange(ByteRange(0, 13), _, _)).WillOnce(Return(13));
  EXPECT_EQ(13, slices_.AddRange(ByteRange(5, 18), nullptr, &error_message))
      << error_message;
}

TEST_F(FileSlicesTest, Offset) {
  // Part of slice b, all of slice c, and part of slice d.
  std::string error_message;
  EXPECT_CALL(b_, AddRange(ByteRange(12, 13), _, _)).WillOnce(Return(1));
  EXPECT_CALL(c_, AddRange(ByteRange(0, 7), _, _)).WillOnce(Return(7));
  EXPECT_CALL(d_, AddRange(ByteRange(0, 1), _, _)).WillOnce(Return(1));
  EXPECT_EQ(9, slices_.AddRange(ByteRange(17, 26), nullptr, &error_message))
      << error_message;
}

TEST_F(FileSlicesTest, Everything) {
  std::string error_message;
  EXPECT_CALL(a_, AddRange(ByteRange(0, 5), _, _)).WillOnce(Return(5));
  EXPECT_CALL(b_, AddRange(ByteRange(0, 13), _, _)).WillOnce(Return(13));
  EXPECT_CALL(c_, AddRange(ByteRange(0, 7), _, _)).WillOnce(Return(7));
  EXPECT_CALL(d_, AddRange(ByteRange(0, 17), _, _)).WillOnce(Return(17));
  EXPECT_CALL(e_, AddRange(ByteRange(0, 19), _, _)).WillOnce(Return(19));
  EXPECT_EQ(61, slices_.AddRange(ByteRange(0, 61), nullptr, &error_message))
      << error_message;
}

TEST_F(FileSlicesTest, PartialOnLaterError) {
  std::string error_message;
  EXPECT_CALL(a_, AddRange(ByteRange(0, 5), _, _)).WillOnce(Return(5));
  EXPECT_CALL(b_, AddRange(ByteRange(0, 13), _, _))
      .WillOnce(DoAll(SetArgPointee<2>("asdf"), Return(-1)));
  EXPECT_EQ(5, slices_.AddRange(ByteRange(0, 61), nullptr, &error_message));
  EXPECT_EQ("asdf", error_message);
}

TEST_F(FileSlicesTest, PropagateError) {
  std::string error_message;
  EXPECT_CALL(b_, AddRange(ByteRange(0, 13), _, _))
      .WillOnce(DoAll(SetArgPointee<2>("asdf"), Return(-1)));
  EXPECT_EQ(-1, slices_.AddRange(ByteRange(5, 61), nullptr, &error_message));
  EXPECT_EQ("asdf", error_message);
}

TEST_F(FileSlicesTest, InvalidRange) {
  std::string error_message;
  EXPECT_EQ(-1, slices_.AddRange(ByteRange(0, 62), nullptr, &error_message));
  EXPECT_EQ("Range [0, 62) not valid for file of size 61", error_message);
}

TEST_F(FileSlicesTest, FindSlice) {
  EXPECT_EQ(-1, slices_.FindSlice(-1));
  EXPECT_EQ(0, slices_.FindSlice(0));
  EXPECT_EQ(0, slices_.FindSlice(4));
  EXPECT_EQ(1, slices_.FindSlice(5));
  EXPECT_EQ(4, slices_.FindSlice(60));
  EXPECT_EQ(-1, slices_.FindSlice(61));
  EXPECT_EQ(ByteRange(18, 25), slices_.slice_range(2));
}

TEST(ReadSliceRangeTest, LazySlicesAreReadOneAtATime) {
  int fills = 0;
  FillerFileSlice a;
  a.Init(3, [&fills](std::string *s, std::string *) {
    ++fills;
    s->append("abc");
    return true;
  });
  StringPieceSlice b("defg");
  FillerFileSlice c;
  c.Init(2, [&fills](std::string *s, std::string *) {
    ++fills;
    s->append("hi");
    return true;
  });
  FileSlices slices;
  slices.Append(&a, FileSlices::kLazy);
  slices.Append(&b);
  slices.Append(&c, FileSlices::kLazy);

  EvBuffer buf;
  std::string error_message;
  EXPECT_EQ(7, slices.AddRange(ByteRange(0, 9), &buf, &error_message));
  EXPECT_EQ(7u, buf.size());
  EXPECT_EQ(1, fills);

  std::string out;
  ASSERT_TRUE(ReadSliceRange(slices, ByteRange(1, 9), &out, &error_message))
      << error_message;
  EXPECT_EQ("bcdefghi", out);
  EXPECT_EQ(3, fills);

  ASSERT_TRUE(ReadSliceRange(slices, ByteRange(4, 4), &out, &error_message));
  EXPECT_EQ("", out);
}

TEST(ReadSliceRangeTest, FillErrors) {
  FillerFileSlice bad;
  bad.Init(4, [](std::string *s, std::string *error_message) {
    *error_message = "chunk unavailable";
    return false;
  });
  FillerFileSlice wrong_size;
  wrong_size.Init(4, [](std::string *s, std::string *) {
    s->append("toolong");
    return true;
  });
  std::string out;
  std::string error_message;
  EXPECT_FALSE(ReadSliceRange(bad, ByteRange(0, 4), &out, &error_message));
  EXPECT_EQ("chunk unavailable", error_message);
  EXPECT_FALSE(
      ReadSliceRange(wrong_size, ByteRange(0, 4), &out, &error_message));
  EXPECT_EQ("Expected filled slice to be 4 bytes; got 7 bytes.",
            error_message);
  EXPECT_FALSE(ReadSliceRange(bad, ByteRange(2, 5), &out, &error_message));
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
