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
// coding-test.cc: tests of the coding.h interface.

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "coding.h"

DECLARE_bool(alsologtostderr);

namespace reelstore {
namespace {

TEST(VarintTest, Simple) {
  // Encode.
  std::string foo;
  AppendVar64(UINT64_C(1), &foo);
  EXPECT_EQ("\x01", foo);
  AppendVar64(UINT64_C(300), &foo);
  EXPECT_EQ("\x01\xac\x02", foo);

  // Decode.
  re2::StringPiece p(foo);
  uint64_t out;
  std::string error_message;
  EXPECT_TRUE(DecodeVar64(&p, &out, &error_message));
  EXPECT_EQ(UINT64_C(1), out);
  EXPECT_TRUE(DecodeVar64(&p, &out, &error_message));
  EXPECT_EQ(UINT64_C(300), out);
  EXPECT_EQ(0, p.size());
}

TEST(VarintTest, LargeValues) {
  std::string error_message;
  const uint64_t kToDecode[]{
      UINT64_C(1) << 35,
      UINT64_C(0x123456789abcdef0),
      std::numeric_limits<uint64_t>::max(),
  };
  for (auto in : kToDecode) {
    std::string foo;
    AppendVar64(in, &foo);
    foo.append(3, 0);
    re2::StringPiece p(foo);
    uint64_t out;
    ASSERT_TRUE(DecodeVar64(&p, &out, &error_message)) << error_message;
    EXPECT_EQ(in, out);
    EXPECT_EQ(3, p.size());
  }

  std::string max;
  AppendVar64(std::numeric_limits<uint64_t>::max(), &max);
  EXPECT_EQ(10, max.size());
}

TEST(VarintTest, DecodeErrors) {
  uint64_t out;
  std::string error_message;

  for (auto input :
       {re2::StringPiece("", 0), re2::StringPiece("\x80", 1),
        re2::StringPiece("\x80\x80", 2), re2::StringPiece("\x80\x80\x80", 3),
        re2::StringPiece("\x80\x80\x80\x80", 4)}) {
    EXPECT_FALSE(DecodeVar64(&input, &out, &error_message)) << "input: "
                                                            << input;
    EXPECT_EQ("buffer underrun", error_message);
  }

  re2::StringPiece too_big("\xff\xff\xff\xff\xff\xff\xff\xff\xff\x02", 10);
  EXPECT_FALSE(DecodeVar64(&too_big, &out, &error_message));
  EXPECT_EQ("integer overflow", error_message);

  re2::StringPiece too_long("\x80\x80\x80\x80\x80\x80\x80\x80\x80\x80\x01",
                            11);
  EXPECT_FALSE(DecodeVar64(&too_long, &out, &error_message));
  EXPECT_EQ("integer overflow", error_message);
}

TEST(LengthPrefixedTest, Simple) {
  std::string buf;
  AppendLengthPrefixed("hello", &buf);
  AppendLengthPrefixed("", &buf);
  re2::StringPiece in(buf);
  re2::StringPiece out;
  std::string error_message;
  ASSERT_TRUE(DecodeLengthPrefixed(&in, &out, &error_message));
  EXPECT_EQ("hello", out);
  ASSERT_TRUE(DecodeLengthPrefixed(&in, &out, &error_message));
  EXPECT_EQ("", out);
  EXPECT_TRUE(in.empty());

  re2::StringPiece truncated("\x05hel", 4);
  EXPECT_FALSE(DecodeLengthPrefixed(&truncated, &out, &error_message));
  EXPECT_EQ("buffer underrun", error_message);
}

TEST(BigEndianTest, AppendAndLoad) {
  std::string buf;
  AppendU16(0x1234, &buf);
  AppendU32(UINT32_C(0xdeadbeef), &buf);
  AppendU64(UINT64_C(0x0102030405060708), &buf);
  EXPECT_EQ(std::string("\x12\x34\xde\xad\xbe\xef\x01\x02\x03\x04\x05\x06\x07"
                        "\x08", 14),
            buf);
  EXPECT_EQ(0x1234, LoadU16(&buf[0]));
  EXPECT_EQ(UINT32_C(0xdeadbeef), LoadU32(&buf[2]));
  EXPECT_EQ(UINT64_C(0x0102030405060708), LoadU64(&buf[6]));
}

TEST(BigEndianTest, StoreInPlace) {
  std::string buf(12, '\0');
  StoreU32(UINT32_C(0x00000100), &buf[0]);
  StoreU64(UINT64_C(0x100000000), &buf[4]);
  EXPECT_EQ(std::string("\x00\x00\x01\x00\x00\x00\x00\x01\x00\x00\x00\x00", 12),
            buf);
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
