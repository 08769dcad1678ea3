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
// string-test.cc: tests of the string.h interface.

#include <limits>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "string.h"

DECLARE_bool(alsologtostderr);

namespace reelstore {
namespace {

TEST(StrCatTest, Simple) {
  EXPECT_EQ("foo", StrCat("foo"));
  EXPECT_EQ("foobar", StrCat("foo", "bar"));
  EXPECT_EQ("foo", StrCat(std::string("foo")));

  EXPECT_EQ("42", StrCat(uint64_t(42)));
  EXPECT_EQ("0", StrCat(uint64_t(0)));
  EXPECT_EQ("18446744073709551615",
            StrCat(std::numeric_limits<uint64_t>::max()));

  EXPECT_EQ("42", StrCat(int64_t(42)));
  EXPECT_EQ("0", StrCat(int64_t(0)));
  EXPECT_EQ("-9223372036854775808",
            StrCat(std::numeric_limits<int64_t>::min()));
  EXPECT_EQ("9223372036854775807", StrCat(std::numeric_limits<int64_t>::max()));
}

TEST(JoinTest, Simple) {
  EXPECT_EQ("", Join(std::initializer_list<std::string>(), ","));
  EXPECT_EQ("a", Join(std::initializer_list<std::string>({"a"}), ","));
  EXPECT_EQ("a,b", Join(std::initializer_list<const char *>({"a", "b"}), ","));
  EXPECT_EQ(
      "a,b,c",
      Join(std::initializer_list<re2::StringPiece>({"a", "b", "c"}), ","));
}

TEST(ToHexTest, Simple) {
  EXPECT_EQ("", ToHex("", false));
  EXPECT_EQ("", ToHex("", true));
  EXPECT_EQ("1234deadbeef", ToHex("\x12\x34\xde\xad\xbe\xef", false));
  EXPECT_EQ("12 34 de ad be ef", ToHex("\x12\x34\xde\xad\xbe\xef", true));
}

TEST(FromHexTest, Simple) {
  std::string out;
  EXPECT_TRUE(FromHex("", &out));
  EXPECT_EQ("", out);
  EXPECT_TRUE(FromHex("1234deadBEEF", &out));
  EXPECT_EQ("\x12\x34\xde\xad\xbe\xef", out);

  EXPECT_FALSE(FromHex("123", &out));
  EXPECT_FALSE(FromHex("zz", &out));
  EXPECT_FALSE(FromHex("0g", &out));
}

TEST(AsciiToLowerTest, Simple) {
  EXPECT_EQ("sha3-256", AsciiToLower("SHA3-256"));
  EXPECT_EQ("blake3", AsciiToLower("blake3"));
}

TEST(HumanizeTest, Simple) {
  EXPECT_EQ("1.0 B", HumanizeWithBinaryPrefix(1.f, "B"));
  EXPECT_EQ("1.0 KiB", HumanizeWithBinaryPrefix(UINT64_C(1) << 10, "B"));
  EXPECT_EQ("1.0 EiB", HumanizeWithBinaryPrefix(UINT64_C(1) << 60, "B"));
  EXPECT_EQ("1.5 EiB", HumanizeWithBinaryPrefix(
                           (UINT64_C(1) << 60) + (UINT64_C(1) << 59), "B"));
}

TEST(ParseByteSizeTest, Suffixes) {
  int64_t v = -1;
  EXPECT_TRUE(ParseByteSize("4096", &v));
  EXPECT_EQ(4096, v);
  EXPECT_TRUE(ParseByteSize("64K", &v));
  EXPECT_EQ(64 << 10, v);
  EXPECT_TRUE(ParseByteSize("64KiB", &v));
  EXPECT_EQ(64 << 10, v);
  EXPECT_TRUE(ParseByteSize("8m", &v));
  EXPECT_EQ(8 << 20, v);
  EXPECT_TRUE(ParseByteSize("1G", &v));
  EXPECT_EQ(INT64_C(1) << 30, v);
}

TEST(ParseByteSizeTest, Errors) {
  int64_t v;
  EXPECT_FALSE(ParseByteSize("", &v));
  EXPECT_FALSE(ParseByteSize("-1", &v));
  EXPECT_FALSE(ParseByteSize("12Q", &v));
  EXPECT_FALSE(ParseByteSize("K", &v));
  EXPECT_FALSE(ParseByteSize("9223372036854775807G", &v));
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
