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
// crypto-test.cc: tests of the crypto.h interface.

#include <thread>
#include <unordered_set>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "crypto.h"
#include "string.h"

DECLARE_bool(alsologtostderr);

namespace reelstore {
namespace {

std::string HexDigest(HashAlgorithm algorithm, re2::StringPiece data) {
  return Hasher(algorithm).Hash(data).ToHex();
}

TEST(HasherTest, KnownAnswers) {
  EXPECT_EQ("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824",
            HexDigest(HashAlgorithm::kSha256, "hello"));
  EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
            HexDigest(HashAlgorithm::kSha256, ""));
  EXPECT_EQ("a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a",
            HexDigest(HashAlgorithm::kSha3_256, ""));
  EXPECT_EQ("3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532",
            HexDigest(HashAlgorithm::kSha3_256, "abc"));
  EXPECT_EQ("af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
            HexDigest(HashAlgorithm::kBlake3, ""));
}

TEST(HasherTest, AlgorithmsDisagree) {
  std::unordered_set<std::string> seen;
  for (auto a : {HashAlgorithm::kBlake3, HashAlgorithm::kSha256,
                 HashAlgorithm::kSha3_256}) {
    EXPECT_TRUE(seen.insert(HexDigest(a, "hello")).second)
        << HashAlgorithmName(a);
  }
}

TEST(HasherTest, StreamingMatchesOneShot) {
  std::string data;
  for (int i = 0; i < 100000; ++i) {
    data.push_back(static_cast<char>(i * 7));
  }
  for (auto a : {HashAlgorithm::kBlake3, HashAlgorithm::kSha256,
                 HashAlgorithm::kSha3_256}) {
    Hasher hasher(a);
    auto digest = hasher.NewDigest();
    re2::StringPiece p(data);
    while (!p.empty()) {
      size_t n = std::min(p.size(), size_t(4099));
      digest->Update(p.substr(0, n));
      p.remove_prefix(n);
    }
    EXPECT_EQ(hasher.Hash(data).ToHex(), ToHex(digest->Finalize()))
        << HashAlgorithmName(a);
  }
}

TEST(HasherTest, FactoryChosenPerAlgorithm) {
  EXPECT_EQ(&Digest::BLAKE3, Digest::FactoryFor(HashAlgorithm::kBlake3));
  EXPECT_EQ(&Digest::SHA256, Digest::FactoryFor(HashAlgorithm::kSha256));
  EXPECT_EQ(&Digest::SHA3_256, Digest::FactoryFor(HashAlgorithm::kSha3_256));

  auto digest = Digest::FactoryFor(HashAlgorithm::kSha256)();
  digest->Update("abc");
  EXPECT_EQ(Hasher(HashAlgorithm::kSha256).Hash("abc").ToHex(),
            ToHex(digest->Finalize()));
}

TEST(HasherTest, ConcurrentHashing) {
  Hasher hasher(HashAlgorithm::kBlake3);
  const ContentAddress expected = hasher.Hash("concurrent");
  std::vector<std::thread> threads;
  std::vector<int> ok(8, 0);
  for (int i = 0; i < 8; ++i) {
    threads.push_back(std::thread([&hasher, &expected, &ok, i]() {
      for (int j = 0; j < 100; ++j) {
        ok[i] += hasher.Verify("concurrent", expected);
      }
    }));
  }
  for (auto &t : threads) {
    t.join();
  }
  for (int v : ok) {
    EXPECT_EQ(100, v);
  }
}

TEST(HashAlgorithmTest, Parse) {
  HashAlgorithm a;
  std::string error_message;
  ASSERT_TRUE(ParseHashAlgorithm("BLAKE3", &a, &error_message));
  EXPECT_EQ(HashAlgorithm::kBlake3, a);
  ASSERT_TRUE(ParseHashAlgorithm("sha-256", &a, &error_message));
  EXPECT_EQ(HashAlgorithm::kSha256, a);
  ASSERT_TRUE(ParseHashAlgorithm("SHA3256", &a, &error_message));
  EXPECT_EQ(HashAlgorithm::kSha3_256, a);
  EXPECT_FALSE(ParseHashAlgorithm("md5", &a, &error_message));
  EXPECT_EQ("unknown hash algorithm \"md5\"", error_message);

  for (auto b : {HashAlgorithm::kBlake3, HashAlgorithm::kSha256,
                 HashAlgorithm::kSha3_256}) {
    ASSERT_TRUE(ParseHashAlgorithm(HashAlgorithmName(b), &a, &error_message));
    EXPECT_EQ(b, a);
  }
}

TEST(ContentAddressTest, HexAndOrdering) {
  ContentAddress a;
  const std::string hex(
      "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff");
  ASSERT_TRUE(ContentAddress::FromHex(hex, &a));
  EXPECT_EQ(hex, a.ToHex());
  EXPECT_EQ(ContentAddress::kSize, a.as_piece().size());

  ContentAddress b;
  EXPECT_FALSE(ContentAddress::FromHex("0011", &b));
  EXPECT_FALSE(ContentAddress::FromHex(std::string(64, 'z'), &b));
  EXPECT_FALSE(ContentAddress::FromBytes("short", &b));

  EXPECT_TRUE(b < a || b == a);  // all zeros
  EXPECT_TRUE(ContentAddress() == b);
  EXPECT_NE(a, b);
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
