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
// chunk-store-test.cc: tests of the chunk-store.h interface.

#include <dirent.h>
#include <string.h>
#include <sys/stat.h>

#include <map>
#include <random>
#include <set>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "chunk-store.h"
#include "string.h"
#include "testutil.h"

DECLARE_bool(alsologtostderr);

using testing::_;
using testing::AnyNumber;
using testing::DoAll;
using testing::HasSubstr;
using testing::InSequence;
using testing::Return;
using testing::SetArgPointee;

namespace reelstore {
namespace {

const time_t kStartSec = 1000000;

class MockChunkSource : public ChunkSource {
 public:
  MOCK_CONST_METHOD0(name, std::string());
  MOCK_METHOD3(Fetch, ErrorKind(const ContentAddress &, std::string *,
                                std::string *));
};

// Manifest references and checkpoint storage kept in memory.
class FakeCatalog : public GcCatalog {
 public:
  bool FindReference(const ContentAddress &address, std::string *manifest_id,
                     std::string *error_message) final {
    auto it = references.find(address);
    if (it == references.end()) {
      manifest_id->clear();
    } else {
      *manifest_id = it->second;
    }
    return true;
  }

  bool LoadGcCheckpoint(GcCheckpoint *checkpoint, bool *found,
                        std::string *error_message) final {
    *found = has_checkpoint;
    if (has_checkpoint) {
      *checkpoint = this->checkpoint;
    }
    return true;
  }

  bool SaveGcCheckpoint(const GcCheckpoint &checkpoint,
                        std::string *error_message) final {
    has_checkpoint = true;
    this->checkpoint = checkpoint;
    ++saves;
    if (shutdown_on_save != nullptr) {
      shutdown_on_save->Shutdown();
    }
    return true;
  }

  bool ClearGcCheckpoint(std::string *error_message) final {
    has_checkpoint = false;
    return true;
  }

  std::map<ContentAddress, std::string> references;
  bool has_checkpoint = false;
  GcCheckpoint checkpoint;
  int saves = 0;
  ShutdownSignal *shutdown_on_save = nullptr;
};

std::vector<std::string> ListDir(const std::string &path) {
  std::vector<std::string> names;
  std::string error_message;
  CHECK(GetRealFilesystem()->DirForEach(
      path.c_str(),
      [&names](const dirent *ent) {
        if (ent->d_name[0] != '.') {
          names.push_back(ent->d_name);
        }
        return IterationControl::kContinue;
      },
      &error_message))
      << error_message;
  return names;
}

bool FileExists(const std::string &path) {
  struct stat buf;
  return stat(path.c_str(), &buf) == 0;
}

class ChunkStoreTest : public testing::Test {
 protected:
  ChunkStoreTest()
      : clock_(kStartSec),
        hasher_(HashAlgorithm::kBlake3),
        store_(GetRealFilesystem(), &clock_, &hasher_) {}

  void SetUp() override {
    tmpdir_ = PrepareTempDirOrDie("chunk-store");
    std::string error_message;
    ASSERT_TRUE(store_.Open(tmpdir_ + "/store", true, &error_message))
        << error_message;
  }

  ContentAddress PutOrDie(re2::StringPiece data) {
    ContentAddress address;
    std::string error_message;
    CHECK(store_.Put(data, &address, &error_message) == ErrorKind::kOk)
        << error_message;
    return address;
  }

  int64_t Refcount(const ContentAddress &address) {
    int64_t refcount;
    std::string error_message;
    CHECK(store_.GetRefcount(address, &refcount, &error_message) ==
          ErrorKind::kOk)
        << error_message;
    return refcount;
  }

  std::string tmpdir_;
  SimulatedClock clock_;
  Hasher hasher_;
  ChunkStore store_;
};

TEST_F(ChunkStoreTest, PutAndGet) {
  ContentAddress address = PutOrDie("hello");
  EXPECT_EQ(hasher_.Hash("hello"), address);
  EXPECT_EQ(1, Refcount(address));

  std::string path = store_.ChunkPath(address);
  std::string hex = address.ToHex();
  EXPECT_EQ(StrCat(tmpdir_, "/store/chunks/", hex.substr(0, 2), "/",
                   hex.substr(2, 2), "/", hex),
            path);
  struct stat buf;
  ASSERT_EQ(0, stat(path.c_str(), &buf));
  EXPECT_EQ(0444, buf.st_mode & 0777);
  EXPECT_TRUE(ListDir(tmpdir_ + "/store/tmp").empty());

  std::string data;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, store_.Get(address, &data, &error_message))
      << error_message;
  EXPECT_EQ("hello", data);

  ContentAddress empty = PutOrDie("");
  ASSERT_EQ(ErrorKind::kOk, store_.Get(empty, &data, &error_message));
  EXPECT_EQ("", data);
}

TEST_F(ChunkStoreTest, DuplicatePutIncrementsRefcount) {
  ContentAddress a = PutOrDie("hello");
  ContentAddress b = PutOrDie("hello");
  EXPECT_EQ(a, b);
  EXPECT_EQ(2, Refcount(a));

  ChunkStoreStats stats;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, store_.Stats(&stats, &error_message));
  EXPECT_EQ(1, stats.chunks);
  EXPECT_EQ(5, stats.bytes);
  EXPECT_EQ(0, stats.zero_referenced);
}

TEST_F(ChunkStoreTest, ReopenKeepsIndex) {
  ContentAddress address = PutOrDie("persistent");
  std::string error_message;
  ChunkStore reopened(GetRealFilesystem(), &clock_, &hasher_);
  ASSERT_TRUE(reopened.Open(tmpdir_ + "/store", false, &error_message))
      << error_message;
  int64_t refcount;
  ASSERT_EQ(ErrorKind::kOk,
            reopened.GetRefcount(address, &refcount, &error_message));
  EXPECT_EQ(1, refcount);

  ChunkStore missing(GetRealFilesystem(), &clock_, &hasher_);
  EXPECT_FALSE(missing.Open(tmpdir_ + "/nonexistent", false, &error_message));
  EXPECT_THAT(error_message, HasSubstr("No such file or directory"));
}

TEST_F(ChunkStoreTest, UnknownAddressIsNotFound) {
  std::string data;
  std::string error_message;
  EXPECT_EQ(ErrorKind::kNotFound,
            store_.Get(hasher_.Hash("nope"), &data, &error_message));
  int64_t refcount;
  EXPECT_EQ(ErrorKind::kNotFound,
            store_.GetRefcount(hasher_.Hash("nope"), &refcount,
                               &error_message));
}

TEST_F(ChunkStoreTest, CorruptChunkIsQuarantined) {
  ContentAddress address = PutOrDie("hello");
  std::string path = store_.ChunkPath(address);
  WriteFileOrDie(path, "jello");

  ScopedMockLog log;
  EXPECT_CALL(log, Log(_, _, _)).Times(AnyNumber());
  EXPECT_CALL(log, Log(google::ERROR, _, HasSubstr("failed verification")));
  log.Start();

  std::string data;
  std::string error_message;
  EXPECT_EQ(ErrorKind::kCorruption,
            store_.Get(address, &data, &error_message));
  EXPECT_THAT(error_message, HasSubstr("is corrupt"));
  EXPECT_FALSE(FileExists(path));
  EXPECT_THAT(ListDir(tmpdir_ + "/store/quarantine"),
              testing::ElementsAre(StrCat(address.ToHex(), ".", kStartSec)));

  // With the file gone but the row intact, the chunk is missing.
  EXPECT_EQ(ErrorKind::kCorruption,
            store_.Get(address, &data, &error_message));
  EXPECT_THAT(error_message, HasSubstr("is missing"));

  // Storing it again repairs it.
  PutOrDie("hello");
  EXPECT_EQ(ErrorKind::kOk, store_.Get(address, &data, &error_message));
  EXPECT_EQ("hello", data);
}

TEST_F(ChunkStoreTest, RecoversFromReplica) {
  std::string error_message;
  ChunkStore replica(GetRealFilesystem(), &clock_, &hasher_);
  ASSERT_TRUE(replica.Open(tmpdir_ + "/replica", true, &error_message))
      << error_message;
  ContentAddress address;
  ASSERT_EQ(ErrorKind::kOk, replica.Put("hello", &address, &error_message));

  DirectoryChunkSource source(GetRealFilesystem(), tmpdir_ + "/replica/chunks");
  store_.AddRecoverySource(&source);
  PutOrDie("hello");
  WriteFileOrDie(store_.ChunkPath(address), "jello");

  ScopedMockLog log;
  EXPECT_CALL(log, Log(_, _, _)).Times(AnyNumber());
  EXPECT_CALL(log, Log(google::WARNING, _,
                       HasSubstr("recovered chunk " + address.ToHex() +
                                 " from replica")));
  log.Start();

  std::string data;
  ASSERT_EQ(ErrorKind::kOk, store_.Get(address, &data, &error_message))
      << error_message;
  EXPECT_EQ("hello", data);
  EXPECT_EQ("hello", ReadFileOrDie(store_.ChunkPath(address)));
  EXPECT_EQ(1u, ListDir(tmpdir_ + "/store/quarantine").size());
}

TEST_F(ChunkStoreTest, RecoveryCascadeTriesSourcesInOrder) {
  ContentAddress address = PutOrDie("hello");
  ASSERT_EQ(0, unlink(store_.ChunkPath(address).c_str()));

  MockChunkSource broken, wrong, good, unused;
  ON_CALL(broken, name()).WillByDefault(Return("broken"));
  ON_CALL(wrong, name()).WillByDefault(Return("wrong"));
  ON_CALL(good, name()).WillByDefault(Return("good"));
  ON_CALL(unused, name()).WillByDefault(Return("unused"));
  EXPECT_CALL(broken, name()).Times(AnyNumber());
  EXPECT_CALL(wrong, name()).Times(AnyNumber());
  EXPECT_CALL(good, name()).Times(AnyNumber());
  EXPECT_CALL(unused, name()).Times(AnyNumber());
  {
    InSequence seq;
    EXPECT_CALL(broken, Fetch(address, _, _))
        .WillOnce(DoAll(SetArgPointee<2>(std::string("connection refused")),
                        Return(ErrorKind::kIoError)));
    EXPECT_CALL(wrong, Fetch(address, _, _))
        .WillOnce(DoAll(SetArgPointee<1>(std::string("jello")),
                        Return(ErrorKind::kOk)));
    EXPECT_CALL(good, Fetch(address, _, _))
        .WillOnce(DoAll(SetArgPointee<1>(std::string("hello")),
                        Return(ErrorKind::kOk)));
  }
  EXPECT_CALL(unused, Fetch(_, _, _)).Times(0);
  store_.AddRecoverySource(&broken);
  store_.AddRecoverySource(&wrong);
  store_.AddRecoverySource(&good);
  store_.AddRecoverySource(&unused);

  std::string data;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, store_.Get(address, &data, &error_message))
      << error_message;
  EXPECT_EQ("hello", data);
  EXPECT_TRUE(FileExists(store_.ChunkPath(address)));
  EXPECT_TRUE(ListDir(tmpdir_ + "/store/quarantine").empty());
}

TEST_F(ChunkStoreTest, PutChunkVerifiesAndStartsUnreferenced) {
  std::string error_message;
  EXPECT_EQ(ErrorKind::kCorruption,
            store_.PutChunk(hasher_.Hash("hello"), "jello", &error_message));
  EXPECT_THAT(error_message, HasSubstr("hashes to"));

  ContentAddress address = hasher_.Hash("hello");
  ASSERT_EQ(ErrorKind::kOk,
            store_.PutChunk(address, "hello", &error_message));
  EXPECT_EQ(0, Refcount(address));
  ASSERT_EQ(ErrorKind::kOk,
            store_.PutChunk(address, "hello", &error_message));
  EXPECT_EQ(0, Refcount(address));
  ASSERT_EQ(ErrorKind::kOk, store_.AddRef(address, &error_message));
  EXPECT_EQ(1, Refcount(address));
  ASSERT_EQ(ErrorKind::kOk,
            store_.PutChunk(address, "hello", &error_message));
  EXPECT_EQ(1, Refcount(address));
}

TEST_F(ChunkStoreTest, RefcountNeverGoesNegative) {
  ContentAddress address = PutOrDie("hello");
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, store_.ReleaseRef(address, &error_message));
  EXPECT_EQ(0, Refcount(address));
  EXPECT_EQ(ErrorKind::kInvariantViolation,
            store_.ReleaseRef(address, &error_message));
  EXPECT_THAT(error_message, HasSubstr("would become negative"));
  EXPECT_EQ(0, Refcount(address));

  ContentAddress absent = hasher_.Hash("absent");
  EXPECT_EQ(ErrorKind::kInvariantViolation,
            store_.AddRef(absent, &error_message));
  EXPECT_EQ(ErrorKind::kInvariantViolation,
            store_.ReleaseRef(absent, &error_message));
}

TEST_F(ChunkStoreTest, Exists) {
  ContentAddress a = PutOrDie("a");
  ContentAddress c = PutOrDie("c");
  std::vector<bool> exists;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk,
            store_.Exists({a, hasher_.Hash("b"), c}, &exists, &error_message));
  EXPECT_THAT(exists, testing::ElementsAre(true, false, true));
}

TEST_F(ChunkStoreTest, GarbageCollectionHonorsGracePeriod) {
  ContentAddress kept = PutOrDie("kept");
  ContentAddress dropped = PutOrDie("dropped");
  ContentAddress revived = PutOrDie("revived");
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, store_.ReleaseRef(dropped, &error_message));
  ASSERT_EQ(ErrorKind::kOk, store_.ReleaseRef(revived, &error_message));

  FakeCatalog catalog;
  GcOptions options;
  options.grace_period_sec = 3600;
  GcResult result;
  ASSERT_EQ(ErrorKind::kOk, store_.GarbageCollect(options, &catalog, nullptr,
                                                  &result, &error_message))
      << error_message;
  EXPECT_EQ(2, result.examined);
  EXPECT_EQ(0, result.deleted);
  EXPECT_FALSE(result.resumed);
  EXPECT_FALSE(catalog.has_checkpoint);

  clock_.AdvanceSec(3000);
  PutOrDie("revived");
  clock_.AdvanceSec(601);
  ASSERT_EQ(ErrorKind::kOk, store_.GarbageCollect(options, &catalog, nullptr,
                                                  &result, &error_message))
      << error_message;
  EXPECT_EQ(1, result.examined);
  EXPECT_EQ(1, result.deleted);
  EXPECT_EQ(7, result.deleted_bytes);
  EXPECT_FALSE(FileExists(store_.ChunkPath(dropped)));

  std::string data;
  EXPECT_EQ(ErrorKind::kNotFound,
            store_.Get(dropped, &data, &error_message));
  EXPECT_EQ(ErrorKind::kOk, store_.Get(kept, &data, &error_message));
  EXPECT_EQ(ErrorKind::kOk, store_.Get(revived, &data, &error_message));
  EXPECT_EQ(1, Refcount(revived));
}

TEST_F(ChunkStoreTest, DryRunDeletesNothing) {
  ContentAddress address = PutOrDie("hello");
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, store_.ReleaseRef(address, &error_message));
  clock_.AdvanceSec(10);

  FakeCatalog catalog;
  GcOptions options;
  options.grace_period_sec = 0;
  options.dry_run = true;
  GcResult result;
  ASSERT_EQ(ErrorKind::kOk, store_.GarbageCollect(options, &catalog, nullptr,
                                                  &result, &error_message));
  EXPECT_EQ(1, result.deleted);
  EXPECT_EQ(5, result.deleted_bytes);
  EXPECT_EQ(0, catalog.saves);
  EXPECT_TRUE(FileExists(store_.ChunkPath(address)));
  EXPECT_EQ(0, Refcount(address));
}

TEST_F(ChunkStoreTest, ReferencedZeroRefcountChunkHaltsCollection) {
  ContentAddress address = PutOrDie("hello");
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, store_.ReleaseRef(address, &error_message));
  clock_.AdvanceSec(10);

  FakeCatalog catalog;
  catalog.references[address] = "movie.mp4";
  GcOptions options;
  options.grace_period_sec = 0;
  GcResult result;
  EXPECT_EQ(ErrorKind::kInvariantViolation,
            store_.GarbageCollect(options, &catalog, nullptr, &result,
                                  &error_message));
  EXPECT_THAT(error_message, HasSubstr("manifest movie.mp4 references it"));
  EXPECT_EQ(0, result.deleted);
  EXPECT_TRUE(FileExists(store_.ChunkPath(address)));
}

TEST_F(ChunkStoreTest, InterruptedCollectionResumesFromCheckpoint) {
  const int kChunks = 200;
  std::string error_message;
  std::vector<ContentAddress> addresses;
  for (int i = 0; i < kChunks; ++i) {
    addresses.push_back(PutOrDie(StrCat("chunk ", i)));
    ASSERT_EQ(ErrorKind::kOk,
              store_.ReleaseRef(addresses.back(), &error_message));
  }
  clock_.AdvanceSec(10);

  ShutdownSignal signal;
  FakeCatalog catalog;
  catalog.shutdown_on_save = &signal;
  GcOptions options;
  options.grace_period_sec = 0;
  options.batch_size = 5;
  GcResult first;
  ASSERT_EQ(ErrorKind::kOk, store_.GarbageCollect(options, &catalog, &signal,
                                                  &first, &error_message))
      << error_message;
  EXPECT_TRUE(first.interrupted);
  EXPECT_LE(first.examined, 5);
  EXPECT_EQ(first.examined, first.deleted);
  EXPECT_EQ(1, catalog.saves);
  ASSERT_TRUE(catalog.has_checkpoint);

  catalog.shutdown_on_save = nullptr;
  GcResult second;
  ASSERT_EQ(ErrorKind::kOk, store_.GarbageCollect(options, &catalog, nullptr,
                                                  &second, &error_message))
      << error_message;
  EXPECT_TRUE(second.resumed);
  EXPECT_FALSE(second.interrupted);
  EXPECT_EQ(kChunks, first.deleted + second.deleted);
  EXPECT_FALSE(catalog.has_checkpoint);

  ChunkStoreStats stats;
  ASSERT_EQ(ErrorKind::kOk, store_.Stats(&stats, &error_message));
  EXPECT_EQ(0, stats.chunks);
}

// Random manifests reference random chunks; some manifests are removed. After
// collection, every chunk a retained manifest references must be readable.
TEST_F(ChunkStoreTest, CollectionNeverRemovesReachableChunks) {
  std::mt19937 gen(1234);
  std::vector<std::string> contents;
  for (int i = 0; i < 60; ++i) {
    contents.push_back(RandomBytes(100 + gen() % 1000, i));
  }
  std::vector<std::vector<ContentAddress>> manifests(20);
  std::string error_message;
  for (auto &manifest : manifests) {
    int n = 1 + gen() % 10;
    for (int j = 0; j < n; ++j) {
      manifest.push_back(PutOrDie(contents[gen() % contents.size()]));
    }
  }
  FakeCatalog catalog;
  std::set<ContentAddress> reachable;
  for (size_t m = 0; m < manifests.size(); ++m) {
    if (gen() % 2 == 0) {
      for (const auto &address : manifests[m]) {
        ASSERT_EQ(ErrorKind::kOk, store_.ReleaseRef(address, &error_message))
            << error_message;
      }
    } else {
      for (const auto &address : manifests[m]) {
        reachable.insert(address);
        catalog.references[address] = StrCat("manifest-", m);
      }
    }
  }
  clock_.AdvanceSec(10);
  GcOptions options;
  options.grace_period_sec = 0;
  options.batch_size = 3;
  GcResult result;
  ASSERT_EQ(ErrorKind::kOk, store_.GarbageCollect(options, &catalog, nullptr,
                                                  &result, &error_message))
      << error_message;

  for (const auto &content : contents) {
    ContentAddress address = hasher_.Hash(content);
    std::string data;
    ErrorKind kind = store_.Get(address, &data, &error_message);
    if (reachable.count(address)) {
      EXPECT_EQ(ErrorKind::kOk, kind) << address.ToHex();
      EXPECT_EQ(content, data);
    } else {
      EXPECT_NE(ErrorKind::kOk, kind) << address.ToHex();
    }
  }
}

TEST_F(ChunkStoreTest, VerifyAllReportsUnrecoverableChunks) {
  PutOrDie("one");
  ContentAddress two = PutOrDie("two");
  PutOrDie("three");
  WriteFileOrDie(store_.ChunkPath(two), "tw0");

  ScopedMockLog log;
  EXPECT_CALL(log, Log(_, _, _)).Times(AnyNumber());
  log.Start();

  VerifyResult result;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, store_.VerifyAll(nullptr, &result, &error_message))
      << error_message;
  EXPECT_EQ(3, result.checked);
  EXPECT_EQ(0, result.recovered);
  EXPECT_THAT(result.failed, testing::ElementsAre(two));
  EXPECT_FALSE(result.interrupted);
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
