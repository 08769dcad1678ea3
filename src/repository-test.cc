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
// repository-test.cc: tests of the repository.h interface.

#include <fcntl.h>
#include <string.h>

#include <set>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "repository.h"
#include "string.h"
#include "testutil.h"

DECLARE_bool(alsologtostderr);

using testing::HasSubstr;
using testing::Return;

namespace reelstore {
namespace {

const time_t kStartSec = 1000000;

class RepositoryTest : public testing::Test {
 protected:
  RepositoryTest()
      : clock_(kStartSec),
        repo_(GetRealFilesystem(), &clock_, GetRealUuidGenerator()) {
    options_.chunker = ChunkerConfig::Small();
    options_.container_chunker = ChunkerConfig::Small();
  }

  void SetUp() override {
    tmpdir_ = PrepareTempDirOrDie("repository");
    std::string error_message;
    ASSERT_TRUE(
        repo_.Init(tmpdir_ + "/repo", HashAlgorithm::kBlake3, &error_message))
        << error_message;
  }

  std::string WriteInput(const std::string &name, re2::StringPiece data) {
    std::string path = StrCat(tmpdir_, "/", name);
    WriteFileOrDie(path, data);
    return path;
  }

  std::string Add(const std::string &path) {
    std::string id;
    std::string error_message;
    ErrorKind kind = repo_.AddFile(path, options_, &id, &error_message);
    CHECK(kind == ErrorKind::kOk) << ErrorKindName(kind) << ": "
                                  << error_message;
    return id;
  }

  ManifestEntry Get(const std::string &id) {
    ManifestEntry entry;
    std::string error_message;
    ErrorKind kind = repo_.GetManifest(id, &entry, &error_message);
    CHECK(kind == ErrorKind::kOk) << error_message;
    return entry;
  }

  std::string Reconstruct(const std::string &id) {
    ManifestEntry entry = Get(id);
    std::unique_ptr<VirtualFile> file;
    std::string error_message;
    CHECK(VirtualFile::Open(repo_.store(), &entry, Layout::kOriginal, &file,
                            &error_message) == ErrorKind::kOk)
        << error_message;
    std::string path = StrCat(tmpdir_, "/out", ++outputs_);
    std::unique_ptr<File> out;
    CHECK_EQ(0, GetRealFilesystem()->Open(
                    path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600, &out));
    ErrorKind kind = file->WriteTo(out.get(), &error_message);
    CHECK(kind == ErrorKind::kOk) << error_message;
    CHECK_EQ(0, out->Close());
    return ReadFileOrDie(path);
  }

  int64_t Refcount(const ContentAddress &address) {
    int64_t refcount = -1;
    std::string error_message;
    CHECK(repo_.store()->GetRefcount(address, &refcount, &error_message) ==
          ErrorKind::kOk)
        << error_message;
    return refcount;
  }

  GcResult Collect() {
    GcResult result;
    std::string error_message;
    ErrorKind kind =
        repo_.GarbageCollect(GcOptions(), nullptr, &result, &error_message);
    CHECK(kind == ErrorKind::kOk) << error_message;
    return result;
  }

  std::string tmpdir_;
  int outputs_ = 0;
  SimulatedClock clock_;
  Repository repo_;
  IngestOptions options_;
};

TEST_F(RepositoryTest, InitAndReopen) {
  std::string error_message;
  Repository again(GetRealFilesystem(), &clock_, GetRealUuidGenerator());
  EXPECT_FALSE(
      again.Init(tmpdir_ + "/repo", HashAlgorithm::kBlake3, &error_message));
  EXPECT_THAT(error_message, HasSubstr("already holds a repository"));

  HashAlgorithm sha256 = HashAlgorithm::kSha256;
  Repository mismatched(GetRealFilesystem(), &clock_, GetRealUuidGenerator());
  EXPECT_FALSE(mismatched.Open(tmpdir_ + "/repo", &sha256, &error_message));
  EXPECT_THAT(error_message, HasSubstr("uses blake3, not sha256"));

  Repository reopened(GetRealFilesystem(), &clock_, GetRealUuidGenerator());
  ASSERT_TRUE(reopened.Open(tmpdir_ + "/repo", nullptr, &error_message))
      << error_message;
  EXPECT_TRUE(reopened.id() == repo_.id());
  EXPECT_FALSE(reopened.id().is_null());
  EXPECT_EQ(HashAlgorithm::kBlake3, reopened.hasher().algorithm());

  Repository missing(GetRealFilesystem(), &clock_, GetRealUuidGenerator());
  EXPECT_FALSE(missing.Open(tmpdir_ + "/nonexistent", nullptr, &error_message));
}

TEST_F(RepositoryTest, IdsComeFromGenerator) {
  Uuid repository_id;
  Uuid manifest_id;
  ASSERT_TRUE(repository_id.ParseText("1b4e28ba-2fa1-11d2-883f-0016d3cca427"));
  ASSERT_TRUE(manifest_id.ParseText("5c8e2a9f-7d3b-4e1a-9c6f-2b8d4e0a1f37"));
  MockUuidGenerator uuidgen;
  EXPECT_CALL(uuidgen, Generate())
      .WillOnce(Return(repository_id))
      .WillOnce(Return(manifest_id));

  Repository repo(GetRealFilesystem(), &clock_, &uuidgen);
  std::string error_message;
  ASSERT_TRUE(repo.Init(tmpdir_ + "/mocked", HashAlgorithm::kSha3_256,
                        &error_message))
      << error_message;
  EXPECT_TRUE(repo.id() == repository_id);

  std::string id;
  ASSERT_EQ(ErrorKind::kOk, repo.AddFile(WriteInput("in", "hello"), options_,
                                         &id, &error_message))
      << error_message;
  EXPECT_EQ("5c8e2a9f-7d3b-4e1a-9c6f-2b8d4e0a1f37", id);
}

TEST_F(RepositoryTest, RoundTripsFilesOfEverySize) {
  const ChunkerConfig &config = options_.chunker;
  std::vector<std::string> inputs = {
      "",
      "a",
      RandomBytes(config.min_size, 1),
      RandomBytes(config.min_size + 1, 2),
      RandomBytes(config.max_size, 3),
      RandomBytes(config.max_size * 3 + 17, 4),
  };
  for (size_t i = 0; i < inputs.size(); ++i) {
    SCOPED_TRACE(i);
    std::string id = Add(WriteInput(StrCat("in", i), inputs[i]));
    ManifestEntry entry = Get(id);
    EXPECT_EQ(static_cast<int64_t>(inputs[i].size()), entry.size);
    EXPECT_EQ(repo_.hasher().Hash(inputs[i]), entry.full_content_hash);
    EXPECT_EQ(inputs[i], Reconstruct(id));
  }
}

TEST_F(RepositoryTest, RoundTripsContainer) {
  TestMp4Options mp4_options;
  mp4_options.sample_sizes.assign(500, 1500);
  mp4_options.sync_samples = {1, 101, 201, 301, 401};
  mp4_options.audio_track = true;
  TestMp4 mp4 = MakeTestMp4(mp4_options);
  std::string id = Add(WriteInput("in.mp4", mp4.data));
  ManifestEntry entry = Get(id);
  EXPECT_TRUE(entry.is_container());
  EXPECT_TRUE(entry.offsets_normalized);
  EXPECT_EQ(mp4.data, Reconstruct(id));
}

TEST_F(RepositoryTest, DuplicateContentSharesChunks) {
  std::string data = RandomBytes(600 << 10, 5);
  std::string a = Add(WriteInput("a", data));
  std::string b = Add(WriteInput("b", data));
  EXPECT_NE(a, b);
  ManifestEntry entry = Get(a);
  std::set<ContentAddress> unique;
  for (const auto &c : entry.chunks) {
    EXPECT_EQ(2, Refcount(c.address));
    unique.insert(c.address);
  }
  ChunkStoreStats stats;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, repo_.store()->Stats(&stats, &error_message));
  EXPECT_EQ(static_cast<int64_t>(unique.size()), stats.chunks);
  EXPECT_EQ(static_cast<int64_t>(data.size()), stats.bytes);
}

TEST_F(RepositoryTest, RemoveAndCollect) {
  std::string data = RandomBytes(300 << 10, 6);
  std::string a = Add(WriteInput("a", data));
  std::string b = Add(WriteInput("b", data));
  ManifestEntry entry = Get(a);
  ASSERT_FALSE(entry.chunks.empty());
  const ContentAddress first = entry.chunks[0].address;

  std::string manifest_id;
  std::string error_message;
  ASSERT_TRUE(repo_.FindReference(first, &manifest_id, &error_message));
  EXPECT_TRUE(manifest_id == a || manifest_id == b) << manifest_id;

  ASSERT_EQ(ErrorKind::kOk, repo_.RemoveManifest(a, &error_message))
      << error_message;
  EXPECT_EQ(ErrorKind::kNotFound, repo_.RemoveManifest(a, &error_message));
  EXPECT_EQ(1, Refcount(first));
  ASSERT_TRUE(repo_.FindReference(first, &manifest_id, &error_message));
  EXPECT_EQ(b, manifest_id);

  clock_.AdvanceSec(GcOptions().grace_period_sec + 1);
  EXPECT_EQ(0, Collect().deleted);

  ASSERT_EQ(ErrorKind::kOk, repo_.RemoveManifest(b, &error_message))
      << error_message;
  EXPECT_EQ(0, Refcount(first));
  ASSERT_TRUE(repo_.FindReference(first, &manifest_id, &error_message));
  EXPECT_EQ("", manifest_id);

  // Within the grace period, nothing goes.
  EXPECT_EQ(0, Collect().deleted);
  clock_.AdvanceSec(GcOptions().grace_period_sec + 1);
  GcResult result = Collect();
  EXPECT_EQ(static_cast<int64_t>(entry.chunks.size()), result.deleted);
  EXPECT_EQ(static_cast<int64_t>(data.size()), result.deleted_bytes);

  std::string chunk;
  EXPECT_EQ(ErrorKind::kNotFound,
            repo_.store()->Get(first, &chunk, &error_message));
  std::vector<ManifestSummary> manifests;
  ASSERT_TRUE(repo_.ListManifests(&manifests, &error_message));
  EXPECT_TRUE(manifests.empty());
}

TEST_F(RepositoryTest, CollectionRefusesReferencedChunk) {
  std::string id = Add(WriteInput("a", RandomBytes(100 << 10, 7)));
  ManifestEntry entry = Get(id);
  const ContentAddress victim = entry.chunks.back().address;

  // Break the refcount behind the manifest's back.
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk,
            repo_.store()->ReleaseRef(victim, &error_message));
  clock_.AdvanceSec(GcOptions().grace_period_sec + 1);

  GcResult result;
  EXPECT_EQ(ErrorKind::kInvariantViolation,
            repo_.GarbageCollect(GcOptions(), nullptr, &result,
                                 &error_message));
  EXPECT_THAT(error_message, HasSubstr(id));
  EXPECT_EQ(0, result.deleted);
  std::string chunk;
  EXPECT_EQ(ErrorKind::kOk, repo_.store()->Get(victim, &chunk, &error_message));
}

TEST_F(RepositoryTest, CheckpointSurvivesReopen) {
  std::string error_message;
  GcCheckpoint checkpoint;
  bool found = true;
  ASSERT_TRUE(repo_.LoadGcCheckpoint(&checkpoint, &found, &error_message));
  EXPECT_FALSE(found);

  checkpoint.shard = 7;
  checkpoint.last_address = std::string(32, '\x7f');
  ASSERT_TRUE(repo_.SaveGcCheckpoint(checkpoint, &error_message))
      << error_message;
  checkpoint.shard = 8;
  checkpoint.last_address.clear();
  ASSERT_TRUE(repo_.SaveGcCheckpoint(checkpoint, &error_message))
      << error_message;

  Repository reopened(GetRealFilesystem(), &clock_, GetRealUuidGenerator());
  ASSERT_TRUE(reopened.Open(tmpdir_ + "/repo", nullptr, &error_message))
      << error_message;
  GcCheckpoint loaded;
  ASSERT_TRUE(reopened.LoadGcCheckpoint(&loaded, &found, &error_message));
  ASSERT_TRUE(found);
  EXPECT_EQ(8, loaded.shard);
  EXPECT_EQ("", loaded.last_address);

  ASSERT_TRUE(reopened.ClearGcCheckpoint(&error_message));
  ASSERT_TRUE(repo_.LoadGcCheckpoint(&loaded, &found, &error_message));
  EXPECT_FALSE(found);
}

TEST_F(RepositoryTest, SnapshotTakesNewestVersionOfEachPath) {
  std::string p = WriteInput("p", "first version");
  std::string q = WriteInput("q", "other file");
  std::string p1 = Add(p);
  Add(q);
  clock_.AdvanceSec(1);
  WriteFileOrDie(p, "second version");
  std::string p2 = Add(p);
  EXPECT_NE(p1, p2);

  std::vector<ManifestSummary> manifests;
  std::string error_message;
  ASSERT_TRUE(repo_.ListManifests(&manifests, &error_message));
  ASSERT_EQ(3u, manifests.size());
  EXPECT_EQ(p1, manifests[0].id);
  EXPECT_EQ(p2, manifests[1].id);
  EXPECT_EQ(kStartSec + 1, manifests[1].created_sec);
  EXPECT_EQ(q, manifests[2].path);
  EXPECT_EQ(1, manifests[2].chunks);

  ManifestRecord record;
  ASSERT_EQ(ErrorKind::kOk, repo_.Snapshot(nullptr, &record, &error_message))
      << error_message;
  EXPECT_TRUE(record.repository_id == repo_.id());
  EXPECT_FALSE(record.has_parent);
  ASSERT_EQ(2u, record.entries.size());
  EXPECT_EQ(p, record.entries[0].path);
  EXPECT_EQ(repo_.hasher().Hash("second version"),
            record.entries[0].full_content_hash);
  EXPECT_EQ(2, record.stats.files);
  EXPECT_EQ(static_cast<int64_t>(strlen("second version") +
                                 strlen("other file")),
            record.stats.bytes);
  EXPECT_EQ(ComputeCommitHash(repo_.hasher(), record), record.commit);

  ManifestRecord child;
  ASSERT_EQ(ErrorKind::kOk,
            repo_.Snapshot(&record.commit, &child, &error_message));
  EXPECT_TRUE(child.has_parent);
  EXPECT_EQ(record.commit, child.parent);
  EXPECT_FALSE(child.commit == record.commit);

  std::string encoded;
  EncodeManifestRecord(child, &encoded);
  ManifestRecord decoded;
  ASSERT_TRUE(DecodeManifestRecord(encoded, &decoded, &error_message))
      << error_message;
  EXPECT_EQ(child.commit, decoded.commit);
}

TEST_F(RepositoryTest, MissingInputIsNotFound) {
  std::string id;
  std::string error_message;
  EXPECT_EQ(ErrorKind::kNotFound,
            repo_.AddFile(tmpdir_ + "/nonexistent", options_, &id,
                          &error_message));
  ManifestEntry entry;
  EXPECT_EQ(ErrorKind::kNotFound,
            repo_.GetManifest("nonexistent", &entry, &error_message));
}

TEST_F(RepositoryTest, AddFilesInParallel) {
  std::vector<std::string> paths;
  std::vector<std::string> contents;
  for (int i = 0; i < 8; ++i) {
    contents.push_back(RandomBytes(100 << 10, 100 + i % 4));
    paths.push_back(WriteInput(StrCat("f", i), contents.back()));
  }
  paths.push_back(tmpdir_ + "/nonexistent");
  std::vector<AddFileResult> results;
  EXPECT_EQ(1, repo_.AddFiles(paths, options_, 4, nullptr, &results));
  ASSERT_EQ(paths.size(), results.size());
  for (int i = 0; i < 8; ++i) {
    SCOPED_TRACE(i);
    ASSERT_EQ(ErrorKind::kOk, results[i].kind) << results[i].error_message;
    EXPECT_EQ(paths[i], results[i].path);
    EXPECT_EQ(contents[i], Reconstruct(results[i].manifest_id));
  }
  EXPECT_EQ(ErrorKind::kNotFound, results[8].kind);

  // Each distinct content appears twice.
  ManifestEntry entry = Get(results[0].manifest_id);
  for (const auto &c : entry.chunks) {
    EXPECT_EQ(2, Refcount(c.address));
  }
}

TEST_F(RepositoryTest, AddFilesStopsOnShutdown) {
  std::vector<std::string> paths = {WriteInput("a", "a"),
                                    WriteInput("b", "b")};
  ShutdownSignal signal;
  signal.Shutdown();
  std::vector<AddFileResult> results;
  EXPECT_EQ(0, repo_.AddFiles(paths, options_, 2, &signal, &results));
  ASSERT_EQ(2u, results.size());
  EXPECT_TRUE(results[0].skipped);
  EXPECT_TRUE(results[1].skipped);

  std::vector<ManifestSummary> manifests;
  std::string error_message;
  ASSERT_TRUE(repo_.ListManifests(&manifests, &error_message));
  EXPECT_TRUE(manifests.empty());
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
