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
// manifest-test.cc: tests of the manifest.h interface.

#include <fcntl.h>
#include <stdint.h>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "manifest.h"
#include "string.h"
#include "testutil.h"

DECLARE_bool(alsologtostderr);

using testing::HasSubstr;

namespace reelstore {
namespace {

const int64_t kPieceSize = 700;

ChunkRef Ref(const char *name, int64_t offset, int64_t length,
             uint32_t flags = 0) {
  return ChunkRef(Hasher(HashAlgorithm::kSha256).Hash(name), offset, length,
                  flags);
}

StructureMap Passthrough(int64_t size) {
  StructureMap map;
  map.regions.emplace_back(ByteRange(0, size), RegionKind::kPayload, 0);
  return map;
}

TEST(ManifestEntryTest, BuildValidatesChunks) {
  ManifestEntry entry;
  std::string error_message;
  ContentAddress hash;
  FileMetadata metadata;
  ASSERT_TRUE(BuildManifestEntry("a", metadata, hash,
                                 {Ref("x", 0, 10), Ref("y", 10, 5)},
                                 Passthrough(15), false, &entry,
                                 &error_message))
      << error_message;
  EXPECT_EQ(15, entry.size);
  EXPECT_FALSE(entry.is_container());

  EXPECT_FALSE(BuildManifestEntry("a", metadata, hash,
                                  {Ref("x", 0, 10), Ref("y", 11, 5)},
                                  Passthrough(16), false, &entry,
                                  &error_message));
  EXPECT_EQ("chunk 1 at offset 11 length 5 doesn't follow 10", error_message);

  EXPECT_FALSE(BuildManifestEntry("a", metadata, hash, {Ref("x", 0, 10, 16)},
                                  Passthrough(10), false, &entry,
                                  &error_message));
  EXPECT_EQ("chunk 0 has unknown flags 16", error_message);

  StructureMap container;
  container.is_container = true;
  container.regions.emplace_back(ByteRange(0, 12), RegionKind::kMetadata,
                                 FourCC("ftyp"));
  container.regions.emplace_back(ByteRange(12, 15), RegionKind::kMetadata,
                                 FourCC("free"));
  EXPECT_FALSE(BuildManifestEntry("a", metadata, hash,
                                  {Ref("x", 0, 10), Ref("y", 10, 5)},
                                  container, false, &entry, &error_message));
  EXPECT_EQ("region [0, 12) (ftyp) doesn't end on a chunk boundary",
            error_message);

  EXPECT_FALSE(BuildManifestEntry("a", metadata, hash,
                                  {Ref("x", 0, 12), Ref("y", 12, 3)},
                                  container, true, &entry, &error_message));
  EXPECT_EQ("normalized offsets need a single mdat payload", error_message);
}

TEST(ManifestEntryTest, FindChunkForOffset) {
  ManifestEntry entry;
  std::string error_message;
  ASSERT_TRUE(BuildManifestEntry(
      "a", FileMetadata(), ContentAddress(),
      {Ref("x", 0, 10), Ref("y", 10, 1), Ref("z", 11, 100)}, Passthrough(111),
      false, &entry, &error_message));
  EXPECT_EQ(-1, FindChunkForOffset(entry, -1));
  EXPECT_EQ(0, FindChunkForOffset(entry, 0));
  EXPECT_EQ(0, FindChunkForOffset(entry, 9));
  EXPECT_EQ(1, FindChunkForOffset(entry, 10));
  EXPECT_EQ(2, FindChunkForOffset(entry, 11));
  EXPECT_EQ(2, FindChunkForOffset(entry, 110));
  EXPECT_EQ(-1, FindChunkForOffset(entry, 111));
}

ManifestEntry ContainerEntry() {
  StructureMap map;
  map.is_container = true;
  map.regions.emplace_back(ByteRange(0, 24), RegionKind::kMetadata,
                           FourCC("ftyp"));
  map.regions.emplace_back(ByteRange(24, 32), RegionKind::kMetadata,
                           FourCC("mdat"));
  map.regions.emplace_back(ByteRange(32, 3032), RegionKind::kPayload,
                           FourCC("mdat"));
  map.regions.emplace_back(ByteRange(3032, 3532), RegionKind::kMetadata,
                           FourCC("moov"));
  map.single_payload_pos = 32;
  FileMetadata metadata;
  metadata.mode = 0600;
  metadata.mtime_sec = 1500000000;
  ManifestEntry entry;
  std::string error_message;
  CHECK(BuildManifestEntry(
      "clips/take1.mp4", metadata, Hasher(HashAlgorithm::kBlake3).Hash("x"),
      {Ref("ftyp", 0, 24, ChunkRef::kMetadata),
       Ref("mdat", 24, 8, ChunkRef::kMetadata),
       Ref("p0", 32, 1000, ChunkRef::kKeyframeAligned), Ref("p1", 1032, 2000),
       Ref("moov", 3032, 500, ChunkRef::kMetadata)},
      map, true, &entry, &error_message))
      << error_message;
  entry.asset_metadata["codec"] = "avc1";
  return entry;
}

TEST(ManifestEntryTest, EncodingPreservesEverything) {
  ManifestEntry entry = ContainerEntry();
  ASSERT_EQ(4u, entry.regions.size());
  EXPECT_EQ(2u, entry.regions[2].first_chunk);
  EXPECT_EQ(4u, entry.regions[2].end_chunk);

  std::string encoded;
  EncodeManifestEntry(entry, &encoded);
  ManifestEntry decoded;
  std::string error_message;
  ASSERT_TRUE(DecodeManifestEntry(encoded, &decoded, &error_message))
      << error_message;
  EXPECT_EQ(entry.path, decoded.path);
  EXPECT_EQ(entry.size, decoded.size);
  EXPECT_EQ(entry.full_content_hash, decoded.full_content_hash);
  EXPECT_TRUE(entry.chunks == decoded.chunks);
  ASSERT_EQ(entry.regions.size(), decoded.regions.size());
  for (size_t i = 0; i < entry.regions.size(); ++i) {
    EXPECT_EQ(entry.regions[i].range, decoded.regions[i].range);
    EXPECT_EQ(entry.regions[i].box_type, decoded.regions[i].box_type);
    EXPECT_EQ(entry.regions[i].first_chunk, decoded.regions[i].first_chunk);
    EXPECT_EQ(entry.regions[i].end_chunk, decoded.regions[i].end_chunk);
  }
  EXPECT_TRUE(decoded.offsets_normalized);
  EXPECT_EQ(32, decoded.payload_pos);
  EXPECT_EQ(0600u, decoded.file_metadata.mode);
  EXPECT_EQ(1500000000, decoded.file_metadata.mtime_sec);
  EXPECT_EQ(entry.asset_metadata, decoded.asset_metadata);
}

TEST(ManifestEntryTest, DecodingRejectsMalformedInput) {
  std::string encoded;
  EncodeManifestEntry(ContainerEntry(), &encoded);
  ManifestEntry decoded;
  std::string error_message;

  EXPECT_FALSE(DecodeManifestEntry(encoded + "x", &decoded, &error_message));
  EXPECT_EQ("1 bytes of trailing garbage", error_message);

  for (size_t len : {size_t(0), size_t(1), size_t(30), encoded.size() - 1}) {
    EXPECT_FALSE(DecodeManifestEntry(re2::StringPiece(encoded).substr(0, len),
                                     &decoded, &error_message))
        << len;
  }

  std::string wrong_version = encoded;
  wrong_version[0] = 2;
  EXPECT_FALSE(DecodeManifestEntry(wrong_version, &decoded, &error_message));
  EXPECT_EQ("unsupported manifest entry version 2", error_message);

  // A size which disagrees with the chunks.
  ManifestEntry entry = ContainerEntry();
  entry.size = 4000;
  encoded.clear();
  EncodeManifestEntry(entry, &encoded);
  EXPECT_FALSE(DecodeManifestEntry(encoded, &decoded, &error_message));
  EXPECT_EQ("chunks total 3532 bytes; file is 4000", error_message);

  // An empty region ahead of the first chunk.
  entry = ContainerEntry();
  entry.regions.insert(entry.regions.begin(),
                       ManifestRegion(ByteRange(0, 0), RegionKind::kMetadata,
                                      FourCC("ftyp")));
  encoded.clear();
  EncodeManifestEntry(entry, &encoded);
  EXPECT_FALSE(DecodeManifestEntry(encoded, &decoded, &error_message));
  EXPECT_EQ("region 0 is empty", error_message);
}

TEST(ManifestEntryTest, BuildRejectsEmptyRegion) {
  StructureMap map;
  map.is_container = true;
  map.regions.emplace_back(ByteRange(0, 0), RegionKind::kMetadata,
                           FourCC("ftyp"));
  map.regions.emplace_back(ByteRange(0, 10), RegionKind::kPayload,
                           FourCC("mdat"));
  ManifestEntry entry;
  std::string error_message;
  EXPECT_FALSE(BuildManifestEntry(
      "a.mp4", FileMetadata(), Hasher(HashAlgorithm::kBlake3).Hash("a"),
      {Ref("a", 0, 10)}, map, false, &entry, &error_message));
  EXPECT_THAT(error_message, HasSubstr("is empty"));
}

TEST(ManifestRecordTest, EncodingAndCommitHash) {
  Hasher hasher(HashAlgorithm::kBlake3);
  ManifestRecord record;
  ASSERT_TRUE(record.repository_id.ParseText(
      "1b4e28ba-2fa1-11d2-883f-0016d3cca427"));
  record.has_parent = true;
  record.parent = hasher.Hash("parent");
  record.entries.push_back(ContainerEntry());
  ManifestEntry other;
  std::string error_message;
  ASSERT_TRUE(BuildManifestEntry("notes.txt", FileMetadata(),
                                 hasher.Hash("notes"),
                                 {Ref("p0", 0, 1000), Ref("n", 1000, 10)},
                                 Passthrough(1010), false, &other,
                                 &error_message));
  record.entries.push_back(other);
  ComputeManifestStats(&record);
  EXPECT_EQ(2, record.stats.files);
  EXPECT_EQ(3532 + 1010, record.stats.bytes);
  EXPECT_EQ(7, record.stats.chunk_refs);
  EXPECT_EQ(6, record.stats.unique_chunks);  // "p0" is shared.
  record.commit = ComputeCommitHash(hasher, record);
  record.signature = "sig";

  std::string encoded;
  EncodeManifestRecord(record, &encoded);
  ManifestRecord decoded;
  ASSERT_TRUE(DecodeManifestRecord(encoded, &decoded, &error_message))
      << error_message;
  EXPECT_EQ(record.repository_id, decoded.repository_id);
  EXPECT_EQ(record.commit, decoded.commit);
  EXPECT_TRUE(decoded.has_parent);
  EXPECT_EQ(record.parent, decoded.parent);
  ASSERT_EQ(2u, decoded.entries.size());
  EXPECT_EQ("notes.txt", decoded.entries[1].path);
  EXPECT_EQ("sig", decoded.signature);

  // The commit hash covers the entries but not the signature.
  EXPECT_EQ(record.commit, ComputeCommitHash(hasher, decoded));
  decoded.signature = "other";
  EXPECT_EQ(record.commit, ComputeCommitHash(hasher, decoded));
  decoded.entries[1].file_metadata.mtime_sec = 1;
  EXPECT_NE(record.commit, ComputeCommitHash(hasher, decoded));
}

TEST(ManifestRecordTest, DecodingValidatesRecord) {
  ManifestRecord record;
  record.entries.push_back(ContainerEntry());
  ManifestEntry other = ContainerEntry();
  other.path = "a.mp4";
  record.entries.push_back(other);
  ComputeManifestStats(&record);

  std::string encoded;
  EncodeManifestRecord(record, &encoded);
  ManifestRecord decoded;
  std::string error_message;
  EXPECT_FALSE(DecodeManifestRecord(encoded, &decoded, &error_message));
  EXPECT_EQ("entry 1 path \"a.mp4\" is out of order", error_message);

  record.entries.pop_back();
  ComputeManifestStats(&record);
  record.stats.bytes = 1;
  encoded.clear();
  EncodeManifestRecord(record, &encoded);
  EXPECT_FALSE(DecodeManifestRecord(encoded, &decoded, &error_message));
  EXPECT_EQ("aggregate stats don't match entries", error_message);
}

class VirtualFileTest : public testing::Test {
 protected:
  VirtualFileTest()
      : clock_(1000000),
        hasher_(HashAlgorithm::kBlake3),
        store_(GetRealFilesystem(), &clock_, &hasher_) {}

  void SetUp() override {
    tmpdir_ = PrepareTempDirOrDie("manifest");
    std::string error_message;
    ASSERT_TRUE(store_.Open(tmpdir_ + "/store", true, &error_message))
        << error_message;
  }

  void Put(re2::StringPiece data, int64_t offset, uint32_t flags,
           std::vector<ChunkRef> *chunks) {
    ContentAddress address;
    std::string error_message;
    CHECK(store_.Put(data, &address, &error_message) == ErrorKind::kOk)
        << error_message;
    chunks->emplace_back(address, offset, data.size(), flags);
  }

  // Stores |data| the way ingest does, with metadata regions whole and
  // payload regions in kPieceSize pieces.
  ManifestEntry Store(re2::StringPiece data, const StructureMap &map,
                      bool normalize) {
    std::string moov = map.moov;
    std::string error_message;
    bool normalized = false;
    if (normalize && !moov.empty()) {
      normalized =
          RebaseChunkOffsets(-map.single_payload_pos, &moov, &error_message);
      CHECK(normalized) << error_message;
    }
    std::vector<ChunkRef> chunks;
    for (const Region &r : map.regions) {
      re2::StringPiece bytes = data.substr(r.range.begin, r.range.size());
      if (r.kind == RegionKind::kMetadata) {
        Put(r.box_type == FourCC("moov") && normalized ? re2::StringPiece(moov)
                                                          : bytes,
            r.range.begin, ChunkRef::kMetadata, &chunks);
        continue;
      }
      for (int64_t p = 0; p < r.range.size(); p += kPieceSize) {
        Put(bytes.substr(p, kPieceSize), r.range.begin + p, 0, &chunks);
      }
    }
    ManifestEntry entry;
    CHECK(BuildManifestEntry("f", FileMetadata(), hasher_.Hash(data), chunks,
                             map, normalized, &entry, &error_message))
        << error_message;
    return entry;
  }

  StructureMap Extract(re2::StringPiece data) {
    std::string path = StrCat(tmpdir_, "/extract", ++files_);
    WriteFileOrDie(path, data);
    std::unique_ptr<File> f;
    CHECK_EQ(0, GetRealFilesystem()->Open(path.c_str(), O_RDONLY, &f));
    StructureMap map;
    std::string error_message;
    CHECK(ExtractStructure(f.get(), data.size(), path, &map, &error_message))
        << error_message;
    return map;
  }

  std::string Reconstruct(const ManifestEntry &entry, Layout layout) {
    std::unique_ptr<VirtualFile> file;
    std::string error_message;
    CHECK(VirtualFile::Open(&store_, &entry, layout, &file, &error_message) ==
          ErrorKind::kOk)
        << error_message;
    std::string path = StrCat(tmpdir_, "/out", ++files_);
    std::unique_ptr<File> out;
    CHECK_EQ(0, GetRealFilesystem()->Open(
                    path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600, &out));
    ErrorKind kind = file->WriteTo(out.get(), &error_message);
    CHECK(kind == ErrorKind::kOk) << error_message;
    CHECK_EQ(0, out->Close());
    return ReadFileOrDie(path);
  }

  std::string tmpdir_;
  int files_ = 0;
  SimulatedClock clock_;
  Hasher hasher_;
  ChunkStore store_;
};

TEST_F(VirtualFileTest, RandomAccessReads) {
  std::string data = RandomBytes(10000, 1);
  ManifestEntry entry = Store(data, Passthrough(data.size()), false);
  ASSERT_EQ(15u, entry.chunks.size());

  std::unique_ptr<VirtualFile> file;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, VirtualFile::Open(&store_, &entry,
                                              Layout::kOriginal, &file,
                                              &error_message));
  EXPECT_EQ(10000, file->size());
  std::string out;
  ASSERT_EQ(ErrorKind::kOk, file->ReadAt(650, 100, &out, &error_message));
  EXPECT_EQ(data.substr(650, 100), out);
  ASSERT_EQ(ErrorKind::kOk, file->ReadAt(1000, 3000, &out, &error_message));
  EXPECT_EQ(data.substr(1000, 3000), out);
  ASSERT_EQ(ErrorKind::kOk, file->ReadAt(9990, 100, &out, &error_message));
  EXPECT_EQ(data.substr(9990), out);
  ASSERT_EQ(ErrorKind::kOk, file->ReadAt(10000, 5, &out, &error_message));
  EXPECT_EQ("", out);
  EXPECT_EQ(ErrorKind::kInvariantViolation,
            file->ReadAt(-1, 5, &out, &error_message));

  // Offsets and lengths far past the end don't overflow.
  ASSERT_EQ(ErrorKind::kOk,
            file->ReadAt(INT64_MAX - 1, 100, &out, &error_message));
  EXPECT_EQ("", out);
  ASSERT_EQ(ErrorKind::kOk,
            file->ReadAt(9000, INT64_MAX, &out, &error_message));
  EXPECT_EQ(data.substr(9000), out);

  EXPECT_EQ(data, Reconstruct(entry, Layout::kOriginal));
}

TEST_F(VirtualFileTest, CorruptChunkFailsRead) {
  std::string data = RandomBytes(3000, 2);
  ManifestEntry entry = Store(data, Passthrough(data.size()), false);
  WriteFileOrDie(store_.ChunkPath(entry.chunks[1].address),
                 RandomBytes(kPieceSize, 3));

  std::unique_ptr<VirtualFile> file;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, VirtualFile::Open(&store_, &entry,
                                              Layout::kOriginal, &file,
                                              &error_message));
  std::string out;
  ASSERT_EQ(ErrorKind::kOk, file->ReadAt(0, 100, &out, &error_message));
  EXPECT_EQ(ErrorKind::kCorruption,
            file->ReadAt(800, 100, &out, &error_message));
  EXPECT_THAT(error_message, HasSubstr("is corrupt"));
}

TEST_F(VirtualFileTest, WrongFullContentHashIsDetected) {
  std::string data = RandomBytes(1000, 4);
  ManifestEntry entry = Store(data, Passthrough(data.size()), false);
  entry.full_content_hash = hasher_.Hash("something else");

  std::unique_ptr<VirtualFile> file;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, VirtualFile::Open(&store_, &entry,
                                              Layout::kOriginal, &file,
                                              &error_message));
  std::unique_ptr<File> out;
  std::string path = tmpdir_ + "/wrong";
  ASSERT_EQ(0, GetRealFilesystem()->Open(
                   path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600, &out));
  EXPECT_EQ(ErrorKind::kCorruption, file->WriteTo(out.get(), &error_message));
  EXPECT_THAT(error_message, HasSubstr("reconstructed file hashes to"));
}

TEST_F(VirtualFileTest, EmptyFile) {
  ManifestEntry entry = Store("", Passthrough(0), false);
  EXPECT_TRUE(entry.chunks.empty());
  EXPECT_EQ("", Reconstruct(entry, Layout::kOriginal));
}

TEST_F(VirtualFileTest, NormalizedContainerRoundTrips) {
  TestMp4Options options;
  for (int i = 0; i < 60; ++i) {
    options.sample_sizes.push_back(500 + 13 * i);
  }
  options.sync_samples = {1, 30};
  options.free_box = true;
  options.audio_track = true;
  TestMp4 mp4 = MakeTestMp4(options);
  StructureMap map = Extract(mp4.data);
  ASSERT_TRUE(map.is_container);

  ManifestEntry entry = Store(mp4.data, map, true);
  ASSERT_TRUE(entry.offsets_normalized);
  EXPECT_EQ(mp4.mdat_data_pos, entry.payload_pos);
  EXPECT_EQ(mp4.data, Reconstruct(entry, Layout::kOriginal));

  // The stored moov differs from the file's.
  int moov_chunk = FindChunkForOffset(entry, mp4.moov_pos);
  ASSERT_GE(moov_chunk, 0);
  std::string stored_moov;
  std::string error_message;
  ASSERT_EQ(ErrorKind::kOk, store_.Get(entry.chunks[moov_chunk].address,
                                       &stored_moov, &error_message));
  EXPECT_NE(mp4.data.substr(mp4.moov_pos, mp4.moov_end - mp4.moov_pos),
            stored_moov);
}

TEST_F(VirtualFileTest, FastStartMovesMoovAndRebasesOffsets) {
  TestMp4Options options;
  for (int i = 0; i < 45; ++i) {
    options.sample_sizes.push_back(800 + 7 * i);
  }
  options.sync_samples = {1, 15, 30};
  options.free_box = true;
  options.use_co64 = true;
  TestMp4 mp4 = MakeTestMp4(options);
  StructureMap original = Extract(mp4.data);
  ManifestEntry entry = Store(mp4.data, original, true);

  std::string fast = Reconstruct(entry, Layout::kFastStart);
  ASSERT_EQ(mp4.data.size(), fast.size());
  StructureMap rearranged = Extract(fast);
  ASSERT_TRUE(rearranged.is_container);
  EXPECT_EQ(24, rearranged.moov_pos);
  ASSERT_EQ(5u, rearranged.regions.size());
  EXPECT_EQ(FourCC("ftyp"), rearranged.regions[0].box_type);
  EXPECT_EQ(FourCC("moov"), rearranged.regions[1].box_type);
  EXPECT_EQ(FourCC("free"), rearranged.regions[2].box_type);
  EXPECT_EQ(FourCC("mdat"), rearranged.regions[3].box_type);
  EXPECT_EQ(fast.substr(rearranged.single_payload_pos),
            mp4.data.substr(mp4.mdat_data_pos,
                            mp4.mdat_end - mp4.mdat_data_pos));

  ASSERT_EQ(3u, rearranged.movie.keyframes.size());
  for (size_t i = 0; i < 3; ++i) {
    const KeyframeInfo &before = original.movie.keyframes[i];
    const KeyframeInfo &after = rearranged.movie.keyframes[i];
    EXPECT_EQ(before.frame_number, after.frame_number);
    EXPECT_EQ(before.size, after.size);
    EXPECT_EQ(mp4.data.substr(before.byte_offset, before.size),
              fast.substr(after.byte_offset, after.size));
  }

  // A fast-start layout of an already fast-start file is the file itself.
  StructureMap again = Extract(fast);
  ManifestEntry fast_entry = Store(fast, again, true);
  EXPECT_EQ(fast, Reconstruct(fast_entry, Layout::kFastStart));
}

TEST_F(VirtualFileTest, FastStartNeedsNormalizedOffsets) {
  std::string data = RandomBytes(2000, 5);
  ManifestEntry entry = Store(data, Passthrough(data.size()), false);
  std::unique_ptr<VirtualFile> file;
  std::string error_message;
  EXPECT_EQ(ErrorKind::kInvariantViolation,
            VirtualFile::Open(&store_, &entry, Layout::kFastStart, &file,
                              &error_message));
  EXPECT_THAT(error_message, HasSubstr("normalized chunk offsets"));
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
