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
// ingest.cc: see ingest.h.

#include "ingest.h"

#include <string.h>
#include <sys/stat.h>

#include <algorithm>
#include <initializer_list>
#include <memory>

#include <glog/logging.h>

#include "reader.h"
#include "string.h"

namespace reelstore {

// References taken during one Ingest call. Released on destruction unless
// committed.
class Ingester::PendingRefs {
 public:
  explicit PendingRefs(ChunkStore *store) : store_(store) {}
  PendingRefs(const PendingRefs &) = delete;
  void operator=(const PendingRefs &) = delete;

  ~PendingRefs() {
    for (const auto &address : addresses_) {
      std::string error_message;
      ErrorKind kind = store_->ReleaseRef(address, &error_message);
      if (kind != ErrorKind::kOk) {
        LOG(ERROR) << "Unable to release reference to chunk "
                   << address.ToHex() << " after failed ingest: "
                   << ErrorKindName(kind) << ": " << error_message;
      }
    }
  }

  void Add(const ContentAddress &address) { addresses_.push_back(address); }
  void Commit() { addresses_.clear(); }

 private:
  ChunkStore *store_;
  std::vector<ContentAddress> addresses_;
};

bool ValidateIngestOptions(const IngestOptions &options,
                           std::string *error_message) {
  for (const ChunkerConfig *config :
       {&options.chunker, &options.container_chunker}) {
    if (!ValidateChunkerConfig(*config, error_message)) {
      return false;
    }
    if (!ValidateAlignerConfig(EffectiveAlignerConfig(options, *config),
                               *config, error_message)) {
      return false;
    }
  }
  return true;
}

AlignerConfig EffectiveAlignerConfig(const IngestOptions &options,
                                     const ChunkerConfig &chunker) {
  AlignerConfig config = options.aligner;
  AlignerConfig derived = AlignerConfig::ForChunker(chunker);
  if (config.max_shift == 0) {
    config.max_shift = derived.max_shift;
  }
  if (config.absolute_min == 0) {
    config.absolute_min = derived.absolute_min;
  }
  return config;
}

Ingester::Ingester(ChunkStore *store, const IngestOptions &options)
    : store_(store), hasher_(store->hasher()), options_(options) {
  std::string error_message;
  CHECK(ValidateIngestOptions(options, &error_message)) << error_message;
}

Ingester::Ingester(const Hasher *hasher, const IngestOptions &options)
    : store_(nullptr), hasher_(hasher), options_(options) {
  std::string error_message;
  CHECK(ValidateIngestOptions(options, &error_message)) << error_message;
}

ErrorKind Ingester::Ingest(File *file, const std::string &path,
                           ManifestEntry *entry, IngestStats *stats,
                           std::string *error_message) {
  struct stat st;
  int ret = file->Stat(&st);
  if (ret != 0) {
    *error_message = StrCat("stat ", path, ": ", strerror(ret));
    return ErrorKind::kIoError;
  }
  FileMetadata metadata;
  metadata.mode = st.st_mode & 07777;
  metadata.mtime_sec = st.st_mtime;

  StructureMap map;
  if (!ExtractStructure(file, st.st_size, path, &map, error_message)) {
    return ErrorKind::kIoError;
  }
  const ChunkerConfig &chunker =
      map.is_container ? options_.container_chunker : options_.chunker;

  std::string normalized_moov;
  bool normalized = false;
  if (options_.normalize_offsets && map.single_payload_pos >= 0 &&
      !map.moov.empty()) {
    normalized_moov = map.moov;
    std::string rebase_error;
    normalized = RebaseChunkOffsets(-map.single_payload_pos, &normalized_moov,
                                    &rebase_error);
    if (!normalized) {
      VLOG(1) << path << ": storing chunk offsets as-is: " << rebase_error;
    }
  }

  PendingRefs refs(store_);
  std::unique_ptr<Digest> digest = hasher_->NewDigest();
  std::vector<ChunkRef> chunks;
  IngestStats local_stats;
  for (const auto &region : map.regions) {
    ErrorKind kind;
    if (region.kind == RegionKind::kMetadata) {
      const std::string *replacement =
          (normalized && region.range.begin == map.moov_pos)
              ? &normalized_moov
              : nullptr;
      kind = StoreMetadata(file, region, replacement, digest.get(), chunker,
                           &refs, &chunks, error_message);
    } else {
      kind = StorePayload(file, region, map, digest.get(), chunker, &refs,
                          &chunks, &local_stats, error_message);
    }
    if (kind != ErrorKind::kOk) {
      *error_message = StrCat(path, ": ", *error_message);
      return kind;
    }
  }

  ContentAddress full_content_hash;
  CHECK(ContentAddress::FromBytes(digest->Finalize(), &full_content_hash));
  for (const auto &c : chunks) {
    ++local_stats.chunks;
    if (c.flags & ChunkRef::kMetadata) ++local_stats.metadata_chunks;
    if (c.flags & ChunkRef::kKeyframeAligned) {
      ++local_stats.keyframe_aligned_chunks;
    }
  }
  if (!BuildManifestEntry(path, metadata, full_content_hash, std::move(chunks),
                          map, normalized, entry, error_message)) {
    *error_message = StrCat(path, ": ", *error_message);
    return ErrorKind::kInvariantViolation;
  }
  refs.Commit();
  if (stats != nullptr) {
    *stats = local_stats;
  }
  return ErrorKind::kOk;
}

ErrorKind Ingester::StoreMetadata(File *file, const Region &region,
                                  const std::string *replacement,
                                  Digest *digest, const ChunkerConfig &chunker,
                                  PendingRefs *refs,
                                  std::vector<ChunkRef> *chunks,
                                  std::string *error_message) {
  std::string data;
  for (int64_t pos = region.range.begin; pos < region.range.end;) {
    int64_t len = std::min<int64_t>(region.range.end - pos, chunker.max_size);
    int ret = PreadFully(file, pos, len, &data);
    if (ret != 0) {
      *error_message = StrCat("read metadata at ", pos, ": ", strerror(ret));
      return ErrorKind::kIoError;
    }
    digest->Update(data);
    re2::StringPiece stored = data;
    if (replacement != nullptr) {
      stored = re2::StringPiece(*replacement).substr(pos - region.range.begin,
                                                     len);
    }
    ErrorKind kind =
        StoreOne(stored, pos, ChunkRef::kMetadata, refs, chunks, error_message);
    if (kind != ErrorKind::kOk) {
      return kind;
    }
    pos += len;
  }
  return ErrorKind::kOk;
}

ErrorKind Ingester::StorePayload(File *file, const Region &region,
                                 const StructureMap &map, Digest *digest,
                                 const ChunkerConfig &chunker,
                                 PendingRefs *refs,
                                 std::vector<ChunkRef> *chunks,
                                 IngestStats *stats,
                                 std::string *error_message) {
  std::vector<int64_t> keyframes;
  if (options_.aligner.prefer_keyframe) {
    for (const auto &k : map.movie.keyframes) {
      if (k.byte_offset >= region.range.begin &&
          k.byte_offset < region.range.end) {
        keyframes.push_back(k.byte_offset - region.range.begin);
      }
    }
  }
  if (!keyframes.empty()) {
    return StoreAligned(file, region, keyframes,
                        map.movie.all_frames_are_keyframes, digest, chunker,
                        refs, chunks, stats, error_message);
  }

  FileRangeReader file_reader(file, region.range);
  DigestingReader reader(&file_reader, digest);
  Chunker c(chunker, &reader);
  Chunk chunk;
  while (c.Next(&chunk, error_message)) {
    ErrorKind kind = StoreOne(chunk.data, region.range.begin + chunk.offset, 0,
                              refs, chunks, error_message);
    if (kind != ErrorKind::kOk) {
      return kind;
    }
  }
  return error_message->empty() ? ErrorKind::kOk : ErrorKind::kIoError;
}

ErrorKind Ingester::StoreAligned(File *file, const Region &region,
                                 const std::vector<int64_t> &keyframes,
                                 bool intra_only, Digest *digest,
                                 const ChunkerConfig &chunker,
                                 PendingRefs *refs,
                                 std::vector<ChunkRef> *chunks,
                                 IngestStats *stats,
                                 std::string *error_message) {
  // First pass: the chunker's own boundaries.
  std::vector<int64_t> ends;
  {
    FileRangeReader reader(file, region.range);
    Chunker c(chunker, &reader);
    Chunk chunk;
    while (c.Next(&chunk, error_message)) {
      ends.push_back(chunk.offset + static_cast<int64_t>(chunk.data.size()));
    }
    if (!error_message->empty()) {
      return ErrorKind::kIoError;
    }
  }
  if (ends.empty()) {
    return ErrorKind::kOk;
  }

  KeyframeAligner aligner(chunker, EffectiveAlignerConfig(options_, chunker));
  AlignmentResult result = aligner.Align(ends, keyframes, intra_only);
  stats->shifts += result.shifts.size();
  stats->rejected_shifts += result.rejected;

  // Second pass: read and store the adjusted chunks.
  std::string data;
  for (const auto &aligned : result.chunks) {
    int64_t pos = region.range.begin + aligned.range.begin;
    int ret = PreadFully(file, pos, aligned.range.size(), &data);
    if (ret != 0) {
      *error_message = StrCat("read payload at ", pos, ": ", strerror(ret));
      return ErrorKind::kIoError;
    }
    digest->Update(data);
    ErrorKind kind = StoreOne(
        data, pos, aligned.starts_at_keyframe ? ChunkRef::kKeyframeAligned : 0,
        refs, chunks, error_message);
    if (kind != ErrorKind::kOk) {
      return kind;
    }
  }
  return ErrorKind::kOk;
}

ErrorKind Ingester::StoreOne(re2::StringPiece data, int64_t offset,
                             uint32_t flags, PendingRefs *refs,
                             std::vector<ChunkRef> *chunks,
                             std::string *error_message) {
  ContentAddress address;
  if (store_ == nullptr) {
    address = hasher_->Hash(data);
  } else {
    ErrorKind kind = store_->Put(data, &address, error_message);
    if (kind != ErrorKind::kOk) {
      return kind;
    }
    refs->Add(address);
  }
  chunks->emplace_back(address, offset, data.size(), flags);
  return ErrorKind::kOk;
}

}  // namespace reelstore
