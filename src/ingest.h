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
// ingest.h: splitting one file into stored chunks.
//
// Container metadata regions are stored whole (split only past max_size) and
// flagged as metadata. Payload regions go through the content-defined
// chunker; when the file has video keyframes inside a region, boundaries are
// first collected in one pass, adjusted by the keyframe aligner, and the
// adjusted chunks are read back and stored in a second pass. Otherwise each
// chunk is stored as the chunker produces it.
//
// The full content hash is computed over the original bytes in file order,
// even when the stored moov has normalized chunk offsets.

#ifndef REELSTORE_INGEST_H
#define REELSTORE_INGEST_H

#include <stdint.h>

#include <string>
#include <vector>

#include "chunk-store.h"
#include "chunker.h"
#include "common.h"
#include "filesystem.h"
#include "keyframe-aligner.h"
#include "manifest.h"

namespace reelstore {

struct IngestOptions {
  // Used for files which aren't ISOBMFF containers.
  ChunkerConfig chunker = ChunkerConfig::Default();

  // Used for ISOBMFF containers.
  ChunkerConfig container_chunker = ChunkerConfig::Video();

  // max_shift and absolute_min of 0 are derived from the chunker config in
  // use (see AlignerConfig::ForChunker).
  AlignerConfig aligner;

  // Store the moov with chunk offsets relative to the mdat payload, so the
  // same media re-muxed with different metadata sizes still deduplicates.
  bool normalize_offsets = true;
};

// Checks both chunker configs and the effective aligner configs.
bool ValidateIngestOptions(const IngestOptions &options,
                           std::string *error_message);

// Returns |options.aligner| with derived fields filled in for |chunker|.
AlignerConfig EffectiveAlignerConfig(const IngestOptions &options,
                                     const ChunkerConfig &chunker);

struct IngestStats {
  int64_t chunks = 0;
  int64_t metadata_chunks = 0;
  int64_t keyframe_aligned_chunks = 0;
  int64_t shifts = 0;
  int64_t rejected_shifts = 0;
};

class Ingester {
 public:
  // PRE: ValidateIngestOptions(options) succeeds. |store| must outlive the
  // Ingester.
  Ingester(ChunkStore *store, const IngestOptions &options);

  // Plans chunks without storing them: Ingest only hashes each chunk.
  Ingester(const Hasher *hasher, const IngestOptions &options);

  Ingester(const Ingester &) = delete;
  void operator=(const Ingester &) = delete;

  // Stores every chunk of |file| and fills |entry|. On success the caller
  // owns one reference per entry->chunks element; on failure every
  // reference taken has been released again.
  ErrorKind Ingest(File *file, const std::string &path, ManifestEntry *entry,
                   IngestStats *stats, std::string *error_message);

 private:
  class PendingRefs;

  ErrorKind StoreMetadata(File *file, const Region &region,
                          const std::string *replacement, Digest *digest,
                          const ChunkerConfig &chunker, PendingRefs *refs,
                          std::vector<ChunkRef> *chunks,
                          std::string *error_message);
  ErrorKind StorePayload(File *file, const Region &region,
                         const StructureMap &map, Digest *digest,
                         const ChunkerConfig &chunker, PendingRefs *refs,
                         std::vector<ChunkRef> *chunks, IngestStats *stats,
                         std::string *error_message);
  ErrorKind StoreAligned(File *file, const Region &region,
                         const std::vector<int64_t> &keyframes,
                         bool intra_only, Digest *digest,
                         const ChunkerConfig &chunker, PendingRefs *refs,
                         std::vector<ChunkRef> *chunks, IngestStats *stats,
                         std::string *error_message);
  ErrorKind StoreOne(re2::StringPiece data, int64_t offset, uint32_t flags,
                     PendingRefs *refs, std::vector<ChunkRef> *chunks,
                     std::string *error_message);

  ChunkStore *const store_;  // may be null.
  const Hasher *const hasher_;
  const IngestOptions options_;
};

}  // namespace reelstore

#endif  // REELSTORE_INGEST_H
