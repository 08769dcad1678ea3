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
// repository.h: a repository of stored files.
//
// On-disk layout under the repository root:
//
//    meta.db   the manifests (SQLite3): one row per stored file version,
//              plus an index from chunk address to referencing manifests,
//              the repository's identity and hash algorithm, and any
//              interrupted garbage collection's checkpoint.
//    store/    the chunk store (see chunk-store.h).
//
// Adding a file stores its chunks (taking one reference per chunk
// occurrence) and then records its manifest; removing a manifest deletes
// its rows and then releases those references. meta.db is never locked
// while calling into the chunk store, since collection calls back into
// meta.db while holding a store index lock.
//
// Re-adding a path creates a new manifest; the old one is retained until
// removed. Snapshots include only the newest manifest for each path.

#ifndef REELSTORE_REPOSITORY_H
#define REELSTORE_REPOSITORY_H

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "chunk-store.h"
#include "common.h"
#include "crypto.h"
#include "filesystem.h"
#include "ingest.h"
#include "manifest.h"
#include "sqlite.h"
#include "time.h"
#include "uuid.h"

namespace reelstore {

struct ManifestSummary {
  std::string id;
  std::string path;
  int64_t size = 0;
  int64_t created_sec = 0;
  int64_t chunks = 0;
};

// The outcome of adding one file in a batch.
struct AddFileResult {
  std::string path;
  ErrorKind kind = ErrorKind::kOk;
  std::string manifest_id;
  std::string error_message;
  bool skipped = false;  // not attempted because of shutdown.
};

class Repository : public GcCatalog {
 public:
  static constexpr int kSchemaVersion = 1;

  // |fs|, |clock|, and |uuidgen| must outlive the Repository.
  Repository(Filesystem *fs, WallClock *clock, UuidGenerator *uuidgen)
      : fs_(fs), clock_(clock), uuidgen_(uuidgen) {}
  Repository(const Repository &) = delete;
  void operator=(const Repository &) = delete;

  // Creates an empty repository at |root|, which must not already hold one,
  // and opens it.
  bool Init(const std::string &root, HashAlgorithm algorithm,
            std::string *error_message);

  // Opens the repository at |root|. If |expected_algorithm| is non-null,
  // fails unless the repository was created with that algorithm.
  bool Open(const std::string &root, const HashAlgorithm *expected_algorithm,
            std::string *error_message);

  // Stores the file at |path| and records its manifest. Fills |manifest_id|.
  // PRE: ValidateIngestOptions(options) succeeds.
  ErrorKind AddFile(const std::string &path, const IngestOptions &options,
                    std::string *manifest_id, std::string *error_message);

  // Adds |paths| using up to |threads| workers, stopping before starting
  // any further file once |signal| (which may be null) is set. Fills one
  // result per path, in order. Returns the number of files which failed.
  int AddFiles(const std::vector<std::string> &paths,
               const IngestOptions &options, int threads,
               const ShutdownSignal *signal,
               std::vector<AddFileResult> *results);

  ErrorKind RemoveManifest(const std::string &id, std::string *error_message);

  // Sorted by path, then creation order.
  bool ListManifests(std::vector<ManifestSummary> *manifests,
                     std::string *error_message);

  // Returns kNotFound for an unknown id, kCorruption for an undecodable row.
  ErrorKind GetManifest(const std::string &id, ManifestEntry *entry,
                        std::string *error_message);

  // Builds an unsigned record of the newest manifest of each path.
  // |parent| may be null.
  ErrorKind Snapshot(const ContentAddress *parent, ManifestRecord *record,
                     std::string *error_message);

  ErrorKind GarbageCollect(const GcOptions &options,
                           const ShutdownSignal *signal, GcResult *result,
                           std::string *error_message) {
    return store_->GarbageCollect(options, this, signal, result,
                                  error_message);
  }

  // GcCatalog implementation.
  bool FindReference(const ContentAddress &address, std::string *manifest_id,
                     std::string *error_message) final;
  bool LoadGcCheckpoint(GcCheckpoint *checkpoint, bool *found,
                        std::string *error_message) final;
  bool SaveGcCheckpoint(const GcCheckpoint &checkpoint,
                        std::string *error_message) final;
  bool ClearGcCheckpoint(std::string *error_message) final;

  ChunkStore *store() { return store_.get(); }
  const Hasher &hasher() const { return *hasher_; }
  const Uuid &id() const { return id_; }
  const std::string &root() const { return root_; }

 private:
  // Inserts the manifest rows for |entry|.
  bool Record(const std::string &id, const ManifestEntry &entry,
              std::string *error_message);

  // Releases one reference per chunk occurrence in |addresses|, stopping at
  // the first failure.
  ErrorKind ReleaseAll(const std::vector<ContentAddress> &addresses,
                       std::string *error_message);

  Filesystem *const fs_;
  WallClock *const clock_;
  UuidGenerator *const uuidgen_;
  std::string root_;
  Uuid id_;
  std::unique_ptr<Hasher> hasher_;
  std::unique_ptr<ChunkStore> store_;

  Database db_;
  Statement insert_manifest_stmt_;
  Statement insert_manifest_chunk_stmt_;
  Statement select_manifest_stmt_;
  Statement find_reference_stmt_;
  Statement load_checkpoint_stmt_;
  Statement save_checkpoint_stmt_;
};

}  // namespace reelstore

#endif  // REELSTORE_REPOSITORY_H
