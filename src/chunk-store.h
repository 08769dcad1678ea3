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
// chunk-store.h: the content-addressable chunk store.
//
// On-disk layout beneath the store's root:
//
//   chunks/ab/cd/abcd...  one immutable, read-only file per chunk, named by
//                         the hex of its 32-byte address.
//   tmp/                  partial writes; renamed into chunks/ after fsync.
//   quarantine/           corrupt copies set aside for investigation.
//   index/0.db .. f.db    SQLite reference count index, sharded by the
//                         first hex digit of the address.
//
// A chunk's life cycle is Absent, Stored (refcount >= 1), Zero-Referenced
// (refcount == 0, within the grace period), then either Stored again or
// Collected. The chunk file is always written before its index row is
// inserted, and the row is always deleted before the file is unlinked, so
// a row implies a file except after a crash mid-collection, which Put
// repairs and Get treats as corruption.
//
// Every Get recomputes the chunk's hash. On a mismatch the recovery sources
// are tried in order; a good copy replaces the bad one, which is moved to
// quarantine/. If no source has a good copy the bad one is quarantined
// anyway and Get returns ErrorKind::kCorruption.
//
// Concurrency: writers for different addresses proceed in parallel. Each
// address hashes to one of kStripes mutexes held across its file and index
// updates; the index shards each serialize their own short transactions.
// Reads of stored chunk files take no lock.

#ifndef REELSTORE_CHUNK_STORE_H
#define REELSTORE_CHUNK_STORE_H

#include <stdint.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <re2/stringpiece.h>

#include "common.h"
#include "crypto.h"
#include "filesystem.h"
#include "sqlite.h"
#include "time.h"

namespace reelstore {

// A place to fetch a good copy of a chunk from when the local one is
// corrupt.
class ChunkSource {
 public:
  virtual ~ChunkSource() {}

  virtual std::string name() const = 0;

  // Returns kOk with |data| filled, kNotFound, or kIoError. The store
  // verifies whatever is returned.
  virtual ErrorKind Fetch(const ContentAddress &address, std::string *data,
                          std::string *error_message) = 0;
};

// A local replica laid out as a store's chunks/ directory.
class DirectoryChunkSource : public ChunkSource {
 public:
  DirectoryChunkSource(Filesystem *fs, const std::string &chunks_dir)
      : fs_(fs), chunks_dir_(chunks_dir) {}

  std::string name() const final { return "replica " + chunks_dir_; }
  ErrorKind Fetch(const ContentAddress &address, std::string *data,
                  std::string *error_message) final;

 private:
  Filesystem *fs_;
  std::string chunks_dir_;
};

// Returns "ab/cd/<hex>" for the given address.
std::string ChunkRelativePath(const ContentAddress &address);

struct ChunkStoreStats {
  int64_t chunks = 0;
  int64_t bytes = 0;
  int64_t zero_referenced = 0;
};

struct VerifyResult {
  int64_t checked = 0;
  int64_t recovered = 0;
  bool interrupted = false;

  // Corrupt or missing chunks with no good copy available.
  std::vector<ContentAddress> failed;
};

struct GcOptions {
  // Zero-referenced chunks younger than this are kept.
  int64_t grace_period_sec = 24 * 60 * 60;

  // Chunks examined per index query; the checkpoint is saved after each.
  int batch_size = 1000;

  // Report what would be collected without deleting anything or saving a
  // checkpoint.
  bool dry_run = false;
};

struct GcResult {
  int64_t examined = 0;
  int64_t deleted = 0;
  int64_t deleted_bytes = 0;
  bool interrupted = false;
  bool resumed = false;
};

// Progress of a garbage collection pass: the shard being scanned and the
// last address in it which has been dealt with.
struct GcCheckpoint {
  int shard = 0;
  std::string last_address;  // raw bytes; empty at the start of a shard.
};

// What garbage collection needs from the owner of the manifests: a
// reachability cross-check and somewhere durable to keep its checkpoint.
class GcCatalog {
 public:
  virtual ~GcCatalog() {}

  // Sets |manifest_id| to a retained manifest referencing |address|, or
  // clears it if there is none.
  virtual bool FindReference(const ContentAddress &address,
                             std::string *manifest_id,
                             std::string *error_message) = 0;

  // Sets |found| and, if a pass was interrupted, |checkpoint|.
  virtual bool LoadGcCheckpoint(GcCheckpoint *checkpoint, bool *found,
                                std::string *error_message) = 0;
  virtual bool SaveGcCheckpoint(const GcCheckpoint &checkpoint,
                                std::string *error_message) = 0;
  virtual bool ClearGcCheckpoint(std::string *error_message) = 0;
};

class ChunkStore {
 public:
  static constexpr int kShards = 16;
  static constexpr int kStripes = 1024;

  // |fs|, |clock|, and |hasher| must outlive the ChunkStore.
  ChunkStore(Filesystem *fs, WallClock *clock, const Hasher *hasher);
  ChunkStore(const ChunkStore &) = delete;
  void operator=(const ChunkStore &) = delete;

  // Opens the store at |root|, creating its directories and index if
  // |create|.
  bool Open(const std::string &root, bool create, std::string *error_message);

  // Adds a recovery source, tried after any added before it. |source| must
  // outlive the ChunkStore.
  void AddRecoverySource(ChunkSource *source);

  // Stores |data| if new (refcount 1), or increments the refcount of the
  // existing copy. Fills |address|.
  ErrorKind Put(re2::StringPiece data, ContentAddress *address,
                std::string *error_message);

  // Stores a chunk received from elsewhere, which must hash to |address|
  // (kCorruption otherwise). New chunks start at refcount 0 and so are
  // collectible once the grace period passes unless referenced first.
  ErrorKind PutChunk(const ContentAddress &address, re2::StringPiece data,
                     std::string *error_message);

  // Reads and verifies a chunk, recovering it if necessary.
  ErrorKind Get(const ContentAddress &address, std::string *data,
                std::string *error_message);

  // Adjusts the refcount of a stored chunk. A missing chunk or a decrement
  // below zero is kInvariantViolation.
  ErrorKind AddRef(const ContentAddress &address, std::string *error_message);
  ErrorKind ReleaseRef(const ContentAddress &address,
                       std::string *error_message);

  // Sets (*exists)[i] to whether addresses[i] is stored.
  ErrorKind Exists(const std::vector<ContentAddress> &addresses,
                   std::vector<bool> *exists, std::string *error_message);

  // Returns kNotFound if |address| isn't stored.
  ErrorKind GetRefcount(const ContentAddress &address, int64_t *refcount,
                        std::string *error_message);

  ErrorKind Stats(ChunkStoreStats *stats, std::string *error_message);

  // Re-reads and verifies every stored chunk, recovering what it can.
  // |signal| may be null.
  ErrorKind VerifyAll(const ShutdownSignal *signal, VerifyResult *result,
                      std::string *error_message);

  // Deletes zero-referenced chunks past their grace period, resuming from
  // |catalog|'s checkpoint if a previous pass was interrupted. Stops early
  // (with result->interrupted) after a batch if |signal| is set. Halts with
  // kInvariantViolation if a candidate is still referenced by a manifest.
  ErrorKind GarbageCollect(const GcOptions &options, GcCatalog *catalog,
                           const ShutdownSignal *signal, GcResult *result,
                           std::string *error_message);

  const std::string &root() const { return root_; }
  std::string ChunkPath(const ContentAddress &address) const;
  const Hasher *hasher() const { return hasher_; }

 private:
  struct Shard {
    Database db;
    Statement select_stmt;
    Statement insert_stmt;
    Statement add_ref_stmt;
    Statement release_ref_stmt;
    Statement delete_stmt;
    Statement list_stmt;
    Statement list_unreferenced_stmt;
  };

  static int ShardIndex(const ContentAddress &address) {
    return address.data()[0] >> 4;
  }
  std::mutex *StripeFor(const ContentAddress &address) {
    return &stripes_[((address.data()[1] << 8) | address.data()[2]) %
                     kStripes];
  }

  bool OpenShard(int i, bool create, std::string *error_message);

  // Inserts or increments under the stripe lock. |initial_refcount| is used
  // for a new row.
  ErrorKind Store(const ContentAddress &address, re2::StringPiece data,
                  int64_t initial_refcount, bool increment_existing,
                  std::string *error_message);

  struct Row {
    int64_t size = 0;
    int64_t refcount = 0;
    int64_t zero_since = -1;  // -1 if null.
  };

  // Looks up an index row. Sets |found|, and fills |row| if found.
  bool LookUp(DatabaseContext *ctx, Shard *shard,
              const ContentAddress &address, bool *found, Row *row,
              std::string *error_message);

  // As Get, also reporting whether a recovery source was needed.
  ErrorKind Read(const ContentAddress &address, std::string *data,
                 bool *recovered, std::string *error_message);

  // Deletes one garbage collection candidate if it is still collectible.
  // Sets |deleted_bytes| to its size (or -1 if kept).
  ErrorKind Collect(const ContentAddress &address, int64_t cutoff_sec,
                    bool dry_run, GcCatalog *catalog, int64_t *deleted_bytes,
                    std::string *error_message);

  int WriteChunkFile(const ContentAddress &address, re2::StringPiece data);
  bool ChunkFileExists(const ContentAddress &address);

  // Tries each recovery source. On success replaces the local copy, fills
  // |data| and returns true.
  bool Recover(const ContentAddress &address, bool have_bad_copy,
               std::string *data);
  std::string Quarantine(const ContentAddress &address);

  Filesystem *const fs_;
  WallClock *const clock_;
  const Hasher *const hasher_;
  std::string root_;
  std::vector<ChunkSource *> recovery_sources_;
  std::unique_ptr<Shard> shards_[kShards];
  std::mutex stripes_[kStripes];
  std::atomic<uint64_t> tmp_counter_{0};
};

}  // namespace reelstore

#endif  // REELSTORE_CHUNK_STORE_H
