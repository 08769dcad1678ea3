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
// chunk-store.cc: implementation of chunk-store.h interface.

#include "chunk-store.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <glog/logging.h>

#include "string.h"

namespace reelstore {

namespace {

const char kSchemaSql[] = R"(
    pragma journal_mode = wal;

    create table if not exists chunk (
      address blob primary key check (length(address) = 32),
      size integer not null check (size >= 0),
      refcount integer not null check (refcount >= 0),

      -- The time (in seconds since epoch) the refcount last became zero, or
      -- null if it is positive.
      zero_since integer,
      created_sec integer not null
    ) without rowid;

    create index if not exists chunk_zero_since on chunk (zero_since)
        where refcount = 0;
)";

// The number of times Put will rewrite a chunk file which vanishes between
// being written and being indexed (a concurrent collection in another
// process).
const int kMaxPutAttempts = 3;

}  // namespace

constexpr int ChunkStore::kShards;
constexpr int ChunkStore::kStripes;

std::string ChunkRelativePath(const ContentAddress &address) {
  std::string hex = address.ToHex();
  return StrCat(hex.substr(0, 2), "/", hex.substr(2, 2), "/", hex);
}

ErrorKind DirectoryChunkSource::Fetch(const ContentAddress &address,
                                      std::string *data,
                                      std::string *error_message) {
  std::string path = StrCat(chunks_dir_, "/", ChunkRelativePath(address));
  int ret = ReadFileContents(fs_, path, data);
  if (ret == ENOENT) {
    return ErrorKind::kNotFound;
  } else if (ret != 0) {
    *error_message = StrCat("reading ", path, ": ", strerror(ret));
    return ErrorKind::kIoError;
  }
  return ErrorKind::kOk;
}

ChunkStore::ChunkStore(Filesystem *fs, WallClock *clock, const Hasher *hasher)
    : fs_(fs), clock_(clock), hasher_(hasher) {}

bool ChunkStore::Open(const std::string &root, bool create,
                      std::string *error_message) {
  root_ = root;
  const char *subdirs[] = {"chunks", "tmp", "quarantine", "index"};
  for (const char *subdir : subdirs) {
    std::string path = StrCat(root_, "/", subdir);
    int ret;
    if (create) {
      ret = MkdirAll(fs_, path, 0700);
    } else {
      struct stat buf;
      ret = fs_->Stat(path.c_str(), &buf);
    }
    if (ret != 0) {
      *error_message = StrCat("chunk store directory ", path, ": ",
                              strerror(ret));
      return false;
    }
  }
  for (int i = 0; i < kShards; ++i) {
    if (!OpenShard(i, create, error_message)) {
      return false;
    }
  }
  return true;
}

bool ChunkStore::OpenShard(int i, bool create, std::string *error_message) {
  std::unique_ptr<Shard> shard(new Shard);
  std::string path = StrCat(root_, "/index/",
                            std::string(1, "0123456789abcdef"[i]), ".db");
  int flags = SQLITE_OPEN_READWRITE | (create ? SQLITE_OPEN_CREATE : 0);
  if (!shard->db.Open(path.c_str(), flags, error_message)) {
    *error_message = StrCat("index shard ", path, ": ", *error_message);
    return false;
  }
  {
    DatabaseContext ctx(&shard->db);
    if (!RunStatements(&ctx, kSchemaSql, error_message)) {
      *error_message = StrCat("index shard ", path, ": ", *error_message);
      return false;
    }
  }

  struct {
    Statement *stmt;
    const char *sql;
  } statements[] = {
      {&shard->select_stmt,
       "select size, refcount, zero_since from chunk where address = "
       ":address;"},
      {&shard->insert_stmt,
       "insert into chunk (address, size, refcount, zero_since, created_sec)\n"
       "    values (:address, :size, :refcount,\n"
       "            case when :refcount = 0 then :now end, :now);"},
      {&shard->add_ref_stmt,
       "update chunk set refcount = refcount + 1, zero_since = null\n"
       "    where address = :address;"},
      {&shard->release_ref_stmt,
       "update chunk set refcount = refcount - 1,\n"
       "    zero_since = case when refcount = 1 then :now end\n"
       "    where address = :address;"},
      {&shard->delete_stmt,
       "delete from chunk where address = :address and refcount = 0;"},
      {&shard->list_stmt,
       "select address from chunk where address > :after\n"
       "    order by address limit :limit;"},
      {&shard->list_unreferenced_stmt,
       "select address, zero_since from chunk\n"
       "    where refcount = 0 and address > :after\n"
       "    order by address limit :limit;"},
  };
  for (const auto &s : statements) {
    *s.stmt = shard->db.Prepare(s.sql, nullptr, error_message);
    if (!s.stmt->valid()) {
      return false;
    }
  }
  shards_[i] = std::move(shard);
  return true;
}

void ChunkStore::AddRecoverySource(ChunkSource *source) {
  recovery_sources_.push_back(source);
}

std::string ChunkStore::ChunkPath(const ContentAddress &address) const {
  return StrCat(root_, "/chunks/", ChunkRelativePath(address));
}

bool ChunkStore::LookUp(DatabaseContext *ctx, Shard *shard,
                        const ContentAddress &address, bool *found, Row *row,
                        std::string *error_message) {
  auto run = ctx->Borrow(&shard->select_stmt);
  run.BindBlob(":address", address.as_piece());
  *found = false;
  if (run.Step() == SQLITE_ROW) {
    *found = true;
    row->size = run.ColumnInt64(0);
    row->refcount = run.ColumnInt64(1);
    row->zero_since =
        run.ColumnType(2) == SQLITE_NULL ? -1 : run.ColumnInt64(2);
    run.Step();
  }
  if (run.status() != SQLITE_DONE) {
    *error_message = StrCat("looking up chunk ", address.ToHex(), ": ",
                            run.error_message());
    return false;
  }
  return true;
}

int ChunkStore::WriteChunkFile(const ContentAddress &address,
                               re2::StringPiece data) {
  std::string path = ChunkPath(address);
  int ret = MkdirAll(fs_, path.substr(0, path.rfind('/')), 0700);
  if (ret != 0) {
    return ret;
  }
  std::string tmp_path =
      StrCat(root_, "/tmp/", address.ToHex(), ".", getpid(), ".",
             tmp_counter_.fetch_add(1, std::memory_order_relaxed));
  return WriteFileAtomically(fs_, tmp_path, path, data);
}

bool ChunkStore::ChunkFileExists(const ContentAddress &address) {
  struct stat buf;
  return fs_->Stat(ChunkPath(address).c_str(), &buf) == 0;
}

ErrorKind ChunkStore::Put(re2::StringPiece data, ContentAddress *address,
                          std::string *error_message) {
  *address = hasher_->Hash(data);
  return Store(*address, data, 1, true, error_message);
}

ErrorKind ChunkStore::PutChunk(const ContentAddress &address,
                               re2::StringPiece data,
                               std::string *error_message) {
  ContentAddress actual = hasher_->Hash(data);
  if (actual != address) {
    *error_message = StrCat("chunk claimed to be ", address.ToHex(),
                            " hashes to ", actual.ToHex());
    return ErrorKind::kCorruption;
  }
  return Store(address, data, 0, false, error_message);
}

ErrorKind ChunkStore::Store(const ContentAddress &address,
                            re2::StringPiece data, int64_t initial_refcount,
                            bool increment_existing,
                            std::string *error_message) {
  std::lock_guard<std::mutex> stripe(*StripeFor(address));
  Shard *shard = shards_[ShardIndex(address)].get();
  const std::string hex = address.ToHex();

  // Fast path: the chunk is already stored.
  {
    DatabaseContext ctx(&shard->db);
    if (!ctx.BeginImmediateTransaction(error_message)) {
      return ErrorKind::kIoError;
    }
    bool found;
    Row row;
    if (!LookUp(&ctx, shard, address, &found, &row, error_message)) {
      ctx.RollbackTransaction();
      return ErrorKind::kIoError;
    }
    if (found && ChunkFileExists(address)) {
      if (increment_existing) {
        auto run = ctx.Borrow(&shard->add_ref_stmt);
        run.BindBlob(":address", address.as_piece());
        if (run.Step() != SQLITE_DONE) {
          *error_message = StrCat("adding reference to chunk ", hex, ": ",
                                  run.error_message());
          ctx.RollbackTransaction();
          return ErrorKind::kIoError;
        }
      }
      if (!ctx.CommitTransaction(error_message)) {
        return ErrorKind::kIoError;
      }
      return ErrorKind::kOk;
    }
    ctx.RollbackTransaction();
    if (found) {
      LOG(WARNING) << "chunk " << hex
                   << " is indexed but its file is missing; rewriting";
    }
  }

  for (int attempt = 1;; ++attempt) {
    int ret = WriteChunkFile(address, data);
    if (ret != 0) {
      *error_message = StrCat("writing chunk ", hex, ": ", strerror(ret));
      return ErrorKind::kIoError;
    }

    DatabaseContext ctx(&shard->db);
    if (!ctx.BeginImmediateTransaction(error_message)) {
      return ErrorKind::kIoError;
    }
    if (!ChunkFileExists(address)) {
      ctx.RollbackTransaction();
      if (attempt == kMaxPutAttempts) {
        *error_message = StrCat("chunk ", hex, " was removed ", attempt,
                                " times while being stored");
        return ErrorKind::kIoError;
      }
      continue;
    }
    bool found;
    Row row;
    if (!LookUp(&ctx, shard, address, &found, &row, error_message)) {
      ctx.RollbackTransaction();
      return ErrorKind::kIoError;
    }
    if (!found || increment_existing) {
      RunningStatement run = found ? ctx.Borrow(&shard->add_ref_stmt)
                                   : ctx.Borrow(&shard->insert_stmt);
      run.BindBlob(":address", address.as_piece());
      if (!found) {
        run.BindInt64(":size", data.size());
        run.BindInt64(":refcount", initial_refcount);
        run.BindInt64(":now", clock_->Now().tv_sec);
      }
      if (run.Step() != SQLITE_DONE) {
        *error_message = StrCat("indexing chunk ", hex, ": ",
                                run.error_message());
        ctx.RollbackTransaction();
        return ErrorKind::kIoError;
      }
    }
    if (!ctx.CommitTransaction(error_message)) {
      return ErrorKind::kIoError;
    }
    VLOG(2) << "stored chunk " << hex << " (" << data.size() << " bytes)";
    return ErrorKind::kOk;
  }
}

ErrorKind ChunkStore::Get(const ContentAddress &address, std::string *data,
                          std::string *error_message) {
  bool recovered;
  return Read(address, data, &recovered, error_message);
}

ErrorKind ChunkStore::Read(const ContentAddress &address, std::string *data,
                           bool *recovered, std::string *error_message) {
  *recovered = false;
  const std::string path = ChunkPath(address);
  const std::string hex = address.ToHex();
  int ret = ReadFileContents(fs_, path, data);
  if (ret == 0 && hasher_->Verify(*data, address)) {
    return ErrorKind::kOk;
  }
  if (ret != 0 && ret != ENOENT) {
    *error_message = StrCat("reading ", path, ": ", strerror(ret));
    return ErrorKind::kIoError;
  }

  const bool have_bad_copy = ret == 0;
  if (have_bad_copy) {
    LOG(ERROR) << "chunk " << hex << " failed verification; its "
               << data->size() << "-byte file hashes to "
               << hasher_->Hash(*data).ToHex();
  } else {
    Shard *shard = shards_[ShardIndex(address)].get();
    bool found;
    Row row;
    {
      DatabaseContext ctx(&shard->db);
      if (!LookUp(&ctx, shard, address, &found, &row, error_message)) {
        return ErrorKind::kIoError;
      }
    }
    if (!found) {
      *error_message = StrCat("chunk ", hex, " not found");
      return ErrorKind::kNotFound;
    }
    LOG(ERROR) << "chunk " << hex << " is indexed but its file is missing";
  }

  std::lock_guard<std::mutex> stripe(*StripeFor(address));
  if (Recover(address, have_bad_copy, data)) {
    *recovered = true;
    return ErrorKind::kOk;
  }
  data->clear();
  if (have_bad_copy) {
    std::string quarantined = Quarantine(address);
    *error_message = StrCat("chunk ", hex, " is corrupt (moved to ",
                            quarantined, ") and no recovery source has it");
  } else {
    *error_message =
        StrCat("chunk ", hex, " is missing and no recovery source has it");
  }
  return ErrorKind::kCorruption;
}

bool ChunkStore::Recover(const ContentAddress &address, bool have_bad_copy,
                         std::string *data) {
  const std::string hex = address.ToHex();
  for (ChunkSource *source : recovery_sources_) {
    std::string error_message;
    std::string fetched;
    ErrorKind kind = source->Fetch(address, &fetched, &error_message);
    if (kind == ErrorKind::kNotFound) {
      VLOG(1) << source->name() << " doesn't have chunk " << hex;
      continue;
    } else if (kind != ErrorKind::kOk) {
      LOG(WARNING) << "fetching chunk " << hex << " from " << source->name()
                   << ": " << error_message;
      continue;
    }
    if (!hasher_->Verify(fetched, address)) {
      LOG(WARNING) << source->name() << " has a corrupt copy of chunk " << hex;
      continue;
    }
    if (have_bad_copy) {
      Quarantine(address);
    }
    int ret = WriteChunkFile(address, fetched);
    if (ret != 0) {
      LOG(ERROR) << "unable to replace chunk " << hex << ": " << strerror(ret);
    }
    LOG(WARNING) << "recovered chunk " << hex << " from " << source->name();
    data->swap(fetched);
    return true;
  }
  return false;
}

std::string ChunkStore::Quarantine(const ContentAddress &address) {
  std::string path = ChunkPath(address);
  std::string dest = StrCat(root_, "/quarantine/", address.ToHex(), ".",
                            clock_->Now().tv_sec);
  int ret = fs_->Rename(path.c_str(), dest.c_str());
  if (ret != 0) {
    LOG(ERROR) << "unable to quarantine " << path << ": " << strerror(ret);
    return path;
  }
  LOG(WARNING) << "quarantined corrupt chunk as " << dest;
  return dest;
}

ErrorKind ChunkStore::AddRef(const ContentAddress &address,
                             std::string *error_message) {
  std::lock_guard<std::mutex> stripe(*StripeFor(address));
  Shard *shard = shards_[ShardIndex(address)].get();
  DatabaseContext ctx(&shard->db);
  auto run = ctx.Borrow(&shard->add_ref_stmt);
  run.BindBlob(":address", address.as_piece());
  if (run.Step() != SQLITE_DONE) {
    *error_message = StrCat("adding reference to chunk ", address.ToHex(),
                            ": ", run.error_message());
    return ErrorKind::kIoError;
  }
  if (ctx.changes() != 1) {
    *error_message =
        StrCat("adding reference to absent chunk ", address.ToHex());
    return ErrorKind::kInvariantViolation;
  }
  return ErrorKind::kOk;
}

ErrorKind ChunkStore::ReleaseRef(const ContentAddress &address,
                                 std::string *error_message) {
  std::lock_guard<std::mutex> stripe(*StripeFor(address));
  Shard *shard = shards_[ShardIndex(address)].get();
  DatabaseContext ctx(&shard->db);
  auto run = ctx.Borrow(&shard->release_ref_stmt);
  run.BindBlob(":address", address.as_piece());
  run.BindInt64(":now", clock_->Now().tv_sec);
  if (run.Step() != SQLITE_DONE) {
    if (IsConstraintViolation(run.status())) {
      *error_message = StrCat("refcount of chunk ", address.ToHex(),
                              " would become negative");
      return ErrorKind::kInvariantViolation;
    }
    *error_message = StrCat("releasing reference to chunk ", address.ToHex(),
                            ": ", run.error_message());
    return ErrorKind::kIoError;
  }
  if (ctx.changes() != 1) {
    *error_message =
        StrCat("releasing reference to absent chunk ", address.ToHex());
    return ErrorKind::kInvariantViolation;
  }
  return ErrorKind::kOk;
}

ErrorKind ChunkStore::Exists(const std::vector<ContentAddress> &addresses,
                             std::vector<bool> *exists,
                             std::string *error_message) {
  exists->assign(addresses.size(), false);
  std::vector<size_t> by_shard[kShards];
  for (size_t i = 0; i < addresses.size(); ++i) {
    by_shard[ShardIndex(addresses[i])].push_back(i);
  }
  for (int s = 0; s < kShards; ++s) {
    if (by_shard[s].empty()) {
      continue;
    }
    Shard *shard = shards_[s].get();
    DatabaseContext ctx(&shard->db);
    for (size_t i : by_shard[s]) {
      bool found;
      Row row;
      if (!LookUp(&ctx, shard, addresses[i], &found, &row, error_message)) {
        return ErrorKind::kIoError;
      }
      (*exists)[i] = found;
    }
  }
  return ErrorKind::kOk;
}

ErrorKind ChunkStore::GetRefcount(const ContentAddress &address,
                                  int64_t *refcount,
                                  std::string *error_message) {
  Shard *shard = shards_[ShardIndex(address)].get();
  DatabaseContext ctx(&shard->db);
  bool found;
  Row row;
  if (!LookUp(&ctx, shard, address, &found, &row, error_message)) {
    return ErrorKind::kIoError;
  }
  if (!found) {
    *error_message = StrCat("chunk ", address.ToHex(), " not found");
    return ErrorKind::kNotFound;
  }
  *refcount = row.refcount;
  return ErrorKind::kOk;
}

ErrorKind ChunkStore::Stats(ChunkStoreStats *stats,
                            std::string *error_message) {
  *stats = ChunkStoreStats();
  for (int s = 0; s < kShards; ++s) {
    DatabaseContext ctx(&shards_[s]->db);
    auto run = ctx.UseOnce(
        "select count(*), coalesce(sum(size), 0),\n"
        "       coalesce(sum(refcount = 0), 0) from chunk;");
    if (run.Step() != SQLITE_ROW) {
      *error_message = StrCat("counting chunks: ", run.error_message());
      return ErrorKind::kIoError;
    }
    stats->chunks += run.ColumnInt64(0);
    stats->bytes += run.ColumnInt64(1);
    stats->zero_referenced += run.ColumnInt64(2);
  }
  return ErrorKind::kOk;
}

ErrorKind ChunkStore::VerifyAll(const ShutdownSignal *signal,
                                VerifyResult *result,
                                std::string *error_message) {
  *result = VerifyResult();
  const int kBatchSize = 1000;
  for (int s = 0; s < kShards; ++s) {
    Shard *shard = shards_[s].get();
    std::string after;
    for (;;) {
      std::vector<ContentAddress> batch;
      {
        DatabaseContext ctx(&shard->db);
        auto run = ctx.Borrow(&shard->list_stmt);
        run.BindBlob(":after", after);
        run.BindInt64(":limit", kBatchSize);
        while (run.Step() == SQLITE_ROW) {
          ContentAddress address;
          if (!ContentAddress::FromBytes(run.ColumnBlob(0), &address)) {
            *error_message = StrCat("index shard ", s, " has a malformed key");
            return ErrorKind::kCorruption;
          }
          batch.push_back(address);
        }
        if (run.status() != SQLITE_DONE) {
          *error_message = StrCat("listing chunks: ", run.error_message());
          return ErrorKind::kIoError;
        }
      }
      for (const ContentAddress &address : batch) {
        std::string data;
        bool recovered;
        std::string read_error;
        ErrorKind kind = Read(address, &data, &recovered, &read_error);
        if (kind == ErrorKind::kOk) {
          ++result->checked;
          if (recovered) {
            ++result->recovered;
          }
        } else if (kind == ErrorKind::kCorruption ||
                   kind == ErrorKind::kNotFound) {
          ++result->checked;
          LOG(ERROR) << read_error;
          result->failed.push_back(address);
        } else {
          *error_message = read_error;
          return kind;
        }
      }
      if (signal != nullptr && signal->ShouldShutdown()) {
        result->interrupted = true;
        return ErrorKind::kOk;
      }
      if (batch.size() < static_cast<size_t>(kBatchSize)) {
        break;
      }
      after = batch.back().as_piece().as_string();
    }
  }
  LOG(INFO) << "verified " << result->checked << " chunks: "
            << result->recovered << " recovered, " << result->failed.size()
            << " unrecoverable";
  return ErrorKind::kOk;
}

ErrorKind ChunkStore::Collect(const ContentAddress &address,
                              int64_t cutoff_sec, bool dry_run,
                              GcCatalog *catalog, int64_t *deleted_bytes,
                              std::string *error_message) {
  *deleted_bytes = -1;
  const std::string hex = address.ToHex();
  std::lock_guard<std::mutex> stripe(*StripeFor(address));
  Shard *shard = shards_[ShardIndex(address)].get();
  DatabaseContext ctx(&shard->db);
  if (!ctx.BeginImmediateTransaction(error_message)) {
    return ErrorKind::kIoError;
  }
  bool found;
  Row row;
  if (!LookUp(&ctx, shard, address, &found, &row, error_message)) {
    ctx.RollbackTransaction();
    return ErrorKind::kIoError;
  }
  if (!found || row.refcount != 0 || row.zero_since > cutoff_sec) {
    ctx.RollbackTransaction();
    return ErrorKind::kOk;
  }

  std::string manifest_id;
  if (!catalog->FindReference(address, &manifest_id, error_message)) {
    ctx.RollbackTransaction();
    return ErrorKind::kIoError;
  }
  if (!manifest_id.empty()) {
    ctx.RollbackTransaction();
    *error_message = StrCat("chunk ", hex, " has refcount 0 but manifest ",
                            manifest_id, " references it");
    LOG(ERROR) << *error_message << "; halting garbage collection";
    return ErrorKind::kInvariantViolation;
  }
  if (dry_run) {
    ctx.RollbackTransaction();
    *deleted_bytes = row.size;
    return ErrorKind::kOk;
  }

  {
    auto run = ctx.Borrow(&shard->delete_stmt);
    run.BindBlob(":address", address.as_piece());
    if (run.Step() != SQLITE_DONE) {
      *error_message =
          StrCat("deleting chunk ", hex, ": ", run.error_message());
      ctx.RollbackTransaction();
      return ErrorKind::kIoError;
    }
  }
  std::string path = ChunkPath(address);
  int ret = fs_->Unlink(path.c_str());
  if (ret != 0 && ret != ENOENT) {
    *error_message = StrCat("unlinking ", path, ": ", strerror(ret));
    ctx.RollbackTransaction();
    return ErrorKind::kIoError;
  }
  if (!ctx.CommitTransaction(error_message)) {
    LOG(ERROR) << "chunk " << hex
               << " was unlinked but its index row remains: "
               << *error_message;
    return ErrorKind::kIoError;
  }
  VLOG(1) << "collected chunk " << hex << " (" << row.size << " bytes)";
  *deleted_bytes = row.size;
  return ErrorKind::kOk;
}

ErrorKind ChunkStore::GarbageCollect(const GcOptions &options,
                                     GcCatalog *catalog,
                                     const ShutdownSignal *signal,
                                     GcResult *result,
                                     std::string *error_message) {
  *result = GcResult();
  if (options.batch_size <= 0) {
    *error_message = StrCat("batch_size ", options.batch_size,
                            " must be positive");
    return ErrorKind::kInvariantViolation;
  }
  GcCheckpoint start;
  if (!options.dry_run) {
    bool found;
    if (!catalog->LoadGcCheckpoint(&start, &found, error_message)) {
      return ErrorKind::kIoError;
    }
    if (found) {
      result->resumed = true;
      LOG(INFO) << "resuming garbage collection at index shard "
                << start.shard;
    } else {
      start = GcCheckpoint();
    }
  }
  const int64_t cutoff_sec =
      clock_->Now().tv_sec - options.grace_period_sec;

  for (int s = start.shard; s < kShards; ++s) {
    Shard *shard = shards_[s].get();
    std::string after = s == start.shard ? start.last_address : std::string();
    bool shard_done = false;
    while (!shard_done) {
      std::vector<ContentAddress> batch;
      {
        DatabaseContext ctx(&shard->db);
        auto run = ctx.Borrow(&shard->list_unreferenced_stmt);
        run.BindBlob(":after", after);
        run.BindInt64(":limit", options.batch_size);
        while (run.Step() == SQLITE_ROW) {
          ContentAddress address;
          if (!ContentAddress::FromBytes(run.ColumnBlob(0), &address)) {
            *error_message = StrCat("index shard ", s, " has a malformed key");
            return ErrorKind::kCorruption;
          }
          batch.push_back(address);
        }
        if (run.status() != SQLITE_DONE) {
          *error_message =
              StrCat("listing unreferenced chunks: ", run.error_message());
          return ErrorKind::kIoError;
        }
      }
      for (const ContentAddress &address : batch) {
        ++result->examined;
        int64_t deleted_bytes;
        ErrorKind kind = Collect(address, cutoff_sec, options.dry_run,
                                 catalog, &deleted_bytes, error_message);
        if (kind != ErrorKind::kOk) {
          return kind;
        }
        if (deleted_bytes >= 0) {
          ++result->deleted;
          result->deleted_bytes += deleted_bytes;
        }
      }
      shard_done = batch.size() < static_cast<size_t>(options.batch_size);
      if (!batch.empty()) {
        after = batch.back().as_piece().as_string();
      }
      if (!options.dry_run) {
        GcCheckpoint checkpoint;
        checkpoint.shard = shard_done ? s + 1 : s;
        if (!shard_done) {
          checkpoint.last_address = after;
        }
        if (!catalog->SaveGcCheckpoint(checkpoint, error_message)) {
          return ErrorKind::kIoError;
        }
      }
      if (signal != nullptr && signal->ShouldShutdown()) {
        LOG(INFO) << "garbage collection interrupted after examining "
                  << result->examined << " chunks";
        result->interrupted = true;
        return ErrorKind::kOk;
      }
    }
  }

  if (!options.dry_run && !catalog->ClearGcCheckpoint(error_message)) {
    return ErrorKind::kIoError;
  }
  LOG(INFO) << (options.dry_run ? "would collect " : "collected ")
            << result->deleted << " of " << result->examined
            << " unreferenced chunks (" << result->deleted_bytes << " bytes)";
  return ErrorKind::kOk;
}

}  // namespace reelstore
