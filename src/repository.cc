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
// repository.cc: see repository.h.

#include "repository.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>

#include <algorithm>
#include <atomic>
#include <thread>

#include <glog/logging.h>

#include "string.h"

namespace reelstore {

namespace {

const char kSchemaSql[] = R"(
    pragma journal_mode = wal;

    -- Exactly one row, written at creation.
    create table if not exists repository (
      id integer primary key check (id = 1),
      uuid blob not null check (length(uuid) = 16),
      hash_algorithm text not null,
      schema_version integer not null
    );

    create table if not exists manifest (
      id text primary key,  -- a uuid in text form.
      path text not null,
      size integer not null check (size >= 0),
      created_sec integer not null,

      -- The encoded ManifestEntry.
      entry blob not null
    );

    create index if not exists manifest_path on manifest (path);

    -- One row per chunk occurrence in a manifest, for reachability checks.
    create table if not exists manifest_chunk (
      manifest_id text not null references manifest (id),
      seq integer not null,
      address blob not null check (length(address) = 32),
      primary key (manifest_id, seq)
    ) without rowid;

    create index if not exists manifest_chunk_address
        on manifest_chunk (address);

    -- At most one row, present while a collection pass is incomplete.
    create table if not exists gc_checkpoint (
      id integer primary key check (id = 1),
      shard integer not null,
      last_address blob not null
    );
)";

std::string MetaDbPath(const std::string &root) {
  return StrCat(root, "/meta.db");
}

}  // namespace

constexpr int Repository::kSchemaVersion;

bool Repository::Init(const std::string &root, HashAlgorithm algorithm,
                      std::string *error_message) {
  int ret = MkdirAll(fs_, root, 0700);
  if (ret != 0) {
    *error_message = StrCat("mkdir ", root, ": ", strerror(ret));
    return false;
  }
  struct stat st;
  ret = fs_->Stat(MetaDbPath(root).c_str(), &st);
  if (ret == 0) {
    *error_message = StrCat(root, " already holds a repository");
    return false;
  } else if (ret != ENOENT) {
    *error_message = StrCat("stat ", MetaDbPath(root), ": ", strerror(ret));
    return false;
  }

  {
    Hasher hasher(algorithm);
    ChunkStore store(fs_, clock_, &hasher);
    if (!store.Open(StrCat(root, "/store"), true, error_message)) {
      return false;
    }
  }

  Uuid id = uuidgen_->Generate();
  {
    Database db;
    if (!db.Open(MetaDbPath(root).c_str(),
                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, error_message)) {
      return false;
    }
    DatabaseContext ctx(&db);
    if (!RunStatements(&ctx, kSchemaSql, error_message)) {
      return false;
    }
    auto run = ctx.UseOnce(
        "insert into repository (id, uuid, hash_algorithm, schema_version)\n"
        "    values (1, :uuid, :hash_algorithm, :schema_version);");
    run.BindBlob(":uuid", id.binary_view());
    run.BindText(":hash_algorithm", HashAlgorithmName(algorithm));
    run.BindInt64(":schema_version", kSchemaVersion);
    if (run.Step() != SQLITE_DONE) {
      *error_message =
          StrCat("initializing ", MetaDbPath(root), ": ", run.error_message());
      return false;
    }
  }
  LOG(INFO) << "Created repository " << id.UnparseText() << " at " << root
            << " using " << HashAlgorithmName(algorithm);
  return Open(root, &algorithm, error_message);
}

bool Repository::Open(const std::string &root,
                      const HashAlgorithm *expected_algorithm,
                      std::string *error_message) {
  std::string path = MetaDbPath(root);
  if (!db_.Open(path.c_str(), SQLITE_OPEN_READWRITE, error_message)) {
    *error_message = StrCat(path, ": ", *error_message);
    return false;
  }

  HashAlgorithm algorithm;
  {
    DatabaseContext ctx(&db_);
    if (!RunStatements(&ctx, kSchemaSql, error_message)) {
      return false;
    }
    auto run = ctx.UseOnce(
        "select uuid, hash_algorithm, schema_version from repository;");
    if (run.Step() != SQLITE_ROW) {
      *error_message =
          run.status() == SQLITE_DONE
              ? StrCat(path, " has no repository row")
              : StrCat(path, ": ", run.error_message());
      return false;
    }
    if (!id_.ParseBinary(run.ColumnBlob(0))) {
      *error_message = StrCat(path, ": invalid repository uuid");
      return false;
    }
    if (!ParseHashAlgorithm(run.ColumnText(1), &algorithm, error_message)) {
      *error_message = StrCat(path, ": ", *error_message);
      return false;
    }
    int64_t version = run.ColumnInt64(2);
    if (version != kSchemaVersion) {
      *error_message = StrCat(path, " has schema version ", version,
                              "; expected ", kSchemaVersion);
      return false;
    }
  }
  if (expected_algorithm != nullptr && *expected_algorithm != algorithm) {
    *error_message = StrCat("repository ", root, " uses ",
                            HashAlgorithmName(algorithm), ", not ",
                            HashAlgorithmName(*expected_algorithm));
    return false;
  }

  struct {
    Statement *stmt;
    const char *sql;
  } statements[] = {
      {&insert_manifest_stmt_,
       "insert into manifest (id, path, size, created_sec, entry)\n"
       "    values (:id, :path, :size, :created_sec, :entry);"},
      {&insert_manifest_chunk_stmt_,
       "insert into manifest_chunk (manifest_id, seq, address)\n"
       "    values (:manifest_id, :seq, :address);"},
      {&select_manifest_stmt_, "select entry from manifest where id = :id;"},
      {&find_reference_stmt_,
       "select manifest_id from manifest_chunk where address = :address\n"
       "    limit 1;"},
      {&load_checkpoint_stmt_,
       "select shard, last_address from gc_checkpoint where id = 1;"},
      {&save_checkpoint_stmt_,
       "insert or replace into gc_checkpoint (id, shard, last_address)\n"
       "    values (1, :shard, :last_address);"},
  };
  for (const auto &s : statements) {
    *s.stmt = db_.Prepare(s.sql, nullptr, error_message);
    if (!s.stmt->valid()) {
      return false;
    }
  }

  hasher_.reset(new Hasher(algorithm));
  store_.reset(new ChunkStore(fs_, clock_, hasher_.get()));
  if (!store_->Open(StrCat(root, "/store"), false, error_message)) {
    return false;
  }
  root_ = root;
  VLOG(1) << "Opened repository " << id_.UnparseText() << " at " << root;
  return true;
}

ErrorKind Repository::AddFile(const std::string &path,
                              const IngestOptions &options,
                              std::string *manifest_id,
                              std::string *error_message) {
  std::unique_ptr<File> f;
  int ret = fs_->Open(path.c_str(), O_RDONLY | O_CLOEXEC, &f);
  if (ret != 0) {
    *error_message = StrCat("open ", path, ": ", strerror(ret));
    return ret == ENOENT ? ErrorKind::kNotFound : ErrorKind::kIoError;
  }

  Ingester ingester(store_.get(), options);
  ManifestEntry entry;
  IngestStats stats;
  ErrorKind kind = ingester.Ingest(f.get(), path, &entry, &stats,
                                   error_message);
  if (kind != ErrorKind::kOk) {
    return kind;
  }

  std::string id = uuidgen_->Generate().UnparseText();
  if (!Record(id, entry, error_message)) {
    std::vector<ContentAddress> addresses;
    for (const auto &c : entry.chunks) {
      addresses.push_back(c.address);
    }
    std::string release_error;
    if (ReleaseAll(addresses, &release_error) != ErrorKind::kOk) {
      LOG(ERROR) << "Unable to release references for unrecorded " << path
                 << ": " << release_error;
    }
    *error_message = StrCat("recording ", path, ": ", *error_message);
    return ErrorKind::kIoError;
  }
  LOG(INFO) << "Added " << path << " (" << entry.size << " bytes, "
            << stats.chunks << " chunks, " << stats.keyframe_aligned_chunks
            << " keyframe-aligned) as manifest " << id;
  *manifest_id = id;
  return ErrorKind::kOk;
}

int Repository::AddFiles(const std::vector<std::string> &paths,
                         const IngestOptions &options, int threads,
                         const ShutdownSignal *signal,
                         std::vector<AddFileResult> *results) {
  results->assign(paths.size(), AddFileResult());
  std::atomic<size_t> next(0);
  std::atomic<int> failures(0);
  auto worker = [&]() {
    while (true) {
      size_t i = next.fetch_add(1);
      if (i >= paths.size()) {
        return;
      }
      AddFileResult &r = (*results)[i];
      r.path = paths[i];
      if (signal != nullptr && signal->ShouldShutdown()) {
        r.skipped = true;
        continue;
      }
      r.kind = AddFile(paths[i], options, &r.manifest_id, &r.error_message);
      if (r.kind != ErrorKind::kOk) {
        LOG(WARNING) << "Unable to add " << paths[i] << ": "
                     << ErrorKindName(r.kind) << ": " << r.error_message;
        ++failures;
      }
    }
  };

  int n = std::max(1, std::min(threads, static_cast<int>(paths.size())));
  std::vector<std::thread> workers;
  for (int i = 1; i < n; ++i) {
    workers.emplace_back(worker);
  }
  worker();
  for (auto &w : workers) {
    w.join();
  }
  return failures.load();
}

bool Repository::Record(const std::string &id, const ManifestEntry &entry,
                        std::string *error_message) {
  std::string encoded;
  EncodeManifestEntry(entry, &encoded);
  DatabaseContext ctx(&db_);
  if (!ctx.BeginTransaction(error_message)) {
    return false;
  }
  {
    auto run = ctx.Borrow(&insert_manifest_stmt_);
    run.BindText(":id", id);
    run.BindText(":path", entry.path);
    run.BindInt64(":size", entry.size);
    run.BindInt64(":created_sec", clock_->Now().tv_sec);
    run.BindBlob(":entry", encoded);
    if (run.Step() != SQLITE_DONE) {
      *error_message = run.error_message();
      ctx.RollbackTransaction();
      return false;
    }
  }
  for (size_t i = 0; i < entry.chunks.size(); ++i) {
    auto run = ctx.Borrow(&insert_manifest_chunk_stmt_);
    run.BindText(":manifest_id", id);
    run.BindInt64(":seq", i);
    run.BindBlob(":address", entry.chunks[i].address.as_piece());
    if (run.Step() != SQLITE_DONE) {
      *error_message = run.error_message();
      ctx.RollbackTransaction();
      return false;
    }
  }
  return ctx.CommitTransaction(error_message);
}

ErrorKind Repository::ReleaseAll(const std::vector<ContentAddress> &addresses,
                                 std::string *error_message) {
  for (const auto &address : addresses) {
    ErrorKind kind = store_->ReleaseRef(address, error_message);
    if (kind != ErrorKind::kOk) {
      return kind;
    }
  }
  return ErrorKind::kOk;
}

ErrorKind Repository::RemoveManifest(const std::string &id,
                                     std::string *error_message) {
  std::vector<ContentAddress> addresses;
  {
    DatabaseContext ctx(&db_);
    if (!ctx.BeginTransaction(error_message)) {
      return ErrorKind::kIoError;
    }
    {
      auto run = ctx.UseOnce(
          "select address from manifest_chunk where manifest_id = :id\n"
          "    order by seq;");
      run.BindText(":id", id);
      while (run.Step() == SQLITE_ROW) {
        ContentAddress address;
        if (!ContentAddress::FromBytes(run.ColumnBlob(0), &address)) {
          *error_message = StrCat("manifest ", id, " has a malformed address");
          ctx.RollbackTransaction();
          return ErrorKind::kCorruption;
        }
        addresses.push_back(address);
      }
      if (run.status() != SQLITE_DONE) {
        *error_message = run.error_message();
        ctx.RollbackTransaction();
        return ErrorKind::kIoError;
      }
    }
    {
      auto run = ctx.UseOnce(
          "delete from manifest_chunk where manifest_id = :id;");
      run.BindText(":id", id);
      if (run.Step() != SQLITE_DONE) {
        *error_message = run.error_message();
        ctx.RollbackTransaction();
        return ErrorKind::kIoError;
      }
    }
    {
      auto run = ctx.UseOnce("delete from manifest where id = :id;");
      run.BindText(":id", id);
      if (run.Step() != SQLITE_DONE) {
        *error_message = run.error_message();
        ctx.RollbackTransaction();
        return ErrorKind::kIoError;
      }
      if (ctx.changes() == 0) {
        *error_message = StrCat("no manifest ", id);
        ctx.RollbackTransaction();
        return ErrorKind::kNotFound;
      }
    }
    if (!ctx.CommitTransaction(error_message)) {
      return ErrorKind::kIoError;
    }
  }

  ErrorKind kind = ReleaseAll(addresses, error_message);
  if (kind != ErrorKind::kOk) {
    *error_message =
        StrCat("manifest ", id, " is removed but releasing its chunks failed: ",
               *error_message);
    return kind;
  }
  LOG(INFO) << "Removed manifest " << id << "; released " << addresses.size()
            << " chunk references";
  return ErrorKind::kOk;
}

bool Repository::ListManifests(std::vector<ManifestSummary> *manifests,
                               std::string *error_message) {
  manifests->clear();
  DatabaseContext ctx(&db_);
  auto run = ctx.UseOnce(
      "select\n"
      "  id, path, size, created_sec,\n"
      "  (select count(*) from manifest_chunk\n"
      "   where manifest_id = manifest.id)\n"
      "from manifest\n"
      "order by path, rowid;");
  while (run.Step() == SQLITE_ROW) {
    ManifestSummary m;
    m.id = run.ColumnText(0).as_string();
    m.path = run.ColumnText(1).as_string();
    m.size = run.ColumnInt64(2);
    m.created_sec = run.ColumnInt64(3);
    m.chunks = run.ColumnInt64(4);
    manifests->push_back(std::move(m));
  }
  if (run.status() != SQLITE_DONE) {
    *error_message = run.error_message();
    return false;
  }
  return true;
}

ErrorKind Repository::GetManifest(const std::string &id, ManifestEntry *entry,
                                  std::string *error_message) {
  std::string encoded;
  {
    DatabaseContext ctx(&db_);
    auto run = ctx.Borrow(&select_manifest_stmt_);
    run.BindText(":id", id);
    if (run.Step() != SQLITE_ROW) {
      if (run.status() == SQLITE_DONE) {
        *error_message = StrCat("no manifest ", id);
        return ErrorKind::kNotFound;
      }
      *error_message = run.error_message();
      return ErrorKind::kIoError;
    }
    encoded = run.ColumnBlob(0).as_string();
  }
  if (!DecodeManifestEntry(encoded, entry, error_message)) {
    *error_message = StrCat("manifest ", id, ": ", *error_message);
    return ErrorKind::kCorruption;
  }
  return ErrorKind::kOk;
}

ErrorKind Repository::Snapshot(const ContentAddress *parent,
                               ManifestRecord *record,
                               std::string *error_message) {
  *record = ManifestRecord();
  record->repository_id = id_;
  if (parent != nullptr) {
    record->has_parent = true;
    record->parent = *parent;
  }
  {
    DatabaseContext ctx(&db_);
    auto run = ctx.UseOnce(
        "select id, entry from manifest\n"
        "    where rowid in (select max(rowid) from manifest group by path)\n"
        "    order by path;");
    while (run.Step() == SQLITE_ROW) {
      ManifestEntry entry;
      if (!DecodeManifestEntry(run.ColumnBlob(1), &entry, error_message)) {
        *error_message =
            StrCat("manifest ", run.ColumnText(0), ": ", *error_message);
        return ErrorKind::kCorruption;
      }
      record->entries.push_back(std::move(entry));
    }
    if (run.status() != SQLITE_DONE) {
      *error_message = run.error_message();
      return ErrorKind::kIoError;
    }
  }
  ComputeManifestStats(record);
  record->commit = ComputeCommitHash(*hasher_, *record);
  return ErrorKind::kOk;
}

bool Repository::FindReference(const ContentAddress &address,
                               std::string *manifest_id,
                               std::string *error_message) {
  DatabaseContext ctx(&db_);
  auto run = ctx.Borrow(&find_reference_stmt_);
  run.BindBlob(":address", address.as_piece());
  manifest_id->clear();
  if (run.Step() == SQLITE_ROW) {
    *manifest_id = run.ColumnText(0).as_string();
    run.Step();
  }
  if (run.status() != SQLITE_DONE) {
    *error_message = StrCat("looking up references to ", address.ToHex(), ": ",
                            run.error_message());
    return false;
  }
  return true;
}

bool Repository::LoadGcCheckpoint(GcCheckpoint *checkpoint, bool *found,
                                  std::string *error_message) {
  DatabaseContext ctx(&db_);
  auto run = ctx.Borrow(&load_checkpoint_stmt_);
  *found = false;
  if (run.Step() == SQLITE_ROW) {
    *found = true;
    checkpoint->shard = run.ColumnInt64(0);
    re2::StringPiece last_address = run.ColumnBlob(1);
    checkpoint->last_address.assign(last_address.data(), last_address.size());
    run.Step();
  }
  if (run.status() != SQLITE_DONE) {
    *error_message = StrCat("loading collection checkpoint: ",
                            run.error_message());
    return false;
  }
  return true;
}

bool Repository::SaveGcCheckpoint(const GcCheckpoint &checkpoint,
                                  std::string *error_message) {
  DatabaseContext ctx(&db_);
  auto run = ctx.Borrow(&save_checkpoint_stmt_);
  run.BindInt64(":shard", checkpoint.shard);
  run.BindBlob(":last_address", checkpoint.last_address);
  if (run.Step() != SQLITE_DONE) {
    *error_message = StrCat("saving collection checkpoint: ",
                            run.error_message());
    return false;
  }
  return true;
}

bool Repository::ClearGcCheckpoint(std::string *error_message) {
  DatabaseContext ctx(&db_);
  auto run = ctx.UseOnce("delete from gc_checkpoint;");
  if (run.Step() != SQLITE_DONE) {
    *error_message = StrCat("clearing collection checkpoint: ",
                            run.error_message());
    return false;
  }
  return true;
}

}  // namespace reelstore
