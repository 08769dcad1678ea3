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
// reelstore-main.cc: main program. This should be kept as short as
// practical, so that individual parts of the program can be tested with the
// googletest framework.
//
// Usage: reelstore --repo=DIR <command> [args...], where command is one of:
//
//    init                  create an empty repository
//    add <file>...         store files, printing a manifest id for each
//    ls                    list manifests
//    cat <id>              reconstruct a file to --output or stdout
//    rm <id>...            remove manifests, releasing their chunks
//    gc                    delete unreferenced chunks past the grace period
//    verify                re-hash every stored chunk
//    stats                 print chunk store statistics
//    snapshot              write a manifest record to --output or stdout
//    chunk <file>          print the chunks a file would be stored as
//
// The command runs on a worker thread while the main thread waits for
// SIGINT or SIGTERM; either asks add, gc, and verify to stop at their next
// file or batch.

#include <fcntl.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <event2/event.h>
#include <event2/event_struct.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "chunk-store.h"
#include "common.h"
#include "crypto.h"
#include "filesystem.h"
#include "ingest.h"
#include "manifest.h"
#include "repository.h"
#include "string.h"
#include "time.h"
#include "uuid.h"

DEFINE_string(repo, "", "Path to the repository.");
DEFINE_string(hash_algorithm, "blake3",
              "Content hash for init and chunk: blake3, sha256, or sha3-256. "
              "Other commands fail if this is given and the repository uses "
              "a different one.");
DEFINE_string(profile, "default",
              "Chunking profile for files which aren't ISOBMFF containers: "
              "default, video, or small.");
DEFINE_string(container_profile, "video",
              "Chunking profile for ISOBMFF containers.");
DEFINE_string(min_size, "", "If set, overrides both profiles' minimum chunk "
                            "size, such as 64K.");
DEFINE_string(avg_size, "", "If set, overrides both profiles' average "
                            "chunk size.");
DEFINE_string(max_size, "", "If set, overrides both profiles' maximum "
                            "chunk size.");
DEFINE_int32(normalization, -1,
             "If non-negative, overrides both profiles' normalization level.");
DEFINE_bool(prefer_keyframe, true,
            "Move chunk boundaries onto nearby video keyframes.");
DEFINE_int64(max_shift, 0,
             "Furthest a boundary may move onto a keyframe, in bytes; 0 means "
             "a quarter of the average chunk size.");
DEFINE_int64(absolute_min, 0,
             "Smallest chunk keyframe alignment may produce; 0 means half the "
             "minimum chunk size.");
DEFINE_double(keyframe_weight, 1.0, "Weight of keyframe alignment.");
DEFINE_double(score_threshold, 0.3,
              "Minimum score for moving a boundary onto a keyframe.");
DEFINE_bool(adapt_to_spacing, true,
            "Reduce the keyframe weight for irregularly spaced keyframes.");
DEFINE_bool(normalize_offsets, true,
            "Store ISOBMFF chunk offsets relative to the mdat payload.");
DEFINE_int32(threads, 4, "Files stored in parallel by add.");
DEFINE_string(output, "", "Output file for cat and snapshot; stdout if empty.");
DEFINE_bool(fast_start, false,
            "cat: write ISOBMFF files with moov ahead of mdat.");
DEFINE_int64(gc_grace_period_sec, 24 * 60 * 60,
             "gc: how long a chunk must have been unreferenced to be deleted.");
DEFINE_int32(gc_batch_size, 1000,
             "gc: chunks examined between checkpoints.");
DEFINE_bool(dry_run, false, "gc: report what would be deleted.");
DEFINE_string(replica, "",
              "Comma-separated chunk directories (a repository's store/chunks) "
              "to recover corrupt or missing chunks from, tried in order.");
DEFINE_string(parent, "", "snapshot: hex commit hash of the parent snapshot.");

using reelstore::ErrorKind;

namespace {

const struct timeval kPollInterval = {0, 100 * 1000};

struct event_base *base;
reelstore::ShutdownSignal shutdown_signal;
std::atomic<bool> command_done{false};

// Called on SIGTERM or SIGINT.
void SignalCallback(evutil_socket_t, short, void *) {
  if (shutdown_signal.ShouldShutdown()) {
    LOG(WARNING) << "Second signal received; exiting immediately.";
    google::FlushLogFiles(google::GLOG_INFO);
    _exit(1);
  }
  LOG(INFO) << "Shutdown requested; stopping after the current step.";
  shutdown_signal.Shutdown();
}

void PollCallback(evutil_socket_t, short, void *ev) {
  google::FlushLogFiles(google::GLOG_INFO);
  if (command_done.load()) {
    event_base_loopexit(base, nullptr);
    return;
  }
  CHECK_EQ(0, event_add(reinterpret_cast<struct event *>(ev), &kPollInterval));
}

bool ParseSizeFlag(const char *name, const std::string &value,
                   uint32_t *out) {
  if (value.empty()) {
    return true;
  }
  int64_t size;
  if (!reelstore::ParseByteSize(value, &size) ||
      size > reelstore::kMaxChunkSizeLimit) {
    LOG(ERROR) << "--" << name << "=" << value << " is not a valid size.";
    return false;
  }
  *out = static_cast<uint32_t>(size);
  return true;
}

bool ApplyOverrides(reelstore::ChunkerConfig *config) {
  if (!ParseSizeFlag("min_size", FLAGS_min_size, &config->min_size) ||
      !ParseSizeFlag("avg_size", FLAGS_avg_size, &config->avg_size) ||
      !ParseSizeFlag("max_size", FLAGS_max_size, &config->max_size)) {
    return false;
  }
  if (FLAGS_normalization >= 0) {
    config->normalization = FLAGS_normalization;
  }
  return true;
}

bool GetIngestOptions(reelstore::IngestOptions *options) {
  std::string error_message;
  if (!reelstore::ParseChunkingProfile(FLAGS_profile, &options->chunker,
                                       &error_message) ||
      !reelstore::ParseChunkingProfile(FLAGS_container_profile,
                                       &options->container_chunker,
                                       &error_message)) {
    LOG(ERROR) << error_message;
    return false;
  }
  if (!ApplyOverrides(&options->chunker) ||
      !ApplyOverrides(&options->container_chunker)) {
    return false;
  }
  options->aligner.prefer_keyframe = FLAGS_prefer_keyframe;
  options->aligner.max_shift = FLAGS_max_shift;
  options->aligner.absolute_min = FLAGS_absolute_min;
  options->aligner.keyframe_weight = FLAGS_keyframe_weight;
  options->aligner.score_threshold = FLAGS_score_threshold;
  options->aligner.adapt_to_spacing = FLAGS_adapt_to_spacing;
  options->normalize_offsets = FLAGS_normalize_offsets;
  if (!reelstore::ValidateIngestOptions(*options, &error_message)) {
    LOG(ERROR) << "Invalid chunking flags: " << error_message;
    return false;
  }
  return true;
}

bool GetHashAlgorithm(reelstore::HashAlgorithm *algorithm) {
  std::string error_message;
  if (!reelstore::ParseHashAlgorithm(FLAGS_hash_algorithm, algorithm,
                                     &error_message)) {
    LOG(ERROR) << "--hash_algorithm: " << error_message;
    return false;
  }
  return true;
}

// Opens the output named by --output, or stdout.
bool OpenOutput(std::unique_ptr<reelstore::File> *out) {
  std::string path = FLAGS_output.empty() ? "/dev/stdout" : FLAGS_output;
  int ret = reelstore::GetRealFilesystem()->Open(
      path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644, out);
  if (ret != 0) {
    LOG(ERROR) << "Unable to open " << path << ": " << strerror(ret);
    return false;
  }
  return true;
}

// Everything the commands share.
struct Context {
  std::vector<std::string> args;
  reelstore::Repository *repo = nullptr;
};

int Init(Context *ctx) {
  reelstore::HashAlgorithm algorithm;
  if (!GetHashAlgorithm(&algorithm)) {
    return 2;
  }
  std::string error_message;
  if (!ctx->repo->Init(FLAGS_repo, algorithm, &error_message)) {
    LOG(ERROR) << "Unable to create repository: " << error_message;
    return 1;
  }
  printf("%s\n", ctx->repo->id().UnparseText().c_str());
  return 0;
}

int Add(Context *ctx) {
  reelstore::IngestOptions options;
  if (!GetIngestOptions(&options)) {
    return 2;
  }
  std::vector<reelstore::AddFileResult> results;
  int failures = ctx->repo->AddFiles(ctx->args, options, FLAGS_threads,
                                     &shutdown_signal, &results);
  int skipped = 0;
  for (const auto &r : results) {
    if (r.skipped) {
      ++skipped;
    } else if (r.kind == ErrorKind::kOk) {
      printf("%s  %s\n", r.manifest_id.c_str(), r.path.c_str());
    }
  }
  if (skipped > 0) {
    LOG(WARNING) << "Interrupted; " << skipped << " file(s) not added.";
  }
  return failures > 0 || skipped > 0 ? 1 : 0;
}

int List(Context *ctx) {
  std::vector<reelstore::ManifestSummary> manifests;
  std::string error_message;
  if (!ctx->repo->ListManifests(&manifests, &error_message)) {
    LOG(ERROR) << "Unable to list manifests: " << error_message;
    return 1;
  }
  for (const auto &m : manifests) {
    printf("%s  %s  %12lld  %6lld  %s\n", m.id.c_str(),
           reelstore::FormatLocalTime(m.created_sec).c_str(),
           static_cast<long long>(m.size), static_cast<long long>(m.chunks),
           m.path.c_str());
  }
  return 0;
}

int Cat(Context *ctx) {
  if (ctx->args.size() != 1) {
    LOG(ERROR) << "usage: cat <manifest id>";
    return 2;
  }
  reelstore::ManifestEntry entry;
  std::string error_message;
  ErrorKind kind = ctx->repo->GetManifest(ctx->args[0], &entry, &error_message);
  if (kind != ErrorKind::kOk) {
    LOG(ERROR) << error_message;
    return 1;
  }
  std::unique_ptr<reelstore::VirtualFile> file;
  kind = reelstore::VirtualFile::Open(
      ctx->repo->store(), &entry,
      FLAGS_fast_start ? reelstore::Layout::kFastStart
                       : reelstore::Layout::kOriginal,
      &file, &error_message);
  if (kind != ErrorKind::kOk) {
    LOG(ERROR) << ErrorKindName(kind) << ": " << error_message;
    return 1;
  }
  std::unique_ptr<reelstore::File> out;
  if (!OpenOutput(&out)) {
    return 1;
  }
  kind = file->WriteTo(out.get(), &error_message);
  if (kind != ErrorKind::kOk) {
    LOG(ERROR) << ErrorKindName(kind) << ": " << error_message;
    return 1;
  }
  int ret = out->Close();
  if (ret != 0) {
    LOG(ERROR) << "close: " << strerror(ret);
    return 1;
  }
  return 0;
}

int Remove(Context *ctx) {
  int status = 0;
  for (const auto &id : ctx->args) {
    std::string error_message;
    ErrorKind kind = ctx->repo->RemoveManifest(id, &error_message);
    if (kind != ErrorKind::kOk) {
      LOG(ERROR) << ErrorKindName(kind) << ": " << error_message;
      status = 1;
      if (kind == ErrorKind::kInvariantViolation) {
        break;
      }
    }
  }
  return status;
}

int Collect(Context *ctx) {
  reelstore::GcOptions options;
  options.grace_period_sec = FLAGS_gc_grace_period_sec;
  options.batch_size = FLAGS_gc_batch_size;
  options.dry_run = FLAGS_dry_run;
  if (options.grace_period_sec < 0 || options.batch_size <= 0) {
    LOG(ERROR) << "--gc_grace_period_sec must be non-negative and "
               << "--gc_batch_size positive.";
    return 2;
  }
  reelstore::GcResult result;
  std::string error_message;
  ErrorKind kind = ctx->repo->GarbageCollect(options, &shutdown_signal,
                                             &result, &error_message);
  printf("examined %lld, %s %lld chunks (%s)%s%s\n",
         static_cast<long long>(result.examined),
         options.dry_run ? "would delete" : "deleted",
         static_cast<long long>(result.deleted),
         reelstore::HumanizeWithBinaryPrefix(
             static_cast<float>(result.deleted_bytes), "B")
             .c_str(),
         result.resumed ? ", resumed" : "",
         result.interrupted ? ", interrupted" : "");
  if (kind != ErrorKind::kOk) {
    LOG(ERROR) << ErrorKindName(kind) << ": " << error_message;
    return 1;
  }
  return result.interrupted ? 1 : 0;
}

int Verify(Context *ctx) {
  reelstore::VerifyResult result;
  std::string error_message;
  ErrorKind kind = ctx->repo->store()->VerifyAll(&shutdown_signal, &result,
                                                 &error_message);
  printf("checked %lld, recovered %lld, failed %zu%s\n",
         static_cast<long long>(result.checked),
         static_cast<long long>(result.recovered), result.failed.size(),
         result.interrupted ? ", interrupted" : "");
  for (const auto &address : result.failed) {
    printf("failed: %s\n", address.ToHex().c_str());
  }
  if (kind != ErrorKind::kOk) {
    LOG(ERROR) << ErrorKindName(kind) << ": " << error_message;
    return 1;
  }
  return result.failed.empty() && !result.interrupted ? 0 : 1;
}

int Stats(Context *ctx) {
  reelstore::ChunkStoreStats stats;
  std::string error_message;
  ErrorKind kind = ctx->repo->store()->Stats(&stats, &error_message);
  if (kind != ErrorKind::kOk) {
    LOG(ERROR) << ErrorKindName(kind) << ": " << error_message;
    return 1;
  }
  printf("repository %s (%s)\n", ctx->repo->id().UnparseText().c_str(),
         reelstore::HashAlgorithmName(ctx->repo->hasher().algorithm()));
  printf("chunks %lld (%s), unreferenced %lld\n",
         static_cast<long long>(stats.chunks),
         reelstore::HumanizeWithBinaryPrefix(static_cast<float>(stats.bytes),
                                             "B")
             .c_str(),
         static_cast<long long>(stats.zero_referenced));
  return 0;
}

int Snapshot(Context *ctx) {
  reelstore::ContentAddress parent;
  if (!FLAGS_parent.empty() &&
      !reelstore::ContentAddress::FromHex(FLAGS_parent, &parent)) {
    LOG(ERROR) << "--parent=" << FLAGS_parent << " is not a commit hash.";
    return 2;
  }
  reelstore::ManifestRecord record;
  std::string error_message;
  ErrorKind kind = ctx->repo->Snapshot(FLAGS_parent.empty() ? nullptr : &parent,
                                       &record, &error_message);
  if (kind != ErrorKind::kOk) {
    LOG(ERROR) << ErrorKindName(kind) << ": " << error_message;
    return 1;
  }
  std::string encoded;
  reelstore::EncodeManifestRecord(record, &encoded);
  std::unique_ptr<reelstore::File> out;
  if (!OpenOutput(&out)) {
    return 1;
  }
  int ret = reelstore::WriteAll(out.get(), encoded);
  if (ret == 0) {
    ret = out->Close();
  }
  if (ret != 0) {
    LOG(ERROR) << "Unable to write snapshot: " << strerror(ret);
    return 1;
  }
  LOG(INFO) << "Snapshot " << record.commit.ToHex() << ": "
            << record.stats.files << " files, " << record.stats.bytes
            << " bytes, " << record.stats.unique_chunks << " unique chunks.";
  return 0;
}

// Needs no repository.
int Chunk(Context *ctx) {
  if (ctx->args.size() != 1) {
    LOG(ERROR) << "usage: chunk <file>";
    return 2;
  }
  reelstore::IngestOptions options;
  reelstore::HashAlgorithm algorithm;
  if (!GetIngestOptions(&options) || !GetHashAlgorithm(&algorithm)) {
    return 2;
  }
  const std::string &path = ctx->args[0];
  std::unique_ptr<reelstore::File> f;
  int ret = reelstore::GetRealFilesystem()->Open(path.c_str(),
                                                 O_RDONLY | O_CLOEXEC, &f);
  if (ret != 0) {
    LOG(ERROR) << "Unable to open " << path << ": " << strerror(ret);
    return 1;
  }
  reelstore::Hasher hasher(algorithm);
  reelstore::Ingester planner(&hasher, options);
  reelstore::ManifestEntry entry;
  reelstore::IngestStats stats;
  std::string error_message;
  ErrorKind kind = planner.Ingest(f.get(), path, &entry, &stats,
                                  &error_message);
  if (kind != ErrorKind::kOk) {
    LOG(ERROR) << ErrorKindName(kind) << ": " << error_message;
    return 1;
  }
  for (const auto &c : entry.chunks) {
    printf("%12lld  %10lld  %s%s  %s\n", static_cast<long long>(c.offset),
           static_cast<long long>(c.length),
           (c.flags & reelstore::ChunkRef::kMetadata) ? "m" : "-",
           (c.flags & reelstore::ChunkRef::kKeyframeAligned) ? "k" : "-",
           c.address.ToHex().c_str());
  }
  LOG(INFO) << path << ": " << entry.size << " bytes, " << stats.chunks
            << " chunks (" << stats.metadata_chunks << " metadata, "
            << stats.keyframe_aligned_chunks << " keyframe-aligned; "
            << stats.shifts << " boundaries moved, " << stats.rejected_shifts
            << " left in place); full content hash "
            << entry.full_content_hash.ToHex();
  return 0;
}

struct Command {
  const char *name;
  int (*fn)(Context *);
  bool needs_open_repo;
};

const Command kCommands[] = {
    {"init", &Init, false},       {"add", &Add, true},
    {"ls", &List, true},          {"cat", &Cat, true},
    {"rm", &Remove, true},        {"gc", &Collect, true},
    {"verify", &Verify, true},    {"stats", &Stats, true},
    {"snapshot", &Snapshot, true}, {"chunk", &Chunk, false},
};

}  // namespace

// Note that main never returns; it calls exit on either success or failure,
// letting the OS clean up rather than tearing down dependencies in order.
int main(int argc, char **argv) {
  gflags::SetUsageMessage(
      "--repo=DIR init|add|ls|cat|rm|gc|verify|stats|snapshot|chunk [args]");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  signal(SIGPIPE, SIG_IGN);

  if (argc < 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "reelstore-main");
    exit(2);
  }
  const Command *command = nullptr;
  for (const auto &c : kCommands) {
    if (strcmp(c.name, argv[1]) == 0) {
      command = &c;
    }
  }
  if (command == nullptr) {
    std::vector<std::string> names;
    for (const auto &c : kCommands) {
      names.push_back(c.name);
    }
    LOG(ERROR) << "Unknown command \"" << argv[1] << "\"; expected one of "
               << reelstore::Join(names, ", ") << ".";
    exit(2);
  }
  Context ctx;
  ctx.args.assign(argv + 2, argv + argc);

  if (FLAGS_repo.empty() && command->fn != &Chunk) {
    LOG(ERROR) << "--repo must be specified; exiting.";
    exit(2);
  }

  reelstore::Repository repo(reelstore::GetRealFilesystem(),
                             reelstore::GetRealClock(),
                             reelstore::GetRealUuidGenerator());
  ctx.repo = &repo;
  std::vector<std::unique_ptr<reelstore::DirectoryChunkSource>> replicas;
  if (command->needs_open_repo) {
    reelstore::HashAlgorithm algorithm;
    bool check_algorithm =
        !gflags::GetCommandLineFlagInfoOrDie("hash_algorithm").is_default;
    if (check_algorithm && !GetHashAlgorithm(&algorithm)) {
      exit(2);
    }
    std::string error_message;
    if (!repo.Open(FLAGS_repo, check_algorithm ? &algorithm : nullptr,
                   &error_message)) {
      LOG(ERROR) << "Unable to open repository: " << error_message
                 << "; exiting.";
      exit(1);
    }
    re2::StringPiece remaining = FLAGS_replica;
    while (!remaining.empty()) {
      size_t comma = remaining.find(',');
      re2::StringPiece dir = remaining.substr(0, comma);
      remaining.remove_prefix(comma == re2::StringPiece::npos
                                  ? remaining.size()
                                  : comma + 1);
      if (dir.empty()) {
        continue;
      }
      replicas.emplace_back(new reelstore::DirectoryChunkSource(
          reelstore::GetRealFilesystem(), dir.as_string()));
      repo.store()->AddRecoverySource(replicas.back().get());
    }
  }

  base = CHECK_NOTNULL(event_base_new());

  // Register for termination signals.
  struct event ev_sigterm;
  struct event ev_sigint;
  CHECK_EQ(0, event_assign(&ev_sigterm, base, SIGTERM, EV_SIGNAL | EV_PERSIST,
                           &SignalCallback, nullptr));
  CHECK_EQ(0, event_assign(&ev_sigint, base, SIGINT, EV_SIGNAL | EV_PERSIST,
                           &SignalCallback, nullptr));
  CHECK_EQ(0, event_add(&ev_sigterm, nullptr));
  CHECK_EQ(0, event_add(&ev_sigint, nullptr));

  // Check for completion (and flush logs) regularly.
  struct event ev_poll;
  CHECK_EQ(0, event_assign(&ev_poll, base, -1, 0, &PollCallback, &ev_poll));
  CHECK_EQ(0, event_add(&ev_poll, &kPollInterval));

  int status = 0;
  std::thread worker([&]() {
    status = command->fn(&ctx);
    fflush(stdout);
    command_done.store(true);
  });
  CHECK_EQ(0, event_base_loop(base, 0));
  worker.join();

  google::FlushLogFiles(google::GLOG_INFO);
  google::ShutdownGoogleLogging();
  exit(status);
}
