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
// testutil.h: utilities for testing.

#ifndef REELSTORE_TESTUTIL_H
#define REELSTORE_TESTUTIL_H

#include <stdint.h>

#include <string>
#include <vector>

#include <glog/logging.h>
#include <gmock/gmock.h>
#include <re2/stringpiece.h>

#include "coding.h"
#include "filesystem.h"
#include "uuid.h"

namespace reelstore {

// Create or empty the given test directory, or die.
// Returns the full path.
std::string PrepareTempDirOrDie(const std::string &test_name);

// Write the given file contents to the given path, or die.
// An existing file is replaced, even if read-only.
void WriteFileOrDie(const std::string &path, re2::StringPiece contents);

// Read the contents of the given path, or die.
std::string ReadFileOrDie(const std::string &path);

// Returns |size| pseudo-random bytes, the same for a given |seed|.
std::string RandomBytes(size_t size, uint32_t seed);

// A scoped log sink for testing that the right log messages are sent.
// Modelled after glog's "mock-log.h", which is not exported.
// Use as follows:
//
// {
//   ScopedMockLog log;
//   EXPECT_CALL(log, Log(ERROR, _, HasSubstr("blah blah")));
//   log.Start();
//   ThingThatLogs();
// }
class ScopedMockLog : public google::LogSink {
 public:
  ~ScopedMockLog() final { google::RemoveLogSink(this); }

  // Start logging to this sink.
  // This is not done at construction time so that it's possible to set
  // expectations first, which is important if some background thread is
  // already logging.
  void Start() { google::AddLogSink(this); }

  // Set expectations here.
  MOCK_METHOD3(Log, void(google::LogSeverity severity,
                         const std::string &full_filename,
                         const std::string &message));

 private:
  struct LogEntry {
    google::LogSeverity severity = -1;
    std::string full_filename;
    std::string message;
  };

  // This method is called with locks held and thus shouldn't call Log.
  // It just stashes away the log entry for later.
  void send(google::LogSeverity severity, const char *full_filename,
            const char *base_filename, int line, const tm *tm_time,
            const char *message, size_t message_len) final {
    pending_.severity = severity;
    pending_.full_filename = full_filename;
    pending_.message.assign(message, message_len);
  }

  // This method is always called after send() without locks.
  // It does the actual work of calling Log. It moves data away from
  // pending_ in case Log() logs itself (causing a nested call to send() and
  // WaitTillSent()).
  void WaitTillSent() final {
    LogEntry entry = std::move(pending_);
    Log(entry.severity, entry.full_filename, entry.message);
  }

  LogEntry pending_;
};

class MockUuidGenerator : public UuidGenerator {
 public:
  MOCK_METHOD0(Generate, Uuid());
};

class MockFile : public File {
 public:
  MOCK_METHOD0(Close, int());

  // The std::unique_ptr<File> variants of Open are wrapped here because gmock's
  // SetArgPointee doesn't work well with std::unique_ptr.

  int Open(const char *path, int flags, std::unique_ptr<File> *f) final {
    File *f_tmp = nullptr;
    int ret = OpenRaw(path, flags, &f_tmp);
    f->reset(f_tmp);
    return ret;
  }

  int Open(const char *path, int flags, mode_t mode,
           std::unique_ptr<File> *f) final {
    File *f_tmp = nullptr;
    int ret = OpenRaw(path, flags, mode, &f_tmp);
    f->reset(f_tmp);
    return ret;
  }

  MOCK_METHOD3(OpenRaw, int(const char *, int, File **));
  MOCK_METHOD4(OpenRaw, int(const char *, int, mode_t, File **));
  MOCK_METHOD3(Read, int(void *, size_t, size_t *));
  MOCK_METHOD4(Pread, int(void *, size_t, off_t, size_t *));
  MOCK_METHOD1(Stat, int(struct stat *));
  MOCK_METHOD0(Sync, int());
  MOCK_METHOD2(Write, int(re2::StringPiece, size_t *));
};

// Helper for writing an ISO/IEC 14496-12 box to a string. Construction
// appends the header with a placeholder size; destruction fills in the size
// including anything appended in the meantime.
class ScopedBox {
 public:
  ScopedBox(std::string *out, const char *type)
      : out_(out), start_(out->size()) {
    AppendU32(0, out_);
    out_->append(type, 4);
  }
  ScopedBox(const ScopedBox &) = delete;
  void operator=(const ScopedBox &) = delete;

  ~ScopedBox() {
    StoreU32(static_cast<uint32_t>(out_->size() - start_), &(*out_)[start_]);
  }

 private:
  std::string *out_;
  size_t start_;
};

// Description of a synthetic .mp4 file for container tests.
struct TestMp4Options {
  // One entry per video sample.
  std::vector<uint32_t> sample_sizes;

  uint32_t samples_per_chunk = 10;

  // 1-based sync sample numbers. If |write_stss| is false, there is no stss
  // box at all, which means every sample is a sync sample.
  std::vector<uint32_t> sync_samples;
  bool write_stss = true;

  // Write a single stsz sample_size if all sizes match.
  bool uniform_stsz = false;

  bool use_co64 = false;

  // Place moov before mdat ("fast start") rather than after.
  bool moov_first = false;

  // Add a "free" box after ftyp.
  bool free_box = false;

  // Add a sound track, placed before the video track in moov, with one
  // 100-byte sample after each video chunk.
  bool audio_track = false;

  uint32_t seed = 1;
};

struct TestMp4 {
  std::string data;

  // Absolute file offset of each video sample.
  std::vector<int64_t> sample_offsets;

  // Position of the mdat box and of its payload.
  int64_t mdat_pos = 0;
  int64_t mdat_data_pos = 0;
  int64_t mdat_end = 0;
  int64_t moov_pos = 0;
  int64_t moov_end = 0;
};

TestMp4 MakeTestMp4(const TestMp4Options &options);

}  // namespace reelstore

#endif  // REELSTORE_TESTUTIL_H
