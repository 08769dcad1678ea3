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
// filesystem.h: helpers for dealing with the local filesystem.

#ifndef REELSTORE_FILESYSTEM_H
#define REELSTORE_FILESYSTEM_H

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>

#include <re2/stringpiece.h>

#include "common.h"

namespace reelstore {

// Represents an open file descriptor. All methods but Close() are thread-safe.
class File {
 public:
  // Close the file, ignoring the result.
  virtual ~File() {}

  // Close the file, returning 0 on success or errno>0 on failure.
  // Already closed is considered a success.
  virtual int Close() = 0;

  // openat(), returning 0 on success or errno>0 on failure.
  virtual int Open(const char *path, int flags, std::unique_ptr<File> *f) = 0;
  virtual int Open(const char *path, int flags, mode_t mode,
                   std::unique_ptr<File> *f) = 0;

  // read(), returning 0 on success or errno>0 on failure.
  // On success, |bytes_read| will be updated.
  virtual int Read(void *buf, size_t count, size_t *bytes_read) = 0;

  // pread(), returning 0 on success or errno>0 on failure.
  // On success, |bytes_read| will be updated; 0 means end of file.
  virtual int Pread(void *buf, size_t count, off_t offset,
                    size_t *bytes_read) = 0;

  // fstat(), returning 0 on success or errno>0 on failure.
  virtual int Stat(struct stat *buf) = 0;

  // fsync(), returning 0 on success or errno>0 on failure.
  virtual int Sync() = 0;

  // Write to the file, returning 0 on success or errno>0 on failure.
  // On success, |bytes_written| will be updated.
  virtual int Write(re2::StringPiece data, size_t *bytes_written) = 0;
};

// Interface to the local filesystem. There's typically one per program,
// but it's an abstract class for testability. Thread-safe.
class Filesystem {
 public:
  virtual ~Filesystem() {}

  // Execute |fn| for each directory entry in |dir_path|, stopping early
  // (successfully) if the callback returns IterationControl::kBreak.
  //
  // On success, returns true.
  // On failure, returns false and updates |error_msg|.
  virtual bool DirForEach(const char *dir_path,
                          std::function<IterationControl(const dirent *)> fn,
                          std::string *error_msg) = 0;

  // open() the specified path, returning 0 on success or errno>0 on failure.
  // On success, |f| is populated with an open file.
  virtual int Open(const char *path, int flags, std::unique_ptr<File> *f) = 0;
  virtual int Open(const char *path, int flags, mode_t mode,
                   std::unique_ptr<File> *f) = 0;

  // mkdir() the specified path, returning 0 on success or errno>0 on failure.
  virtual int Mkdir(const char *path, mode_t mode) = 0;

  // rename() |from| to |to|, returning 0 on success or errno>0 on failure.
  virtual int Rename(const char *from, const char *to) = 0;

  // rmdir() the specified path, returning 0 on success or errno>0 on failure.
  virtual int Rmdir(const char *path) = 0;

  // stat() the specified path, returning 0 on success or errno>0 on failure.
  virtual int Stat(const char *path, struct stat *buf) = 0;

  // unlink() the specified file, returning 0 on success or errno>0 on failure.
  virtual int Unlink(const char *path) = 0;
};

// Get the (singleton) real filesystem, which is never deleted.
Filesystem *GetRealFilesystem();

// Reads from |f| until end of file, appending to |out|.
// Returns 0 on success or errno>0 on failure.
int ReadAll(File *f, std::string *out);

// Reads exactly |size| bytes at |offset|, replacing the contents of |out|.
// Returns 0 on success, errno>0 on failure, or EIO on a premature end of file.
int PreadFully(File *f, off_t offset, size_t size, std::string *out);

// Writes all of |data|, retrying short writes.
// Returns 0 on success or errno>0 on failure.
int WriteAll(File *f, re2::StringPiece data);

// Creates |path| and any missing parents. An existing directory is success.
// Returns 0 on success or errno>0 on failure.
int MkdirAll(Filesystem *fs, re2::StringPiece path, mode_t mode);

// Reads the whole file at |path|. Returns 0 on success or errno>0 on failure.
int ReadFileContents(Filesystem *fs, const std::string &path,
                     std::string *out);

// Writes |data| to |tmp_path|, syncs it, and renames it to |final_path| so that
// readers never observe a partial file. |tmp_path| is removed on failure.
// Returns 0 on success or errno>0 on failure.
int WriteFileAtomically(Filesystem *fs, const std::string &tmp_path,
                        const std::string &final_path, re2::StringPiece data);

}  // namespace reelstore

#endif  // REELSTORE_FILESYSTEM_H
