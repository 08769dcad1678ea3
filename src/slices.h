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
// slices.h: byte ranges and lazily filled "file slices", which let a file
// reconstructed from many stored chunks be read at random offsets without
// materializing the whole file. Data is gathered into libevent buffers.

#ifndef REELSTORE_SLICES_H
#define REELSTORE_SLICES_H

#include <errno.h>
#include <string.h>

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <event2/buffer.h>
#include <glog/logging.h>
#include <re2/stringpiece.h>

#include "string.h"

namespace reelstore {

// Wrapped version of libevent's "struct evbuffer" which uses RAII and simply
// aborts the process if allocations fail.
class EvBuffer {
 public:
  EvBuffer() { buf_ = CHECK_NOTNULL(evbuffer_new()); }
  EvBuffer(const EvBuffer &) = delete;
  EvBuffer &operator=(const EvBuffer &) = delete;
  ~EvBuffer() { evbuffer_free(buf_); }

  struct evbuffer *get() {
    return buf_;
  }

  size_t size() const { return evbuffer_get_length(buf_); }

  void Add(const re2::StringPiece &s) {
    CHECK_EQ(0, evbuffer_add(buf_, s.data(), s.size()));
  }

  void AddReference(const void *data, size_t datlen,
                    evbuffer_ref_cleanup_cb cleanupfn, void *cleanupfn_arg) {
    CHECK_EQ(
        0, evbuffer_add_reference(buf_, data, datlen, cleanupfn, cleanupfn_arg))
        << strerror(errno);
  }

  // Moves the entire contents to the end of |out|.
  void RemoveAll(std::string *out);

 private:
  struct evbuffer *buf_;
};

struct ByteRange {
  ByteRange() {}
  ByteRange(int64_t begin, int64_t end) : begin(begin), end(end) {}
  int64_t begin = 0;
  int64_t end = 0;  // exclusive.
  int64_t size() const { return end - begin; }
  bool operator==(const ByteRange &o) const {
    return begin == o.begin && end == o.end;
  }
  bool operator!=(const ByteRange &o) const { return !(*this == o); }
  std::string DebugString() const { return StrCat("[", begin, ", ", end, ")"); }
};

inline std::ostream &operator<<(std::ostream &out, const ByteRange &range) {
  return out << range.DebugString();
}

class FileSlice {
 public:
  virtual ~FileSlice() {}

  virtual int64_t size() const = 0;

  // Add some to all of the given non-empty |range| to |buf|.
  // Returns the number of bytes added, or < 0 on error.
  // On error, |error_message| should be populated. (|error_message| may also be
  // populated if 0 <= return value < range.size(), such as if one of a
  // FileSlices object's failed. However, it's safe to simply retry such
  // partial failures later.)
  virtual int64_t AddRange(ByteRange range, EvBuffer *buf,
                           std::string *error_message) const = 0;
};

// A FileSlice of a pre-defined length which calls a function which fills the
// slice on demand. The FillerFileSlice is responsible for subsetting.
class FillerFileSlice : public FileSlice {
 public:
  using FillFunction =
      std::function<bool(std::string *slice, std::string *error_message)>;

  void Init(size_t size, FillFunction fn) {
    fn_ = fn;
    size_ = size;
  }

  int64_t size() const final { return size_; }

  int64_t AddRange(ByteRange range, EvBuffer *buf,
                   std::string *error_message) const final;

 private:
  FillFunction fn_;
  size_t size_ = 0;
};

// A FileSlice backed by in-memory data which outlives this object.
class StringPieceSlice : public FileSlice {
 public:
  StringPieceSlice() = default;
  explicit StringPieceSlice(re2::StringPiece piece) : piece_(piece) {}
  void Init(re2::StringPiece piece) { piece_ = piece; }

  int64_t size() const final { return piece_.size(); }
  int64_t AddRange(ByteRange range, EvBuffer *buf,
                   std::string *error_message) const final;

 private:
  re2::StringPiece piece_;
};

// A slice composed of other slices.
class FileSlices : public FileSlice {
 public:
  FileSlices() {}
  FileSlices(const FileSlices &) = delete;
  FileSlices &operator=(const FileSlices &) = delete;

  // |slice| must outlive the FileSlices.
  // |slice->size()| should not change after this call.
  // |flags| should be a bitmask of Flags values below.
  void Append(const FileSlice *slice, int flags = 0) {
    int64_t new_size = size_ + slice->size();
    slices_.emplace_back(ByteRange(size_, new_size), slice, flags);
    size_ = new_size;
  }

  int64_t size() const final { return size_; }
  int64_t AddRange(ByteRange range, EvBuffer *buf,
                   std::string *error_message) const final;

  size_t num_slices() const { return slices_.size(); }

  // Returns the index of the slice containing byte |offset|, or -1 if
  // |offset| is outside [0, size()).
  int FindSlice(int64_t offset) const;

  // Returns the position of slice |i| within this FileSlices.
  ByteRange slice_range(int i) const { return slices_[i].range; }

  enum Flags {
    // kLazy, as an argument to Append, instructs the FileSlices to append
    // this slice in AddRange only if it is the first slice in the requested
    // range. Otherwise it returns early, expecting the caller to call
    // AddRange again after consuming the earlier bytes. Chunk-backed slices
    // are lazy so that a large read holds at most one fetched chunk beyond
    // the bytes already delivered.
    kLazy = 1
  };

 private:
  struct SliceInfo {
    SliceInfo(ByteRange range, const FileSlice *slice, int flags)
        : range(range), slice(slice), flags(flags) {}
    ByteRange range;
    const FileSlice *slice = nullptr;
    int flags;
  };
  int64_t size_ = 0;

  std::vector<SliceInfo> slices_;
};

// Reads all of |range| from |slice| into |out|, calling AddRange as many
// times as necessary. Returns false and fills |error_message| on failure.
bool ReadSliceRange(const FileSlice &slice, ByteRange range, std::string *out,
                    std::string *error_message);

}  // namespace reelstore

#endif  // REELSTORE_SLICES_H
