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
// slices.cc: See slices.h.

#include "slices.h"

#include <algorithm>

#include <glog/logging.h>

namespace reelstore {

void EvBuffer::RemoveAll(std::string *out) {
  size_t len = evbuffer_get_length(buf_);
  if (len == 0) {
    return;
  }
  size_t old_size = out->size();
  out->resize(old_size + len);
  int removed = evbuffer_remove(buf_, &(*out)[old_size], len);
  CHECK_EQ(static_cast<int>(len), removed) << "evbuffer_remove failed";
}

int64_t FillerFileSlice::AddRange(ByteRange range, EvBuffer *buf,
                                  std::string *error_message) const {
  std::unique_ptr<std::string> s(new std::string);
  s->reserve(size_);
  if (!fn_(s.get(), error_message)) {
    return -1;
  }
  if (s->size() != size_) {
    *error_message = StrCat("Expected filled slice to be ", size_,
                            " bytes; got ", s->size(), " bytes.");
    return -1;
  }
  std::string *unowned_s = s.release();
  buf->AddReference(unowned_s->data() + range.begin,
                    range.size(), [](const void *, size_t, void *s) {
                      delete reinterpret_cast<std::string *>(s);
                    }, unowned_s);
  return range.size();
}

int64_t StringPieceSlice::AddRange(ByteRange range, EvBuffer *buf,
                                   std::string *error_message) const {
  buf->AddReference(piece_.data() + range.begin, range.size(), nullptr,
                    nullptr);
  return range.size();
}

int FileSlices::FindSlice(int64_t offset) const {
  if (offset < 0 || offset >= size_) {
    return -1;
  }
  auto it = std::upper_bound(slices_.begin(), slices_.end(), offset,
                             [](int64_t off, const SliceInfo &info) {
                               return off < info.range.end;
                             });
  return it == slices_.end() ? -1 : static_cast<int>(it - slices_.begin());
}

int64_t FileSlices::AddRange(ByteRange range, EvBuffer *buf,
                             std::string *error_message) const {
  if (range.begin < 0 || range.begin > range.end || range.end > size_) {
    *error_message = StrCat("Range ", range.DebugString(),
                            " not valid for file of size ", size_);
    return -1;
  }
  int64_t total_bytes_added = 0;
  auto it = std::upper_bound(slices_.begin(), slices_.end(), range.begin,
                             [](int64_t begin, const SliceInfo &info) {
                               return begin < info.range.end;
                             });
  for (; it != slices_.end() && range.end > it->range.begin; ++it) {
    if (total_bytes_added > 0 && (it->flags & kLazy) != 0) {
      VLOG(2) << "early return of " << total_bytes_added << "/" << range.size()
              << " bytes from FileSlices " << this << " because slice "
              << it->slice << " is lazy.";
      break;
    }
    ByteRange mapped(
        std::max(INT64_C(0), range.begin - it->range.begin),
        std::min(range.end - it->range.begin, it->range.end - it->range.begin));
    int64_t slice_bytes_added = it->slice->AddRange(mapped, buf, error_message);
    total_bytes_added += slice_bytes_added > 0 ? slice_bytes_added : 0;
    if (slice_bytes_added < 0 && total_bytes_added == 0) {
      VLOG(1) << "early return of " << total_bytes_added << "/"
              << range.size() << " bytes from FileSlices " << this
              << " due to slice " << it->slice
              << " returning error: " << *error_message;
      return -1;
    } else if (slice_bytes_added < mapped.size()) {
      VLOG(1) << "early return of " << total_bytes_added << "/"
              << range.size() << " bytes from FileSlices " << this
              << " due to slice " << it->slice << " returning "
              << slice_bytes_added << "/" << mapped.size()
              << " bytes. error_message (maybe populated): "
              << *error_message;
      break;
    }
  }
  return total_bytes_added;
}

bool ReadSliceRange(const FileSlice &slice, ByteRange range, std::string *out,
                    std::string *error_message) {
  if (range.begin < 0 || range.begin > range.end || range.end > slice.size()) {
    *error_message = StrCat("Range ", range.DebugString(),
                            " not valid for file of size ", slice.size());
    return false;
  }
  out->clear();
  out->reserve(range.size());
  while (range.size() > 0) {
    EvBuffer buf;
    error_message->clear();
    int64_t added = slice.AddRange(range, &buf, error_message);
    if (added <= 0) {
      if (error_message->empty()) {
        *error_message = StrCat("no progress reading ", range.DebugString());
      }
      return false;
    }
    buf.RemoveAll(out);
    range.begin += added;
  }
  return true;
}

}  // namespace reelstore
