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
// reader.cc: see reader.h.

#include "reader.h"

#include <string.h>

#include <algorithm>

#include "string.h"

namespace reelstore {

int64_t StringReader::Read(char *buf, size_t size, std::string *) {
  size_t n = std::min(size, data_.size());
  memcpy(buf, data_.data(), n);
  data_.remove_prefix(n);
  return n;
}

int64_t FileRangeReader::Read(char *buf, size_t size,
                              std::string *error_message) {
  size_t want = std::min(static_cast<int64_t>(size), end_ - pos_);
  if (want == 0) {
    return 0;
  }
  size_t n;
  int ret = file_->Pread(buf, want, pos_, &n);
  if (ret != 0) {
    *error_message = StrCat("pread at offset ", pos_, ": ", strerror(ret));
    return -1;
  }
  if (n == 0) {
    *error_message =
        StrCat("unexpected end of file at offset ", pos_, "; expected ",
               end_ - pos_, " more bytes");
    return -1;
  }
  pos_ += n;
  return n;
}

int64_t DigestingReader::Read(char *buf, size_t size,
                              std::string *error_message) {
  int64_t n = inner_->Read(buf, size, error_message);
  if (n > 0) {
    digest_->Update(re2::StringPiece(buf, n));
    bytes_read_ += n;
  }
  return n;
}

}  // namespace reelstore
