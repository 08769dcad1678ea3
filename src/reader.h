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
// reader.h: sequential byte sources for the chunker.

#ifndef REELSTORE_READER_H
#define REELSTORE_READER_H

#include <stdint.h>

#include <string>

#include <re2/stringpiece.h>

#include "crypto.h"
#include "filesystem.h"
#include "slices.h"

namespace reelstore {

class ByteReader {
 public:
  virtual ~ByteReader() {}

  // Reads up to |size| bytes into |buf|.
  // Returns the number of bytes read, 0 at end of input, or < 0 on error,
  // in which case |error_message| is filled.
  virtual int64_t Read(char *buf, size_t size, std::string *error_message) = 0;
};

// Reads from memory which must outlive the StringReader.
class StringReader : public ByteReader {
 public:
  explicit StringReader(re2::StringPiece data) : data_(data) {}

  int64_t Read(char *buf, size_t size, std::string *error_message) final;

 private:
  re2::StringPiece data_;
};

// Reads |range| of an open file via pread, so that several readers may share
// one File.
class FileRangeReader : public ByteReader {
 public:
  // |file| must outlive the FileRangeReader.
  FileRangeReader(File *file, ByteRange range)
      : file_(file), pos_(range.begin), end_(range.end) {}

  int64_t Read(char *buf, size_t size, std::string *error_message) final;

 private:
  File *file_;
  int64_t pos_;
  int64_t end_;
};

// Passes through another reader's bytes, feeding them to a digest as well.
class DigestingReader : public ByteReader {
 public:
  // |inner| and |digest| must outlive the DigestingReader.
  DigestingReader(ByteReader *inner, Digest *digest)
      : inner_(inner), digest_(digest) {}

  int64_t Read(char *buf, size_t size, std::string *error_message) final;

  int64_t bytes_read() const { return bytes_read_; }

 private:
  ByteReader *inner_;
  Digest *digest_;
  int64_t bytes_read_ = 0;
};

}  // namespace reelstore

#endif  // REELSTORE_READER_H
