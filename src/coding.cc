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
// coding.cc: see coding.h.

#include "coding.h"
#include "common.h"

namespace reelstore {

namespace internal {

void AppendVar64Slow(uint64_t in, std::string *out) {
  while (true) {
    uint8_t next_byte = in & 0x7F;
    in >>= 7;
    if (in == 0) {
      out->push_back(next_byte);
      return;
    }
    out->push_back(next_byte | 0x80);
  }
}

bool DecodeVar64Slow(re2::StringPiece *in, uint64_t *out_p,
                     std::string *error_message) {
  // The fast path is inlined; this function is called only when
  // byte 0 is present and >= 0x80.
  auto p = reinterpret_cast<uint8_t const *>(in->data());
  uint64_t v = 0;
  size_t size = 0;
  int shift = 0;
  while (true) {
    if (UNLIKELY(size == in->size())) {
      *error_message = "buffer underrun";
      return false;
    }
    uint8_t byte = p[size++];

    // The tenth byte may contribute only the single remaining bit.
    if (UNLIKELY(shift == 63 && (byte & 0x7e) != 0)) {
      *error_message = "integer overflow";
      return false;
    }
    v |= uint64_t(byte & 0x7f) << shift;
    if ((byte & 0x80) == 0) {
      break;
    }
    shift += 7;
    if (UNLIKELY(shift > 63)) {
      *error_message = "integer overflow";
      return false;
    }
  }
  *out_p = v;
  in->remove_prefix(size);
  return true;
}

}  // namespace internal

bool DecodeLengthPrefixed(re2::StringPiece *in, re2::StringPiece *out,
                          std::string *error_message) {
  uint64_t len;
  if (!DecodeVar64(in, &len, error_message)) {
    return false;
  }
  if (len > in->size()) {
    *error_message = "buffer underrun";
    return false;
  }
  out->set(in->data(), static_cast<size_t>(len));
  in->remove_prefix(static_cast<size_t>(len));
  return true;
}

}  // namespace reelstore
