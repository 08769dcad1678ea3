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
// gear.h: the gear rolling hash used to find content-defined chunk
// boundaries.
//
// The table below is part of the on-disk format: every chunk boundary, and
// thus every content address, depends on it. Changing any entry breaks
// deduplication against existing repositories and other implementations.
// The entries are the first 256 outputs of SplitMix64 seeded with
// kGearSeed, which GenerateGearEntry reproduces.

#ifndef REELSTORE_GEAR_H
#define REELSTORE_GEAR_H

#include <stdint.h>

namespace reelstore {

// ASCII "reelstor".
constexpr uint64_t kGearSeed = UINT64_C(0x7265656c73746f72);

extern const uint64_t kGearTable[256];

// Recomputes kGearTable[i] from the seed.
uint64_t GenerateGearEntry(int i);

// A gear hash: h = (h << 1) + kGearTable[byte]. Each byte's contribution is
// shifted out after 64 more bytes, so the value depends only on the trailing
// 64-byte window.
class GearHash {
 public:
  static constexpr int kWindow = 64;

  void Reset() { h_ = 0; }

  uint64_t Roll(uint8_t byte) {
    h_ = (h_ << 1) + kGearTable[byte];
    return h_;
  }

  uint64_t value() const { return h_; }

 private:
  uint64_t h_ = 0;
};

}  // namespace reelstore

#endif  // REELSTORE_GEAR_H
