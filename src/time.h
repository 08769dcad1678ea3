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
// time.h: wall clock access, replaceable by a simulated clock in tests.

#ifndef REELSTORE_TIME_H
#define REELSTORE_TIME_H

#include <stdint.h>
#include <time.h>

#include <mutex>
#include <string>

namespace reelstore {

constexpr long kNanos = 1000000000;

class WallClock {
 public:
  virtual ~WallClock() {}
  virtual struct timespec Now() const = 0;
  virtual void Sleep(struct timespec) = 0;
};

// A clock which only advances when slept upon; used to age chunks past the
// garbage collection grace period without waiting.
class SimulatedClock : public WallClock {
 public:
  SimulatedClock() : now_({0, 0}) {}
  explicit SimulatedClock(time_t start_sec) : now_({start_sec, 0}) {}
  struct timespec Now() const final;
  void Sleep(struct timespec req) final;

  void AdvanceSec(time_t sec) { Sleep({sec, 0}); }

 private:
  mutable std::mutex mu_;
  struct timespec now_;
};

// Returns the real wall clock, which will never be deleted.
WallClock *GetRealClock();

// Formats |sec| since epoch as a local "YYYY-mm-dd HH:MM:SS" string.
std::string FormatLocalTime(int64_t sec);

}  // namespace reelstore

#endif  // REELSTORE_TIME_H
