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
// common.h: definitions shared by all of Reelstore.

#ifndef REELSTORE_COMMON_H
#define REELSTORE_COMMON_H

#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

#include <atomic>

namespace reelstore {

// Return value for *ForEach callbacks.
enum class IterationControl {
  kContinue,  // indicates the caller should proceed with the loop.
  kBreak      // indicates the caller should terminate the loop with success.
};

// Classification of chunk store and repository failures. Operations which
// can fail in more than one interesting way return one of these alongside a
// human-readable |error_message|.
enum class ErrorKind {
  kOk = 0,

  // A local storage operation failed. The same call may be retried; it is
  // idempotent.
  kIoError,

  // The requested address is not in the store.
  kNotFound,

  // Stored bytes do not hash to their address, and no recovery source could
  // supply a good copy. The bad copy has been quarantined.
  kCorruption,

  // A reference count would go below zero, or a manifest references an
  // address the store does not hold. The enclosing operation must stop.
  kInvariantViolation,
};

inline const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kOk:
      return "ok";
    case ErrorKind::kIoError:
      return "io error";
    case ErrorKind::kNotFound:
      return "not found";
    case ErrorKind::kCorruption:
      return "corruption";
    case ErrorKind::kInvariantViolation:
      return "invariant violation";
  }
  return "unknown";
}

// A request that long-running work stop at its next safe point.
class ShutdownSignal {
 public:
  ShutdownSignal() {}
  ShutdownSignal(const ShutdownSignal &) = delete;
  ShutdownSignal &operator=(const ShutdownSignal &) = delete;

  void Shutdown() { shutdown_.store(true, std::memory_order_relaxed); }

  bool ShouldShutdown() const {
    return shutdown_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic_bool shutdown_{false};
};

}  // namespace reelstore

#endif  // REELSTORE_COMMON_H
