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
// crypto.h: content hashing. Every stored chunk is named by a 32-byte
// content address computed by the repository's hash algorithm.

#ifndef REELSTORE_CRYPTO_H
#define REELSTORE_CRYPTO_H

#include <stdint.h>
#include <string.h>

#include <functional>
#include <memory>
#include <string>

#include <re2/stringpiece.h>

namespace reelstore {

enum class HashAlgorithm { kBlake3, kSha256, kSha3_256 };

// Returns the canonical lowercase name ("blake3", "sha256", "sha3-256").
const char *HashAlgorithmName(HashAlgorithm algorithm);

// Parses a name as returned by HashAlgorithmName, case-insensitively. Also
// accepts "sha-256" and "sha3256".
bool ParseHashAlgorithm(re2::StringPiece name, HashAlgorithm *algorithm,
                        std::string *error_message);

// A 32-byte content address, treated as an opaque key regardless of the
// algorithm which produced it.
class ContentAddress {
 public:
  static constexpr size_t kSize = 32;

  ContentAddress() { memset(bytes_, 0, kSize); }

  // Returns false unless |raw| is exactly kSize bytes.
  static bool FromBytes(re2::StringPiece raw, ContentAddress *out);

  // Parses 64 hex digits.
  static bool FromHex(re2::StringPiece hex, ContentAddress *out);

  re2::StringPiece as_piece() const {
    return re2::StringPiece(reinterpret_cast<const char *>(bytes_), kSize);
  }
  const uint8_t *data() const { return bytes_; }
  std::string ToHex() const;

  bool operator==(const ContentAddress &o) const {
    return memcmp(bytes_, o.bytes_, kSize) == 0;
  }
  bool operator!=(const ContentAddress &o) const { return !(*this == o); }
  bool operator<(const ContentAddress &o) const {
    return memcmp(bytes_, o.bytes_, kSize) < 0;
  }

 private:
  uint8_t bytes_[kSize];
};

struct ContentAddressHash {
  size_t operator()(const ContentAddress &a) const {
    // The address is already uniformly distributed.
    size_t h;
    memcpy(&h, a.data(), sizeof(h));
    return h;
  }
};

// A streaming digest.
class Digest {
 public:
  static std::unique_ptr<Digest> SHA256();
  static std::unique_ptr<Digest> SHA3_256();
  static std::unique_ptr<Digest> BLAKE3();

  typedef std::unique_ptr<Digest> (*Factory)();

  // Returns one of the factories above.
  static Factory FactoryFor(HashAlgorithm algorithm);

  virtual ~Digest() {}

  // PRE: Finalize() has not been called.
  virtual void Update(re2::StringPiece data) = 0;

  // PRE: Finalize() has not been called.
  virtual std::string Finalize() = 0;
};

// Computes content addresses with one fixed algorithm. Thread-safe; each
// call uses its own digest state, so independent chunks may be hashed
// concurrently.
class Hasher {
 public:
  explicit Hasher(HashAlgorithm algorithm)
      : algorithm_(algorithm), new_digest_(Digest::FactoryFor(algorithm)) {}

  HashAlgorithm algorithm() const { return algorithm_; }

  ContentAddress Hash(re2::StringPiece data) const;

  std::unique_ptr<Digest> NewDigest() const { return new_digest_(); }

  // Returns true iff |data| hashes to |expected|.
  bool Verify(re2::StringPiece data, const ContentAddress &expected) const {
    return Hash(data) == expected;
  }

 private:
  const HashAlgorithm algorithm_;
  const Digest::Factory new_digest_;
};

}  // namespace reelstore

#endif  // REELSTORE_CRYPTO_H
