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
// crypto.cc: see crypto.h.

#include "crypto.h"

#include <blake3.h>
#include <openssl/evp.h>

#include <glog/logging.h>

#include "string.h"

namespace reelstore {

namespace {

class EvpDigest : public Digest {
 public:
  explicit EvpDigest(const EVP_MD *md) {
    ctx_ = CHECK_NOTNULL(EVP_MD_CTX_create());
    CHECK_EQ(1, EVP_DigestInit_ex(ctx_, md, nullptr));
  }
  EvpDigest(const EvpDigest &) = delete;
  void operator=(const EvpDigest &) = delete;

  ~EvpDigest() final { EVP_MD_CTX_destroy(ctx_); }

  void Update(re2::StringPiece data) final {
    CHECK_EQ(1, EVP_DigestUpdate(ctx_, data.data(), data.size()));
  }

  std::string Finalize() final {
    std::string out;
    out.resize(EVP_MD_CTX_size(ctx_));
    auto *p = reinterpret_cast<unsigned char *>(&out[0]);
    CHECK_EQ(1, EVP_DigestFinal_ex(ctx_, p, nullptr));
    return out;
  }

 private:
  EVP_MD_CTX *ctx_ = nullptr;
};

class Blake3Digest : public Digest {
 public:
  Blake3Digest() { blake3_hasher_init(&hasher_); }
  Blake3Digest(const Blake3Digest &) = delete;
  void operator=(const Blake3Digest &) = delete;

  void Update(re2::StringPiece data) final {
    blake3_hasher_update(&hasher_, data.data(), data.size());
  }

  std::string Finalize() final {
    std::string out;
    out.resize(BLAKE3_OUT_LEN);
    blake3_hasher_finalize(&hasher_, reinterpret_cast<uint8_t *>(&out[0]),
                           out.size());
    return out;
  }

 private:
  blake3_hasher hasher_;
};

}  // namespace

constexpr size_t ContentAddress::kSize;

const char *HashAlgorithmName(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::kBlake3:
      return "blake3";
    case HashAlgorithm::kSha256:
      return "sha256";
    case HashAlgorithm::kSha3_256:
      return "sha3-256";
  }
  return "unknown";
}

bool ParseHashAlgorithm(re2::StringPiece name, HashAlgorithm *algorithm,
                        std::string *error_message) {
  std::string lower = AsciiToLower(name);
  if (lower == "blake3") {
    *algorithm = HashAlgorithm::kBlake3;
  } else if (lower == "sha256" || lower == "sha-256") {
    *algorithm = HashAlgorithm::kSha256;
  } else if (lower == "sha3-256" || lower == "sha3256") {
    *algorithm = HashAlgorithm::kSha3_256;
  } else {
    *error_message = StrCat("unknown hash algorithm \"", name, "\"");
    return false;
  }
  return true;
}

bool ContentAddress::FromBytes(re2::StringPiece raw, ContentAddress *out) {
  if (raw.size() != kSize) {
    return false;
  }
  memcpy(out->bytes_, raw.data(), kSize);
  return true;
}

bool ContentAddress::FromHex(re2::StringPiece hex, ContentAddress *out) {
  std::string raw;
  if (hex.size() != 2 * kSize || !reelstore::FromHex(hex, &raw)) {
    return false;
  }
  return FromBytes(raw, out);
}

std::string ContentAddress::ToHex() const {
  return reelstore::ToHex(as_piece(), false);
}

std::unique_ptr<Digest> Digest::SHA256() {
  return std::unique_ptr<Digest>(new EvpDigest(EVP_sha256()));
}

std::unique_ptr<Digest> Digest::SHA3_256() {
  return std::unique_ptr<Digest>(new EvpDigest(EVP_sha3_256()));
}

std::unique_ptr<Digest> Digest::BLAKE3() {
  return std::unique_ptr<Digest>(new Blake3Digest);
}

Digest::Factory Digest::FactoryFor(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::kBlake3:
      return &BLAKE3;
    case HashAlgorithm::kSha256:
      return &SHA256;
    case HashAlgorithm::kSha3_256:
      return &SHA3_256;
  }
  LOG(FATAL) << "bad hash algorithm " << static_cast<int>(algorithm);
  return nullptr;
}

ContentAddress Hasher::Hash(re2::StringPiece data) const {
  auto digest = NewDigest();
  digest->Update(data);
  ContentAddress out;
  CHECK(ContentAddress::FromBytes(digest->Finalize(), &out));
  return out;
}

}  // namespace reelstore
