// Copyright 2016 The Fuchsia Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef AUTHTAG_UTIL_CRYPTO_UTIL_HASH_H_
#define AUTHTAG_UTIL_CRYPTO_UTIL_HASH_H_

#include <array>
#include <cstddef>

#include "util/crypto_util/types.h"

namespace authtag {

namespace crypto {

namespace hash {

static const size_t DIGEST_SIZE = 32;  // SHA-256 outputs 32 bytes.

// The size of the blocks SHA-256 consumes internally.
static const size_t BLOCK_SIZE = 64;

typedef std::array<byte, DIGEST_SIZE> Digest;

// Computes the SHA256 digest of |data_len| bytes from |data| and writes the
// result to |out| which must have length |DIGEST_SIZE|. Bytes of the
// underlying buffer past |data_len| are never read.
//
// Returns true for success or false for failure.
bool Hash(const byte *data, const size_t data_len, byte out[DIGEST_SIZE]);

// Hashes all |N| bytes of |data|. Used where the input length is a
// compile-time constant, such as the outer HMAC pass.
template <size_t N>
bool HashFixed(const std::array<byte, N> &data, Digest *out) {
  return Hash(data.data(), N, out->data());
}

}  // namespace hash

}  // namespace crypto

}  // namespace authtag
#endif  // AUTHTAG_UTIL_CRYPTO_UTIL_HASH_H_
