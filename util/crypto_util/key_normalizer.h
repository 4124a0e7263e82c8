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

#ifndef AUTHTAG_UTIL_CRYPTO_UTIL_KEY_NORMALIZER_H_
#define AUTHTAG_UTIL_CRYPTO_UTIL_KEY_NORMALIZER_H_

#include <cstddef>

#include "util/crypto_util/bounded_bytes.h"
#include "util/crypto_util/hash.h"
#include "util/crypto_util/types.h"

namespace authtag {

namespace crypto {

namespace hmac {

// Maps a secret key of any length to exactly hash::BLOCK_SIZE bytes, as
// required before the key can be padded for HMAC-SHA256:
//
//   - A key of exactly BLOCK_SIZE bytes is copied verbatim.
//   - A longer key is replaced by its SHA-256 digest followed by zeros.
//   - A shorter key is copied and followed by zeros.
//
// Only the first |key_len| bytes of |key| are read. |key| may be null only if
// |key_len| is zero. |out| must have length hash::BLOCK_SIZE.
//
// Returns false only if the underlying hash fails; use the functions in
// errors.h to obtain error information.
bool NormalizeKey(const byte *key, const size_t key_len,
                  byte out[hash::BLOCK_SIZE]);

template <size_t M>
bool NormalizeKey(const BoundedBytes<M> &key, byte out[hash::BLOCK_SIZE]) {
  return NormalizeKey(key.data(), key.size(), out);
}

}  // namespace hmac

}  // namespace crypto

}  // namespace authtag

#endif  // AUTHTAG_UTIL_CRYPTO_UTIL_KEY_NORMALIZER_H_
