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

#include <array>
#include <cstddef>

#include "logging.h"
#include "util/crypto_util/bounded_bytes.h"
#include "util/crypto_util/hash.h"
#include "util/crypto_util/key_normalizer.h"
#include "util/crypto_util/types.h"

#ifndef AUTHTAG_UTIL_CRYPTO_UTIL_MAC_H_
#define AUTHTAG_UTIL_CRYPTO_UTIL_MAC_H_

namespace authtag {

namespace crypto {

namespace hmac {

static const size_t TAG_SIZE = 32;  // SHA-256 outputs 32 bytes.

typedef std::array<byte, TAG_SIZE> Tag;
typedef std::array<byte, hash::BLOCK_SIZE> PadBlock;

// Writes normalized_key XOR 0x36 to |inner_pad| and normalized_key XOR 0x5c
// to |outer_pad|. |normalized_key| must have length hash::BLOCK_SIZE.
void DerivePads(const byte normalized_key[hash::BLOCK_SIZE],
                PadBlock *inner_pad, PadBlock *outer_pad);

// Runs the two HMAC-SHA256 hash passes over |data_len| bytes of |data| using
// a key that has already been through NormalizeKey():
//
//   tag = H(outer_pad || H(inner_pad || data))
//
// Bytes of |data| past |data_len| are never read. |tag| must have length
// |TAG_SIZE|. Returns false only if the underlying hash fails.
bool ComputeTag(const byte normalized_key[hash::BLOCK_SIZE], const byte *data,
                const size_t data_len, byte tag[TAG_SIZE]);

// Computes the HMAC-SHA256 of |data_len| bytes from |data| using the given
// |key| of length |key_len| and writes the result to |tag|.
//
// |key_len| may be any non-negative integer.
// |tag| must have length |TAG_SIZE|.
bool HMAC(const byte *key , const size_t key_len, const byte *data,
    const size_t data_len, byte tag[TAG_SIZE]);

// Computes the HMAC-SHA256 of |message| under |key|. Only the first size()
// bytes of each buffer take part; their unused capacity does not affect the
// result.
template <size_t M, size_t N>
bool HmacSha256(const BoundedBytes<M> &key, const BoundedBytes<N> &message,
                Tag *tag) {
  CHECK(tag);
  return HMAC(key.data(), key.size(), message.data(), message.size(),
              tag->data());
}

// Recomputes the HMAC-SHA256 of |data| under |key| and compares it with the
// |expected_len| bytes at |expected| in constant time. Returns true iff they
// are equal. A wrong |expected_len| or a hash failure yields false.
bool VerifyTag(const byte *key, const size_t key_len, const byte *data,
               const size_t data_len, const byte *expected,
               const size_t expected_len);

}  // namespace hmac

}  // namespace crypto

}  // namespace authtag

#endif  // AUTHTAG_UTIL_CRYPTO_UTIL_MAC_H_
