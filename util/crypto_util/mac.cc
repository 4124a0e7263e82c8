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

#include "util/crypto_util/mac.h"

#include <algorithm>
#include <cstring>
#include <vector>

#include <openssl/crypto.h>

#include "logging.h"

namespace authtag {

namespace crypto {

namespace hmac {

namespace {

const byte kInnerPadByte = 0x36;
const byte kOuterPadByte = 0x5c;

}  // namespace

void DerivePads(const byte normalized_key[hash::BLOCK_SIZE],
                PadBlock *inner_pad, PadBlock *outer_pad) {
  CHECK(inner_pad);
  CHECK(outer_pad);
  for (size_t i = 0; i < hash::BLOCK_SIZE; i++) {
    (*inner_pad)[i] = normalized_key[i] ^ kInnerPadByte;
    (*outer_pad)[i] = normalized_key[i] ^ kOuterPadByte;
  }
}

bool ComputeTag(const byte normalized_key[hash::BLOCK_SIZE], const byte *data,
                const size_t data_len, byte tag[TAG_SIZE]) {
  CHECK(tag);
  PadBlock inner_pad, outer_pad;
  DerivePads(normalized_key, &inner_pad, &outer_pad);

  // The inner input is sized from |data_len| alone.
  std::vector<byte> inner_input(hash::BLOCK_SIZE + data_len);
  std::copy(inner_pad.begin(), inner_pad.end(), inner_input.begin());
  if (data_len > 0) {
    std::memcpy(inner_input.data() + hash::BLOCK_SIZE, data, data_len);
  }

  hash::Digest inner_digest;
  bool success = hash::Hash(inner_input.data(), inner_input.size(),
                            inner_digest.data());

  std::array<byte, hash::BLOCK_SIZE + hash::DIGEST_SIZE> outer_input;
  hash::Digest outer_digest;
  if (success) {
    std::copy(outer_pad.begin(), outer_pad.end(), outer_input.begin());
    std::copy(inner_digest.begin(), inner_digest.end(),
              outer_input.begin() + hash::BLOCK_SIZE);
    success = hash::HashFixed(outer_input, &outer_digest);
  }
  if (success) {
    std::copy(outer_digest.begin(), outer_digest.end(), tag);
  }

  OPENSSL_cleanse(inner_pad.data(), inner_pad.size());
  OPENSSL_cleanse(outer_pad.data(), outer_pad.size());
  OPENSSL_cleanse(inner_input.data(), hash::BLOCK_SIZE);
  OPENSSL_cleanse(inner_digest.data(), inner_digest.size());
  OPENSSL_cleanse(outer_input.data(), outer_input.size());
  return success;
}

bool HMAC(const byte *key , const size_t key_len, const byte *data,
  const size_t data_len, byte tag[TAG_SIZE]) {
  CHECK(tag);
  byte normalized_key[hash::BLOCK_SIZE];
  bool success = NormalizeKey(key, key_len, normalized_key) &&
                 ComputeTag(normalized_key, data, data_len, tag);
  OPENSSL_cleanse(normalized_key, sizeof(normalized_key));
  return success;
}

bool VerifyTag(const byte *key, const size_t key_len, const byte *data,
               const size_t data_len, const byte *expected,
               const size_t expected_len) {
  if (expected_len != TAG_SIZE) {
    return false;
  }
  byte tag[TAG_SIZE];
  if (!HMAC(key, key_len, data, data_len, tag)) {
    return false;
  }
  return CRYPTO_memcmp(tag, expected, TAG_SIZE) == 0;
}

}  // namespace hmac

}  // namespace crypto

}  // namespace authtag
