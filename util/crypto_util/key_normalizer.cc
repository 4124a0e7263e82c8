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

#include "util/crypto_util/key_normalizer.h"

#include <cstring>

#include "logging.h"

namespace authtag {

namespace crypto {

namespace hmac {

bool NormalizeKey(const byte *key, const size_t key_len,
                  byte out[hash::BLOCK_SIZE]) {
  CHECK(out);
  if (key_len == hash::BLOCK_SIZE) {
    std::memcpy(out, key, hash::BLOCK_SIZE);
    return true;
  }

  if (key_len > hash::BLOCK_SIZE) {
    if (!hash::Hash(key, key_len, out)) {
      return false;
    }
    std::memset(out + hash::DIGEST_SIZE, 0,
                hash::BLOCK_SIZE - hash::DIGEST_SIZE);
    return true;
  }

  if (key_len > 0) {
    std::memcpy(out, key, key_len);
  }
  std::memset(out + key_len, 0, hash::BLOCK_SIZE - key_len);
  return true;
}

}  // namespace hmac

}  // namespace crypto

}  // namespace authtag
