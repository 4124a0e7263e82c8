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

#include "util/crypto_util/hash.h"

#include <openssl/evp.h>

namespace authtag {

namespace crypto {

namespace hash {

bool Hash(const byte *data, const size_t data_len, byte out[DIGEST_SIZE]) {
  unsigned int out_len;
  if (!EVP_Digest(data, data_len, out, &out_len, EVP_sha256(), nullptr)) {
    return false;
  }
  return out_len == DIGEST_SIZE;
}

}  // namespace hash

}  // namespace crypto

}  // namespace authtag
