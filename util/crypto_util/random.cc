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

#include "util/crypto_util/random.h"

#include <algorithm>
#include <limits>

#include <openssl/rand.h>

namespace authtag {
namespace crypto {

bool Random::RandomBytes(byte *buf, std::size_t num) {
  // RAND_bytes takes an int length.
  while (num > 0) {
    int chunk = static_cast<int>(
        std::min<std::size_t>(num, std::numeric_limits<int>::max()));
    if (RAND_bytes(buf, chunk) != 1) {
      return false;
    }
    buf += chunk;
    num -= chunk;
  }
  return true;
}

}  // namespace crypto

}  // namespace authtag
