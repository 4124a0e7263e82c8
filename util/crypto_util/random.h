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

#ifndef AUTHTAG_UTIL_CRYPTO_UTIL_RANDOM_H_
#define AUTHTAG_UTIL_CRYPTO_UTIL_RANDOM_H_

#include <cstddef>

#include "util/crypto_util/types.h"

namespace authtag {

namespace crypto {

// An instance of Random provides some utility functions for retrieving
// randomness.
class Random {
 public:
  virtual ~Random() {}

  // Writes |num| bytes of random data from a uniform distribution to buf.
  // The caller must ensure that |buf| has enough space.
  //
  // Returns false if the system's random number generator failed.
  virtual bool RandomBytes(byte *buf, std::size_t num);
};

}  // namespace crypto

}  // namespace authtag

#endif  // AUTHTAG_UTIL_CRYPTO_UTIL_RANDOM_H_
