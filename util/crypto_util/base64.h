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

#ifndef AUTHTAG_UTIL_CRYPTO_UTIL_BASE64_H_
#define AUTHTAG_UTIL_CRYPTO_UTIL_BASE64_H_

#include <cstddef>
#include <string>

#include "util/crypto_util/types.h"

namespace authtag {
namespace crypto {

// Base64 encodes |num_bytes| from |data| and writes the result into
// |encoded_out|.
//
// Returns true on success and false on failure.
bool Base64Encode(const byte* data, size_t num_bytes, std::string* encoded_out);

}  // namespace crypto
}  // namespace authtag

#endif  // AUTHTAG_UTIL_CRYPTO_UTIL_BASE64_H_
