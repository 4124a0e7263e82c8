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

#include "util/crypto_util/base64.h"

#include <openssl/evp.h>

#include <limits>

namespace authtag {
namespace crypto {

bool Base64Encode(const byte* data, size_t num_bytes,
                  std::string* encoded_out) {
  if ((!data && num_bytes > 0) || !encoded_out) {
    return false;
  }
  if (num_bytes > static_cast<size_t>(std::numeric_limits<int>::max() / 4)) {
    return false;
  }
  // Four output characters for every three input bytes, plus the trailing
  // null EVP_EncodeBlock writes.
  size_t required_length = ((num_bytes + 2) / 3) * 4 + 1;
  encoded_out->resize(required_length);
  int written = EVP_EncodeBlock(reinterpret_cast<byte*>(&(*encoded_out)[0]),
                                data, static_cast<int>(num_bytes));
  if (written < 0) {
    return false;
  }
  // Remove the trailing null. It is there to make a C string but we don't
  // need it in a std::string.
  encoded_out->resize(written);
  return true;
}

}  // namespace crypto
}  // namespace authtag
