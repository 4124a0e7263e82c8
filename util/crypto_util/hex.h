// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef AUTHTAG_UTIL_CRYPTO_UTIL_HEX_H_
#define AUTHTAG_UTIL_CRYPTO_UTIL_HEX_H_

#include <cstddef>
#include <string>
#include <vector>

#include "util/crypto_util/types.h"

namespace authtag {
namespace crypto {

// Returns the lower-case hexadecimal representation of |num_bytes| from
// |data|, two characters per byte.
std::string BytesToHex(const byte* data, size_t num_bytes);

// Decodes the hexadecimal string |hex| into |bytes_out|. Upper and lower case
// digits are both accepted. Returns false if |hex| has an odd length or
// contains a character that is not a hex digit; |bytes_out| is then left
// unchanged.
bool HexToBytes(const std::string& hex, std::vector<byte>* bytes_out);

}  // namespace crypto
}  // namespace authtag

#endif  // AUTHTAG_UTIL_CRYPTO_UTIL_HEX_H_
