// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "util/crypto_util/hex.h"

#include <openssl/crypto.h>
#include <openssl/err.h>

#include <iomanip>
#include <sstream>

namespace authtag {
namespace crypto {

std::string BytesToHex(const byte* data, size_t num_bytes) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (size_t i = 0; i < num_bytes; i++) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

bool HexToBytes(const std::string& hex, std::vector<byte>* bytes_out) {
  if (!bytes_out || hex.size() % 2 != 0) {
    return false;
  }
  // OPENSSL_hexstr2buf_ex reads a C string; an embedded null would end the
  // input early.
  if (hex.find('\0') != std::string::npos) {
    return false;
  }
  std::vector<byte> bytes(hex.size() / 2);
  size_t num_bytes = 0;
  // A separator of '\0' means the digits are not separated.
  if (OPENSSL_hexstr2buf_ex(bytes.data(), bytes.size(), &num_bytes,
                            hex.c_str(), '\0') != 1) {
    // Don't leave the parse error behind for GetLastErrorMessage().
    ERR_clear_error();
    return false;
  }
  bytes.resize(num_bytes);
  bytes_out->swap(bytes);
  return true;
}

}  // namespace crypto
}  // namespace authtag
