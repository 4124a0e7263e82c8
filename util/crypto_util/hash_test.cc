// Copyright 2017 The Fuchsia Authors
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

#include <array>
#include <string>

#include "gtest/gtest.h"
#include "util/crypto_util/hex.h"

namespace authtag {
namespace crypto {
namespace hash {

TEST(HashTest, TestHash) {
  std::string data =
      "The algorithms were first published in 2001 in the draft FIPS PUB "
      "180-2, at which time public review and comments were accepted. In "
      "August 2002, FIPS PUB 180-2 became the new Secure Hash Standard, "
      "replacing FIPS PUB 180-1, which was released in April 1995. The updated "
      "standard included the original SHA-1 algorithm, with updated technical "
      "notation consistent with that describing the inner workings of the "
      "SHA-2 family.[9]";

  // Hash the data into digest.
  byte digest[DIGEST_SIZE];
  EXPECT_TRUE(Hash(reinterpret_cast<byte*>(&data[0]), data.size(), digest));

  // Compare this to an expected result.
  EXPECT_EQ(
      std::string(
          "fc11f3cbffea99f65944e50e72e5bfc09674eed67bcebcd76ec0f9dc90faef05"),
      BytesToHex(digest, DIGEST_SIZE));
}

TEST(HashTest, EmptyInput) {
  byte digest[DIGEST_SIZE];
  EXPECT_TRUE(Hash(nullptr, 0, digest));
  EXPECT_EQ(
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
      BytesToHex(digest, DIGEST_SIZE));
}

// Only |data_len| bytes are hashed even if the buffer holds more.
TEST(HashTest, HashesOnlyDataLen) {
  std::string data = "abcdefgh";
  byte digest[DIGEST_SIZE];
  EXPECT_TRUE(Hash(reinterpret_cast<const byte*>(data.data()), 3, digest));
  EXPECT_EQ(
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
      BytesToHex(digest, DIGEST_SIZE));
}

TEST(HashTest, HashFixed) {
  std::array<byte, 96> data;
  for (size_t i = 0; i < data.size(); i++) {
    data[i] = static_cast<byte>(i);
  }
  Digest digest;
  EXPECT_TRUE(HashFixed(data, &digest));
  EXPECT_EQ(
      "08359b108fa567f5dcf319fa3434da6abbc1d595f426372666447f09cc5a87dc",
      BytesToHex(digest.data(), digest.size()));
}

}  // namespace hash

}  // namespace crypto

}  // namespace authtag
