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

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "util/crypto_util/hex.h"

namespace authtag {
namespace crypto {
namespace hmac {

namespace {

std::vector<byte> Normalize(const std::string& key) {
  std::vector<byte> out(hash::BLOCK_SIZE, 0xaa);
  EXPECT_TRUE(NormalizeKey(reinterpret_cast<const byte*>(key.data()),
                           key.size(), out.data()));
  return out;
}

}  // namespace

// A key of exactly one block is used as is.
TEST(KeyNormalizerTest, BlockSizedKeyIsCopied) {
  std::string key =
      "63E9B5F9DA4584483662FC2E5A48763E9B5F9DA4584483662FC2E5A487FDRYYH";
  ASSERT_EQ(hash::BLOCK_SIZE, key.size());
  EXPECT_EQ(std::vector<byte>(key.begin(), key.end()), Normalize(key));
}

// A shorter key is copied and followed by zeros.
TEST(KeyNormalizerTest, ShortKeyIsZeroPadded) {
  for (size_t len : {0, 1, 32, 48, 63}) {
    std::string key(len, 'k');
    std::vector<byte> normalized = Normalize(key);
    for (size_t i = 0; i < len; i++) {
      EXPECT_EQ('k', normalized[i]) << "len=" << len << " i=" << i;
    }
    for (size_t i = len; i < hash::BLOCK_SIZE; i++) {
      EXPECT_EQ(0, normalized[i]) << "len=" << len << " i=" << i;
    }
  }
}

// A longer key is replaced by its SHA-256 digest followed by 32 zeros.
TEST(KeyNormalizerTest, LongKeyIsHashed) {
  std::string key =
      "63E9B5F9DA4584483662FC2E5A48763E9B5F9DA4584483662FC2E5A487FDRYYH"
      "63E9B5F9DA4584483662FC2E5A48763E9B5";
  ASSERT_EQ(99u, key.size());
  std::vector<byte> normalized = Normalize(key);
  EXPECT_EQ(
      "4558f50f8a8c4f68f2da76839ce3471978a09c8da13784d4e6c0c8b2595d9057",
      BytesToHex(normalized.data(), hash::DIGEST_SIZE));
  EXPECT_EQ(std::vector<byte>(hash::BLOCK_SIZE - hash::DIGEST_SIZE, 0),
            std::vector<byte>(normalized.begin() + hash::DIGEST_SIZE,
                              normalized.end()));
}

// A 65 byte key is the smallest key that gets hashed.
TEST(KeyNormalizerTest, OneByteOverBlockIsHashed) {
  std::string key(65, 'k');
  std::vector<byte> normalized = Normalize(key);
  byte digest[hash::DIGEST_SIZE];
  ASSERT_TRUE(hash::Hash(reinterpret_cast<const byte*>(key.data()),
                         key.size(), digest));
  EXPECT_EQ(std::vector<byte>(digest, digest + hash::DIGEST_SIZE),
            std::vector<byte>(normalized.begin(),
                              normalized.begin() + hash::DIGEST_SIZE));
}

// Only the first size() bytes of a BoundedBytes key are looked at, whichever
// of the three cases applies.
TEST(KeyNormalizerTest, BoundedKeyIgnoresUnusedCapacity) {
  for (size_t len : {10, 64, 100}) {
    BoundedBytes<200> key;
    ASSERT_TRUE(key.Assign(std::string(len, 'k')).ok());
    for (size_t i = len; i < key.capacity(); i++) {
      key.mutable_storage()[i] = static_cast<byte>(i);
    }
    byte normalized[hash::BLOCK_SIZE];
    ASSERT_TRUE(NormalizeKey(key, normalized));
    EXPECT_EQ(Normalize(std::string(len, 'k')),
              std::vector<byte>(normalized, normalized + hash::BLOCK_SIZE))
        << "len=" << len;
  }
}

TEST(KeyNormalizerDeathTest, NullOutput) {
  std::string key = "key";
  EXPECT_DEATH(NormalizeKey(reinterpret_cast<const byte*>(key.data()),
                            key.size(), nullptr),
               "Check failed");
}

}  // namespace hmac

}  // namespace crypto

}  // namespace authtag
