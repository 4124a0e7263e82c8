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

#include "util/crypto_util/bounded_bytes.h"

#include <string>

#include "gtest/gtest.h"

namespace authtag {
namespace crypto {

TEST(BoundedBytesTest, StartsEmpty) {
  BoundedBytes<16> bytes;
  EXPECT_TRUE(bytes.empty());
  EXPECT_EQ(0u, bytes.size());
  EXPECT_EQ(16u, bytes.capacity());
}

TEST(BoundedBytesTest, AssignUpToCapacity) {
  BoundedBytes<5> bytes;
  EXPECT_TRUE(bytes.Assign("abc").ok());
  EXPECT_EQ(3u, bytes.size());
  EXPECT_EQ('a', bytes[0]);
  EXPECT_EQ('c', bytes[2]);

  EXPECT_TRUE(bytes.Assign("hello").ok());
  EXPECT_EQ(5u, bytes.size());
  EXPECT_EQ(std::string("hello"),
            std::string(reinterpret_cast<const char*>(bytes.data()),
                        bytes.size()));

  EXPECT_TRUE(bytes.Assign(nullptr, 0).ok());
  EXPECT_TRUE(bytes.empty());
}

// An over-capacity value is rejected and the buffer keeps its old value.
TEST(BoundedBytesTest, AssignOverCapacityIsRejected) {
  BoundedBytes<5> bytes;
  ASSERT_TRUE(bytes.Assign("abc").ok());
  util::Status status = bytes.Assign("abcdef");
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(util::INVALID_ARGUMENT, status.error_code());
  EXPECT_EQ(3u, bytes.size());
  EXPECT_EQ('a', bytes[0]);
}

TEST(BoundedBytesTest, ResizeKeepsStaleBytesOutOfTheValue) {
  BoundedBytes<8> bytes;
  ASSERT_TRUE(bytes.Assign("abcdef").ok());
  ASSERT_TRUE(bytes.Resize(2).ok());
  EXPECT_EQ(2u, bytes.size());

  // Growing again exposes zeros, not the old "cdef".
  ASSERT_TRUE(bytes.Resize(4).ok());
  EXPECT_EQ('a', bytes[0]);
  EXPECT_EQ('b', bytes[1]);
  EXPECT_EQ(0, bytes[2]);
  EXPECT_EQ(0, bytes[3]);

  EXPECT_EQ(util::INVALID_ARGUMENT, bytes.Resize(9).error_code());
  EXPECT_EQ(4u, bytes.size());
}

TEST(BoundedBytesTest, ZeroCapacity) {
  BoundedBytes<0> bytes;
  EXPECT_TRUE(bytes.Assign("").ok());
  EXPECT_FALSE(bytes.Assign("x").ok());
  EXPECT_FALSE(bytes.Resize(1).ok());
}

}  // namespace crypto
}  // namespace authtag
