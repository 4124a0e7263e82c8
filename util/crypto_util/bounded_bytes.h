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

#ifndef AUTHTAG_UTIL_CRYPTO_UTIL_BOUNDED_BYTES_H_
#define AUTHTAG_UTIL_CRYPTO_UTIL_BOUNDED_BYTES_H_

#include <array>
#include <cstddef>
#include <cstring>
#include <sstream>
#include <string>

#include "util/crypto_util/types.h"
#include "util/status.h"

namespace authtag {
namespace crypto {

// A byte sequence with a fixed capacity |N| and a tracked actual length.
//
// Only the first size() bytes are meaningful. The bytes in the storage past
// size() are left over from earlier contents or from direct writes through
// mutable_storage(), and no consumer in this library ever reads them. Every
// hashing operation takes the prefix [0, size()) and nothing else.
//
// A length greater than |N| is never accepted: Assign() and Resize() return
// an INVALID_ARGUMENT status and leave the buffer as it was. Nothing is
// truncated to fit.
template <size_t N>
class BoundedBytes {
 public:
  BoundedBytes() : size_(0) { storage_.fill(0); }

  // Copies |len| bytes from |data| into the buffer and sets the actual length
  // to |len|. |data| may be null only if |len| is zero.
  util::Status Assign(const byte* data, size_t len) {
    if (len > N) {
      return CapacityError(len);
    }
    if (len > 0) {
      std::memcpy(storage_.data(), data, len);
    }
    size_ = len;
    return util::Status::OK;
  }

  util::Status Assign(const std::string& data) {
    return Assign(reinterpret_cast<const byte*>(data.data()), data.size());
  }

  // Sets the actual length to |len|. When shrinking, the bytes past the new
  // length stay in storage but stop being part of the value. When growing,
  // the newly exposed bytes are set to zero.
  util::Status Resize(size_t len) {
    if (len > N) {
      return CapacityError(len);
    }
    if (len > size_) {
      std::memset(storage_.data() + size_, 0, len - size_);
    }
    size_ = len;
    return util::Status::OK;
  }

  const byte* data() const { return storage_.data(); }
  size_t size() const { return size_; }
  size_t capacity() const { return N; }
  bool empty() const { return size_ == 0; }

  byte operator[](size_t i) const { return storage_[i]; }

  // Write access to all |N| bytes of storage, regardless of size(). Writing
  // past size() does not change the value of the buffer.
  byte* mutable_storage() { return storage_.data(); }

 private:
  static util::Status CapacityError(size_t len) {
    std::ostringstream stream;
    stream << "length " << len << " exceeds capacity " << N;
    return util::Status(util::INVALID_ARGUMENT, stream.str());
  }

  std::array<byte, N> storage_;
  size_t size_;
};

}  // namespace crypto
}  // namespace authtag

#endif  // AUTHTAG_UTIL_CRYPTO_UTIL_BOUNDED_BYTES_H_
