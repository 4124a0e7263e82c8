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

#ifndef AUTHTAG_UTIL_CRYPTO_UTIL_ERRORS_H_
#define AUTHTAG_UTIL_CRYPTO_UTIL_ERRORS_H_

#include <string>

namespace authtag {
namespace crypto {

// Returns a human-readable description of the most recent error recorded on
// this thread's OpenSSL error queue. Use this after one of the crypto
// functions in this directory has returned false.
std::string GetLastErrorMessage();

}  // namespace crypto
}  // namespace authtag

#endif  // AUTHTAG_UTIL_CRYPTO_UTIL_ERRORS_H_
