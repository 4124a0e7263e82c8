// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef AUTHTAG_UTIL_STATUS_CODES_H_
#define AUTHTAG_UTIL_STATUS_CODES_H_

namespace authtag {
namespace util {

// The subset of the canonical error space used by authtag.
enum StatusCode {
  OK = 0,
  INVALID_ARGUMENT = 3,
  NOT_FOUND = 5,
  OUT_OF_RANGE = 11,
  INTERNAL = 13,
};

}  // namespace util
}  // namespace authtag

#endif  // AUTHTAG_UTIL_STATUS_CODES_H_
