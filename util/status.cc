// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "util/status.h"

#include <sstream>

namespace authtag {
namespace util {

const Status& Status::OK = Status();

std::string Status::ToString() const {
  if (ok()) {
    return "OK";
  }
  std::ostringstream stream;
  stream << code_ << ": " << error_message_;
  if (!error_details_.empty()) {
    stream << " (" << error_details_ << ")";
  }
  return stream.str();
}

}  // namespace util
}  // namespace authtag
