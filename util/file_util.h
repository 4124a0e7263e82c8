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

#ifndef AUTHTAG_UTIL_FILE_UTIL_H_
#define AUTHTAG_UTIL_FILE_UTIL_H_

#include <cstddef>
#include <string>

#include "util/status.h"

namespace authtag {
namespace util {

// FileUtil provides utilities for reading key and message files.
class FileUtil {
 public:
  // Reads the file at |file_path| in binary mode and writes its contents into
  // |*file_contents|. An empty file is allowed.
  //
  // Returns NOT_FOUND if the file cannot be opened, OUT_OF_RANGE if it holds
  // more than |max_size| bytes, and INTERNAL on a read error. Nothing is
  // written to |*file_contents| unless the whole file was read.
  static Status ReadBinaryFile(const std::string& file_path, size_t max_size,
                               std::string* file_contents);
};

}  // namespace util
}  // namespace authtag

#endif  // AUTHTAG_UTIL_FILE_UTIL_H_
