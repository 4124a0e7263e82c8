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

#include "util/file_util.h"

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include "logging.h"

namespace authtag {
namespace util {

Status FileUtil::ReadBinaryFile(const std::string& file_path,
                                size_t max_size, std::string* file_contents) {
  CHECK(file_contents);
  if (file_path.empty()) {
    return Status(INVALID_ARGUMENT, "Empty file path");
  }
  std::ifstream stream(file_path, std::ifstream::in | std::ifstream::binary);
  if (!stream.good()) {
    VLOG(1) << "Unable to open file at " << file_path;
    return Status(NOT_FOUND, "Unable to open file", file_path);
  }
  stream.seekg(0, std::ios::end);
  auto file_size = stream.tellg();
  if (!stream.good() || file_size < 0) {
    VLOG(1) << "Error reading file at " << file_path;
    return Status(INTERNAL, "Error reading file", file_path);
  }
  // Don't try to read a file that's too big.
  if (static_cast<size_t>(file_size) > max_size) {
    std::ostringstream details;
    details << file_path << " has " << file_size << " bytes, limit is "
            << max_size;
    VLOG(1) << "File too large: " << details.str();
    return Status(OUT_OF_RANGE, "File too large", details.str());
  }

  stream.seekg(0, std::ios::beg);
  if (!stream.good()) {
    VLOG(1) << "Error reading file at " << file_path;
    return Status(INTERNAL, "Error reading file", file_path);
  }
  std::string contents;
  contents.reserve(static_cast<size_t>(file_size));
  contents.assign((std::istreambuf_iterator<char>(stream)),
                  std::istreambuf_iterator<char>());
  if (stream.bad()) {
    VLOG(1) << "Error reading file at " << file_path;
    return Status(INTERNAL, "Error reading file", file_path);
  }
  file_contents->swap(contents);
  VLOG(3) << "Successfully read file at " << file_path;
  return Status::OK;
}

}  // namespace util
}  // namespace authtag
