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

#include <iostream>
#include <memory>
#include <utility>

#include "gflags/gflags.h"
#include "logging.h"
#include "tools/authtag_tool/authtag_tool.h"

int main(int argc, char* argv[]) {
  google::SetUsageMessage(
      "Computes or verifies an HMAC-SHA256 tag.\n"
      "  authtag_tool -key=<text> -message=<text>\n"
      "  authtag_tool -key_hex=<hex> -message_file=<path> -output=base64\n"
      "  authtag_tool -key_file=<path> -message=<text> -verify=<hex tag>\n"
      "  authtag_tool -generate_key=32");
  google::ParseCommandLineFlags(&argc, &argv, true);
  INIT_LOGGING(argv[0]);

  std::unique_ptr<authtag::crypto::Random> random(
      new authtag::crypto::Random());
  authtag::AuthtagTool tool(&std::cout, std::move(random));
  authtag::util::Status status = tool.ConfigureFromFlags();
  if (!status.ok()) {
    LOG(ERROR) << status.ToString();
    return authtag::AuthtagTool::kUsageError;
  }
  return tool.Run();
}
