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

// A command-line front end for the authtag HMAC-SHA256 library.
//
// The tool computes the HMAC-SHA256 tag of a message under a secret key and
// prints it, verifies a tag given on the command line, or generates a random
// key. The key and the message may come from flags or from files.
//
// Exit status:
// - 0: success, or the tag given to --verify matched.
// - 1: the tag given to --verify did not match.
// - 2: a usage or input error, such as a missing key or malformed hex.
// - 3: the crypto backend failed.

#ifndef AUTHTAG_TOOLS_AUTHTAG_TOOL_AUTHTAG_TOOL_H_
#define AUTHTAG_TOOLS_AUTHTAG_TOOL_AUTHTAG_TOOL_H_

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>

#include "util/crypto_util/bounded_bytes.h"
#include "util/crypto_util/mac.h"
#include "util/crypto_util/random.h"
#include "util/status.h"

namespace authtag {

class AuthtagTool {
 public:
  // The largest key the tool accepts, in bytes.
  static const size_t kMaxKeySize = 1024;

  // The largest message the tool accepts, in bytes.
  static const size_t kMaxMessageSize = 1024 * 1024;

  enum ExitCode {
    kSuccess = 0,
    kMismatch = 1,
    kUsageError = 2,
    kCryptoError = 3
  };

  // How a computed tag is printed.
  enum OutputFormat {
    // Lower-case hex, 64 characters.
    kHex = 0,

    // Standard base64 with padding.
    kBase64 = 1,

    // Comma-separated decimal byte values in brackets, e.g. [243,14,...].
    kBytes = 2
  };

  typedef crypto::BoundedBytes<kMaxKeySize> Key;
  typedef crypto::BoundedBytes<kMaxMessageSize> Message;

  // Output is written to |ostream|. |random| is used by --generate_key.
  AuthtagTool(std::ostream* ostream, std::unique_ptr<crypto::Random> random);

  // Reads the flags documented in authtag_tool.cc and applies them to this
  // instance. Returns INVALID_ARGUMENT for an inconsistent flag combination,
  // or the error from reading a key or message file.
  util::Status ConfigureFromFlags();

  util::Status SetKey(const std::string& key);
  util::Status SetKeyHex(const std::string& key_hex);
  util::Status SetKeyFile(const std::string& file_path);

  util::Status SetMessage(const std::string& message);
  util::Status SetMessageFile(const std::string& file_path);

  // |format| must be one of "hex", "base64" or "bytes".
  util::Status SetOutputFormat(const std::string& format);

  // Makes Run() compare the computed tag against |expected_tag_hex| instead
  // of printing it.
  void set_expected_tag_hex(const std::string& expected_tag_hex) {
    expected_tag_hex_ = expected_tag_hex;
    verify_ = true;
  }

  // Makes Run() print |num_bytes| random bytes as hex instead of computing a
  // tag. Zero disables key generation.
  void set_generate_key_bytes(size_t num_bytes) {
    generate_key_bytes_ = num_bytes;
  }

  // Performs the configured action and returns an ExitCode.
  int Run();

  // Formats |tag| according to |format|.
  static std::string FormatTag(const crypto::hmac::Tag& tag,
                               OutputFormat format);

 private:
  int GenerateKey();
  int ComputeAndPrint();
  int Verify();

  std::ostream* ostream_;
  std::unique_ptr<crypto::Random> random_;
  std::unique_ptr<Key> key_;
  std::unique_ptr<Message> message_;
  bool key_set_;
  OutputFormat output_format_;
  bool verify_;
  std::string expected_tag_hex_;
  size_t generate_key_bytes_;
};

}  // namespace authtag

#endif  // AUTHTAG_TOOLS_AUTHTAG_TOOL_AUTHTAG_TOOL_H_
