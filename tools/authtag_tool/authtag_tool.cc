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

#include "tools/authtag_tool/authtag_tool.h"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "gflags/gflags.h"
#include "logging.h"
#include "util/crypto_util/base64.h"
#include "util/crypto_util/errors.h"
#include "util/crypto_util/hex.h"
#include "util/file_util.h"

// Exactly one of the three key flags must be given. An empty key is given
// with --key= .
DEFINE_string(key, "", "The secret key, as text.");
DEFINE_string(key_hex, "", "The secret key, hex encoded.");
DEFINE_string(key_file, "",
              "Path to a file whose entire contents are the secret key.");

// At most one of the two message flags may be given. Without either the
// message is empty.
DEFINE_string(message, "", "The message to authenticate, as text.");
DEFINE_string(message_file, "",
              "Path to a file whose entire contents are the message.");

DEFINE_string(output, "hex",
              "How to print the tag: 'hex', 'base64' or 'bytes'.");
DEFINE_string(verify, "",
              "A hex encoded tag. If given, the computed tag is compared "
              "against it instead of being printed.");
DEFINE_uint32(generate_key, 0,
              "If non-zero, print this many random bytes as a hex key and "
              "exit. All other flags are ignored.");

namespace authtag {

using crypto::hmac::Tag;
using util::FileUtil;
using util::Status;

const size_t AuthtagTool::kMaxKeySize;
const size_t AuthtagTool::kMaxMessageSize;

namespace {

// Returns true if the flag |name| was set on the command line.
bool FlagWasSet(const char* name) {
  return !google::GetCommandLineFlagInfoOrDie(name).is_default;
}

}  // namespace

AuthtagTool::AuthtagTool(std::ostream* ostream,
                         std::unique_ptr<crypto::Random> random)
    : ostream_(ostream),
      random_(std::move(random)),
      key_(new Key()),
      message_(new Message()),
      key_set_(false),
      output_format_(kHex),
      verify_(false),
      generate_key_bytes_(0) {
  CHECK(ostream_);
  CHECK(random_);
}

Status AuthtagTool::ConfigureFromFlags() {
  if (FLAGS_generate_key > 0) {
    set_generate_key_bytes(FLAGS_generate_key);
    return Status::OK;
  }

  int num_key_flags = FlagWasSet("key") + FlagWasSet("key_hex") +
                      FlagWasSet("key_file");
  if (num_key_flags != 1) {
    return Status(util::INVALID_ARGUMENT,
                  "Exactly one of -key, -key_hex or -key_file must be given");
  }
  if (FlagWasSet("key")) {
    RETURN_IF_ERROR(SetKey(FLAGS_key));
  } else if (FlagWasSet("key_hex")) {
    RETURN_IF_ERROR(SetKeyHex(FLAGS_key_hex));
  } else {
    RETURN_IF_ERROR(SetKeyFile(FLAGS_key_file));
  }

  if (FlagWasSet("message") && FlagWasSet("message_file")) {
    return Status(util::INVALID_ARGUMENT,
                  "At most one of -message or -message_file may be given");
  }
  if (FlagWasSet("message_file")) {
    RETURN_IF_ERROR(SetMessageFile(FLAGS_message_file));
  } else {
    RETURN_IF_ERROR(SetMessage(FLAGS_message));
  }

  RETURN_IF_ERROR(SetOutputFormat(FLAGS_output));
  if (FlagWasSet("verify")) {
    set_expected_tag_hex(FLAGS_verify);
  }
  return Status::OK;
}

Status AuthtagTool::SetKey(const std::string& key) {
  RETURN_IF_ERROR(key_->Assign(key));
  key_set_ = true;
  return Status::OK;
}

Status AuthtagTool::SetKeyHex(const std::string& key_hex) {
  std::vector<crypto::byte> bytes;
  if (!crypto::HexToBytes(key_hex, &bytes)) {
    return Status(util::INVALID_ARGUMENT, "Key is not valid hex");
  }
  RETURN_IF_ERROR(key_->Assign(bytes.data(), bytes.size()));
  key_set_ = true;
  return Status::OK;
}

Status AuthtagTool::SetKeyFile(const std::string& file_path) {
  std::string contents;
  RETURN_IF_ERROR(
      FileUtil::ReadBinaryFile(file_path, kMaxKeySize, &contents));
  return SetKey(contents);
}

Status AuthtagTool::SetMessage(const std::string& message) {
  return message_->Assign(message);
}

Status AuthtagTool::SetMessageFile(const std::string& file_path) {
  std::string contents;
  RETURN_IF_ERROR(
      FileUtil::ReadBinaryFile(file_path, kMaxMessageSize, &contents));
  return SetMessage(contents);
}

Status AuthtagTool::SetOutputFormat(const std::string& format) {
  if (format == "hex") {
    output_format_ = kHex;
  } else if (format == "base64") {
    output_format_ = kBase64;
  } else if (format == "bytes") {
    output_format_ = kBytes;
  } else {
    return Status(util::INVALID_ARGUMENT, "Unrecognized output format",
                  format);
  }
  return Status::OK;
}

int AuthtagTool::Run() {
  if (generate_key_bytes_ > 0) {
    return GenerateKey();
  }
  if (!key_set_) {
    LOG(ERROR) << "No key was given.";
    return kUsageError;
  }
  if (verify_) {
    return Verify();
  }
  return ComputeAndPrint();
}

// static
std::string AuthtagTool::FormatTag(const Tag& tag, OutputFormat format) {
  switch (format) {
    case kHex:
      return crypto::BytesToHex(tag.data(), tag.size());

    case kBase64: {
      std::string encoded;
      CHECK(crypto::Base64Encode(tag.data(), tag.size(), &encoded));
      return encoded;
    }

    case kBytes: {
      std::ostringstream stream;
      stream << "[";
      for (size_t i = 0; i < tag.size(); i++) {
        if (i > 0) {
          stream << ",";
        }
        stream << static_cast<int>(tag[i]);
      }
      stream << "]";
      return stream.str();
    }
  }
  LOG(FATAL) << "Unexpected output format " << format;
  return "";
}

int AuthtagTool::GenerateKey() {
  if (generate_key_bytes_ > kMaxKeySize) {
    LOG(ERROR) << "Cannot generate a key of " << generate_key_bytes_
               << " bytes; the limit is " << kMaxKeySize;
    return kUsageError;
  }
  std::vector<crypto::byte> key(generate_key_bytes_);
  if (!random_->RandomBytes(key.data(), key.size())) {
    LOG(ERROR) << "Generating a random key failed: "
               << crypto::GetLastErrorMessage();
    return kCryptoError;
  }
  *ostream_ << crypto::BytesToHex(key.data(), key.size()) << std::endl;
  return kSuccess;
}

int AuthtagTool::ComputeAndPrint() {
  Tag tag;
  if (!crypto::hmac::HmacSha256(*key_, *message_, &tag)) {
    LOG(ERROR) << "Computing the tag failed: "
               << crypto::GetLastErrorMessage();
    return kCryptoError;
  }
  VLOG(1) << "Computed tag over " << message_->size() << " message bytes "
          << "with a " << key_->size() << " byte key";
  *ostream_ << FormatTag(tag, output_format_) << std::endl;
  return kSuccess;
}

int AuthtagTool::Verify() {
  std::vector<crypto::byte> expected;
  if (!crypto::HexToBytes(expected_tag_hex_, &expected)) {
    LOG(ERROR) << "The tag given to -verify is not valid hex.";
    return kUsageError;
  }
  if (expected.size() != crypto::hmac::TAG_SIZE) {
    LOG(ERROR) << "The tag given to -verify has " << expected.size()
               << " bytes; expected " << crypto::hmac::TAG_SIZE;
    return kUsageError;
  }
  if (!crypto::hmac::VerifyTag(key_->data(), key_->size(), message_->data(),
                               message_->size(), expected.data(),
                               expected.size())) {
    *ostream_ << "MISMATCH" << std::endl;
    return kMismatch;
  }
  *ostream_ << "OK" << std::endl;
  return kSuccess;
}

}  // namespace authtag
