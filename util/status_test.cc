// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "util/status.h"

#include "gtest/gtest.h"

namespace authtag {
namespace util {

namespace {

Status FailIfNegative(int n) {
  if (n < 0) {
    return Status(INVALID_ARGUMENT, "negative", "n was below zero");
  }
  return Status::OK;
}

Status CheckBoth(int a, int b) {
  RETURN_IF_ERROR(FailIfNegative(a));
  RETURN_IF_ERROR(FailIfNegative(b));
  return Status::OK;
}

}  // namespace

TEST(StatusTest, DefaultIsOk) {
  Status status;
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(OK, status.error_code());
  EXPECT_EQ("OK", status.ToString());
}

TEST(StatusTest, ErrorCarriesMessageAndDetails) {
  Status status = FailIfNegative(-1);
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(INVALID_ARGUMENT, status.error_code());
  EXPECT_EQ("negative", status.error_message());
  EXPECT_EQ("n was below zero", status.error_details());
  EXPECT_EQ("3: negative (n was below zero)", status.ToString());
}

TEST(StatusTest, ReturnIfError) {
  EXPECT_TRUE(CheckBoth(1, 2).ok());
  EXPECT_EQ(INVALID_ARGUMENT, CheckBoth(1, -2).error_code());
  EXPECT_EQ(INVALID_ARGUMENT, CheckBoth(-1, 2).error_code());
}

}  // namespace util
}  // namespace authtag
