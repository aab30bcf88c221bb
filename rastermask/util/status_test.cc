// Copyright 2026 The RasterMask Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "rastermask/util/status.h"

#include <optional>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "rastermask/util/result.h"
#include "rastermask/util/status_testutil.h"

namespace {

using ::rastermask::IsOk;
using ::rastermask::IsOkAndHolds;
using ::rastermask::MatchesStatus;
using ::rastermask::MaybeAnnotateStatus;
using ::rastermask::Result;
using ::testing::Not;
using ::testing::Optional;

TEST(StatusTest, MaybeAnnotateStatus) {
  EXPECT_THAT(MaybeAnnotateStatus(absl::OkStatus(), "Annotated"), IsOk());
  EXPECT_THAT(
      MaybeAnnotateStatus(absl::UnknownError("Boo"), "Annotated"),
      MatchesStatus(absl::StatusCode::kUnknown, "Annotated: Boo"));
  EXPECT_THAT(MaybeAnnotateStatus(absl::UnknownError(""), "Annotated"),
              MatchesStatus(absl::StatusCode::kUnknown, "Annotated"));
  EXPECT_THAT(MaybeAnnotateStatus(absl::UnknownError("Boo"), ""),
              MatchesStatus(absl::StatusCode::kUnknown, "Boo"));
}

TEST(StatusTest, MaybeAnnotateStatusPreservesPayload) {
  absl::Status status = absl::DataLossError("Boo");
  status.SetPayload("url", absl::Cord("value"));
  absl::Status annotated = MaybeAnnotateStatus(status, "Annotated");
  EXPECT_THAT(annotated.GetPayload("url"), Optional(absl::Cord("value")));
}

absl::Status ReturnIfError(absl::Status status) {
  RASTERMASK_RETURN_IF_ERROR(status);
  return absl::OkStatus();
}

absl::Status ReturnIfErrorAnnotated(absl::Status status) {
  RASTERMASK_RETURN_IF_ERROR(status, MaybeAnnotateStatus(_, "Outer"));
  return absl::OkStatus();
}

TEST(StatusTest, ReturnIfError) {
  EXPECT_THAT(ReturnIfError(absl::OkStatus()), IsOk());
  EXPECT_THAT(ReturnIfError(absl::InternalError("Boo")),
              MatchesStatus(absl::StatusCode::kInternal, "Boo"));
  EXPECT_THAT(ReturnIfErrorAnnotated(absl::InternalError("Boo")),
              MatchesStatus(absl::StatusCode::kInternal, "Outer: Boo"));
}

Result<int> Twice(Result<int> value) {
  RASTERMASK_ASSIGN_OR_RETURN(int x, value,
                              MaybeAnnotateStatus(_, "Doubling"));
  return 2 * x;
}

TEST(ResultTest, AssignOrReturn) {
  EXPECT_THAT(Twice(3), IsOkAndHolds(6));
  EXPECT_THAT(Twice(absl::OutOfRangeError("Boo")),
              MatchesStatus(absl::StatusCode::kOutOfRange, "Doubling: Boo"));
}

TEST(StatusTestutilTest, IsOk) {
  EXPECT_THAT(absl::OkStatus(), IsOk());
  EXPECT_THAT(Result<int>(1), IsOk());
  EXPECT_THAT(absl::InternalError("Boo"), Not(IsOk()));
  EXPECT_THAT(Result<int>(absl::InternalError("Boo")), Not(IsOk()));
}

TEST(StatusTestutilTest, IsOkAndHolds) {
  EXPECT_THAT(Result<int>(3), IsOkAndHolds(3));
  EXPECT_THAT(Result<int>(3), IsOkAndHolds(::testing::Gt(2)));
  EXPECT_THAT(Result<int>(3), Not(IsOkAndHolds(4)));
  EXPECT_THAT(Result<int>(absl::InternalError("Boo")), Not(IsOkAndHolds(3)));
}

TEST(StatusTestutilTest, MatchesStatusOnResult) {
  EXPECT_THAT(Result<int>(absl::NotFoundError("Missing /x/y.tif")),
              MatchesStatus(absl::StatusCode::kNotFound, "Missing .*[.]tif"));
  EXPECT_THAT(Result<int>(3), Not(MatchesStatus(absl::StatusCode::kNotFound)));
}

TEST(StatusTestutilTest, MatchesStatus) {
  EXPECT_THAT(absl::InvalidArgumentError("Value 42 rejected"),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Value [0-9]+ rejected"));
  EXPECT_THAT(absl::InvalidArgumentError("Value 42 rejected"),
              Not(MatchesStatus(absl::StatusCode::kInvalidArgument,
                                "Value")));
  EXPECT_THAT(absl::InvalidArgumentError("x"),
              Not(MatchesStatus(absl::StatusCode::kNotFound)));
}

}  // namespace
