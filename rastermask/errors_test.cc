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

#include "rastermask/errors.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "rastermask/util/status.h"
#include "rastermask/util/status_testutil.h"

namespace {

using ::rastermask::EmptySourceError;
using ::rastermask::IsEmptySourceError;
using ::rastermask::IsMissingInputError;
using ::rastermask::MatchesStatus;
using ::rastermask::MaybeAnnotateStatus;
using ::rastermask::MissingInputError;

TEST(ErrorsTest, MissingInput) {
  absl::Status status = MissingInputError("/data/scene.tif");
  EXPECT_THAT(status, MatchesStatus(absl::StatusCode::kNotFound,
                                    "Input not found: /data/scene.tif"));
  EXPECT_TRUE(IsMissingInputError(status));
  EXPECT_FALSE(IsEmptySourceError(status));
}

TEST(ErrorsTest, EmptySource) {
  absl::Status status = EmptySourceError("No blocks");
  EXPECT_THAT(status, MatchesStatus(absl::StatusCode::kFailedPrecondition,
                                    "No blocks"));
  EXPECT_TRUE(IsEmptySourceError(status));
  EXPECT_FALSE(IsMissingInputError(status));
}

TEST(ErrorsTest, KindSurvivesAnnotation) {
  absl::Status status =
      MaybeAnnotateStatus(EmptySourceError("No blocks"), "Estimating scale");
  EXPECT_TRUE(IsEmptySourceError(status));
}

TEST(ErrorsTest, OtherErrorsHaveNoKind) {
  EXPECT_FALSE(IsMissingInputError(absl::OkStatus()));
  EXPECT_FALSE(IsMissingInputError(absl::NotFoundError("Input not found: x")));
  EXPECT_FALSE(IsEmptySourceError(absl::FailedPreconditionError("x")));
}

}  // namespace
