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


#ifndef RASTERMASK_UTIL_STATUS_TESTUTIL_H_
#define RASTERMASK_UTIL_STATUS_TESTUTIL_H_

/// \file
/// GMock matchers for `absl::Status` and `Result<T>`.
///
/// Each matcher accepts either type; the status of a `Result` is obtained
/// through `rastermask::GetStatus`.

#include <string>

#include <gmock/gmock.h>
#include "absl/status/status.h"
#include "rastermask/util/result.h"
#include "rastermask/util/status.h"

namespace rastermask {

/// Matches an OK `absl::Status` or a `Result` holding a value.
MATCHER(IsOk, negation ? "is not OK" : "is OK") {
  const absl::Status& status = ::rastermask::GetStatus(arg);
  if (!status.ok()) *result_listener << "whose status is " << status;
  return status.ok();
}

/// Matches a `Result` holding a value that matches `value_matcher`.
MATCHER_P(IsOkAndHolds, value_matcher,
          negation ? "isn't OK or holds a non-matching value"
                   : "is OK and holds a matching value") {
  if (!arg.ok()) {
    *result_listener << "whose status is " << arg.status();
    return false;
  }
  return ::testing::ExplainMatchResult(value_matcher, *arg, result_listener);
}

/// Matches an error whose code is `code`.
MATCHER_P(MatchesStatus, code,
          std::string(negation ? "doesn't have" : "has") + " status code " +
              absl::StatusCodeToString(code)) {
  const absl::Status& status = ::rastermask::GetStatus(arg);
  *result_listener << "whose status is " << status;
  return status.code() == code;
}

/// Matches an error whose code is `code` and whose entire message matches
/// the regular expression `message_pattern`.
MATCHER_P2(MatchesStatus, code, message_pattern,
           std::string(negation ? "doesn't have" : "has") + " status code " +
               absl::StatusCodeToString(code) +
               " and a message matching " + std::string(message_pattern)) {
  const absl::Status& status = ::rastermask::GetStatus(arg);
  *result_listener << "whose status is " << status;
  return status.code() == code &&
         ::testing::Value(std::string(status.message()),
                          ::testing::MatchesRegex(message_pattern));
}

}  // namespace rastermask

#define RASTERMASK_EXPECT_OK(expr) EXPECT_THAT(expr, ::rastermask::IsOk())

#define RASTERMASK_ASSERT_OK(expr) ASSERT_THAT(expr, ::rastermask::IsOk())

/// Assigns the value of the `Result` `expr` to `decl`, or fails the current
/// test with its status.
#define RASTERMASK_ASSERT_OK_AND_ASSIGN(decl, expr)                      \
  RASTERMASK_ASSIGN_OR_RETURN(decl, expr,                                \
                              ([&] { FAIL() << #expr << ": " << _; })()) \
  /**/

#endif  // RASTERMASK_UTIL_STATUS_TESTUTIL_H_
