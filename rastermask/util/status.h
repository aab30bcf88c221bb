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

#ifndef RASTERMASK_UTIL_STATUS_H_
#define RASTERMASK_UTIL_STATUS_H_

#include <string_view>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "rastermask/internal/preprocessor.h"

namespace rastermask {

/// If `source` is not `absl::StatusCode::kOk`, returns a status with the same
/// code and payloads whose message is `message` prepended to the original
/// message.  Otherwise returns `source` unchanged.
///
/// \ingroup error handling
absl::Status MaybeAnnotateStatus(absl::Status source,
                                 std::string_view message);

/// Overload for the case of a bare absl::Status argument.
///
/// \returns `status`
/// \relates Result
inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}
inline absl::Status GetStatus(absl::Status&& status) {
  return std::move(status);
}

}  // namespace rastermask

/// Causes the containing function to return the specified `absl::Status` value
/// if it is an error status.
///
/// Example::
///
///     absl::Status GetSomeStatus();
///
///     absl::Status Bar() {
///       RASTERMASK_RETURN_IF_ERROR(GetSomeStatus());
///       // More code
///       return absl::OkStatus();
///     }
///
/// An optional second argument specifies the return expression in the case of
/// an error.  A variable ``_`` is bound to the value of the first expression
/// is in scope within this expression.  For example::
///
///     RASTERMASK_RETURN_IF_ERROR(GetSomeStatus(),
///                                MaybeAnnotateStatus(_, "In Bar"));
///
/// .. warning::
///
///    The `absl::Status` expression must not contain any commas outside
///    parentheses (such as in a template argument list); if necessary, to
///    ensure this, it may be wrapped in additional parentheses as needed.
///
/// \ingroup error handling
#define RASTERMASK_RETURN_IF_ERROR(...) \
  RASTERMASK_PP_EXPAND(                 \
      RASTERMASK_INTERNAL_RETURN_IF_ERROR_IMPL(__VA_ARGS__, _))

#define RASTERMASK_INTERNAL_RETURN_IF_ERROR_IMPL(expr, error_expr, ...) \
  for (absl::Status _ = ::rastermask::GetStatus(expr);                  \
       ABSL_PREDICT_FALSE(!_.ok());)                                    \
  return error_expr /**/

#endif  // RASTERMASK_UTIL_STATUS_H_
