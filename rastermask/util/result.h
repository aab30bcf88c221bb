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

#ifndef RASTERMASK_UTIL_RESULT_H_
#define RASTERMASK_UTIL_RESULT_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "rastermask/util/status.h"

namespace rastermask {

/// `Result<T>` holds either a value of type `T` or an error `absl::Status`.
///
/// \ingroup error handling
template <typename T>
using Result = absl::StatusOr<T>;

template <typename T>
constexpr inline bool IsResult = false;

template <typename T>
constexpr inline bool IsResult<absl::StatusOr<T>> = true;

/// Returns the error status of `result`, or `absl::OkStatus()`.
///
/// \relates Result
template <typename T>
inline const absl::Status& GetStatus(const Result<T>& result) {
  return result.status();
}
template <typename T>
inline absl::Status GetStatus(Result<T>&& result) {
  return std::move(result).status();
}

}  // namespace rastermask

/// Convenience macro for propagating errors when calling a function that
/// returns a `rastermask::Result`.
///
/// Example::
///
///     Result<int> GetSomeResult();
///
///     absl::Status Bar() {
///       RASTERMASK_ASSIGN_OR_RETURN(int x, GetSomeResult());
///       // More code
///       return absl::OkStatus();
///     }
///
/// An optional third argument specifies the return expression in the case of
/// an error.  A variable ``_`` bound to the error status is in scope within
/// this expression::
///
///     RASTERMASK_ASSIGN_OR_RETURN(int x, GetSomeResult(),
///                                 MaybeAnnotateStatus(_, "In Bar"));
///
/// \ingroup error handling
#define RASTERMASK_ASSIGN_OR_RETURN(decl, ...)                          \
  RASTERMASK_PP_EXPAND(RASTERMASK_INTERNAL_ASSIGN_OR_RETURN_IMPL(       \
      RASTERMASK_PP_CAT(rastermask_assign_or_return_, __LINE__), decl, \
      __VA_ARGS__, _))                                                  \
  /**/

#define RASTERMASK_INTERNAL_ASSIGN_OR_RETURN_IMPL(temp, decl, expr,        \
                                                  error_expr, ...)         \
  auto temp = (expr);                                                      \
  static_assert(::rastermask::IsResult<decltype(temp)>,                    \
                "RASTERMASK_ASSIGN_OR_RETURN requires a Result value.");   \
  if (ABSL_PREDICT_FALSE(!temp.ok())) {                                    \
    [[maybe_unused]] const ::absl::Status& _ = temp.status();              \
    return error_expr;                                                     \
  }                                                                        \
  decl = std::move(*temp);

#endif  // RASTERMASK_UTIL_RESULT_H_
