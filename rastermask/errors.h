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

#ifndef RASTERMASK_ERRORS_H_
#define RASTERMASK_ERRORS_H_

/// \file
/// Error kinds distinguished by the mask pipeline and its command-line tool.
///
/// Errors are `absl::Status` values.  The kinds that callers must tell apart
/// carry a payload under `kErrorKindPayloadUrl` in addition to their status
/// code, so that they survive `MaybeAnnotateStatus`.

#include <string_view>

#include "absl/status/status.h"

namespace rastermask {

/// Payload type URL identifying the error kind.
inline constexpr std::string_view kErrorKindPayloadUrl =
    "rastermask/error_kind";

/// Returns an `absl::StatusCode::kNotFound` error for an input raster path
/// that does not exist.
absl::Status MissingInputError(std::string_view path);

/// Returns an `absl::StatusCode::kFailedPrecondition` error for a source grid
/// that has no block windows.
absl::Status EmptySourceError(std::string_view message);

bool IsMissingInputError(const absl::Status& status);
bool IsEmptySourceError(const absl::Status& status);

}  // namespace rastermask

#endif  // RASTERMASK_ERRORS_H_
