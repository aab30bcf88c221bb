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

#include <optional>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace rastermask {
namespace {

constexpr std::string_view kMissingInput = "missing_input";
constexpr std::string_view kEmptySource = "empty_source";

absl::Status WithErrorKind(absl::Status status, std::string_view kind) {
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(kind));
  return status;
}

bool HasErrorKind(const absl::Status& status, std::string_view kind) {
  if (status.ok()) return false;
  std::optional<absl::Cord> payload = status.GetPayload(kErrorKindPayloadUrl);
  return payload.has_value() && *payload == kind;
}

}  // namespace

absl::Status MissingInputError(std::string_view path) {
  return WithErrorKind(
      absl::NotFoundError(absl::StrCat("Input not found: ", path)),
      kMissingInput);
}

absl::Status EmptySourceError(std::string_view message) {
  return WithErrorKind(absl::FailedPreconditionError(message), kEmptySource);
}

bool IsMissingInputError(const absl::Status& status) {
  return HasErrorKind(status, kMissingInput);
}

bool IsEmptySourceError(const absl::Status& status) {
  return HasErrorKind(status, kEmptySource);
}

}  // namespace rastermask
