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

#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_join.h"

namespace rastermask {

absl::Status MaybeAnnotateStatus(absl::Status source,
                                 std::string_view message) {
  if (source.ok()) return source;

  size_t index = 0;
  std::array<std::string_view, 2> to_join = {};
  if (!message.empty()) {
    to_join[index++] = message;
  }
  if (!source.message().empty()) {
    to_join[index++] = source.message();
  }

  std::string joined =
      absl::StrJoin(to_join.begin(), to_join.begin() + index, ": ");
  absl::Status dest(source.code(), joined);

  // Preserve the payloads.
  source.ForEachPayload([&](std::string_view name, const absl::Cord& value) {
    dest.SetPayload(name, value);
  });
  return dest;
}

}  // namespace rastermask
