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

#include "rastermask/mask_options.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/flags/marshalling.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include <nlohmann/json.hpp>
#include "rastermask/index.h"
#include "rastermask/util/result.h"
#include "rastermask/util/status.h"
#include "rastermask/window.h"

namespace rastermask {
namespace {

using ::nlohmann::json;

absl::Status MemberError(std::string_view member, std::string_view message) {
  return absl::InvalidArgumentError(
      absl::StrCat("Error parsing object member \"", member, "\": ", message));
}

Result<double> ParseNumber(std::string_view member, const json& j) {
  if (!j.is_number()) {
    return MemberError(member,
                       absl::StrCat("Expected number, but received: ",
                                    j.dump()));
  }
  return j.get<double>();
}

Result<Index> ParseInteger(std::string_view member, const json& j) {
  if (!j.is_number_integer()) {
    return MemberError(member,
                       absl::StrCat("Expected integer, but received: ",
                                    j.dump()));
  }
  return j.get<Index>();
}

Result<Shape> ParseShape(std::string_view member, const json& j) {
  if (!j.is_array() || j.size() != 2) {
    return MemberError(member,
                       absl::StrCat("Expected array of 2 integers, but "
                                    "received: ",
                                    j.dump()));
  }
  Shape shape;
  RASTERMASK_ASSIGN_OR_RETURN(shape.rows, ParseInteger(member, j[0]));
  RASTERMASK_ASSIGN_OR_RETURN(shape.cols, ParseInteger(member, j[1]));
  return shape;
}

}  // namespace

absl::Status MaskOptions::Validate() const {
  if (!std::isfinite(threshold)) {
    return absl::InvalidArgumentError(
        absl::StrCat("threshold must be finite, but received: ", threshold));
  }
  if (downsample_factor && *downsample_factor < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("downsample_factor must be non-negative, but received: ",
                     *downsample_factor));
  }
  if (std::find(std::begin(kSupportedCompressions),
                std::end(kSupportedCompressions),
                compression) == std::end(kSupportedCompressions)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unsupported compression \"", compression,
                     "\"; expected one of: ",
                     absl::StrJoin(kSupportedCompressions, ", ")));
  }
  if (tiled && (tile_shape.rows <= 0 || tile_shape.cols <= 0 ||
                tile_shape.rows % 16 != 0 || tile_shape.cols % 16 != 0)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "tile_shape must be positive multiples of 16, but received: [",
        tile_shape.rows, ", ", tile_shape.cols, "]"));
  }
  return absl::OkStatus();
}

Result<MaskOptions> MaskOptions::FromJson(const json& j) {
  if (!j.is_object()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Expected object, but received: ", j.dump()));
  }
  MaskOptions options;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& member = it.key();
    const json& value = it.value();
    if (member == "threshold") {
      RASTERMASK_ASSIGN_OR_RETURN(options.threshold,
                                  ParseNumber(member, value));
    } else if (member == "downsample_factor") {
      if (!value.is_null()) {
        RASTERMASK_ASSIGN_OR_RETURN(options.downsample_factor,
                                    ParseInteger(member, value));
      }
    } else if (member == "compression") {
      if (!value.is_string()) {
        return MemberError(member, absl::StrCat("Expected string, but "
                                                "received: ",
                                                value.dump()));
      }
      options.compression = absl::AsciiStrToUpper(value.get<std::string>());
    } else if (member == "tiled") {
      if (!value.is_boolean()) {
        return MemberError(member, absl::StrCat("Expected boolean, but "
                                                "received: ",
                                                value.dump()));
      }
      options.tiled = value.get<bool>();
    } else if (member == "tile_shape") {
      RASTERMASK_ASSIGN_OR_RETURN(options.tile_shape,
                                  ParseShape(member, value));
    } else {
      return absl::InvalidArgumentError(
          absl::StrCat("Object includes extra members: \"", member, "\""));
    }
  }
  RASTERMASK_RETURN_IF_ERROR(options.Validate());
  return options;
}

json MaskOptions::ToJson() const {
  json j = json::object();
  j["threshold"] = threshold;
  if (downsample_factor) j["downsample_factor"] = *downsample_factor;
  j["compression"] = compression;
  j["tiled"] = tiled;
  j["tile_shape"] = {tile_shape.rows, tile_shape.cols};
  return j;
}

bool operator==(const MaskOptions& a, const MaskOptions& b) {
  return a.threshold == b.threshold &&
         a.downsample_factor == b.downsample_factor &&
         a.compression == b.compression && a.tiled == b.tiled &&
         a.tile_shape == b.tile_shape;
}

std::ostream& operator<<(std::ostream& os, const MaskOptions& o) {
  return os << o.ToJson().dump();
}

bool AbslParseFlag(std::string_view in, MaskOptions* out,
                   std::string* error) {
  if (in.empty()) {
    *out = MaskOptions{};
    return true;
  }
  json j = json::parse(std::string(in), nullptr, false);
  if (j.is_discarded()) {
    *error = "Failed to parse JSON";
    return false;
  }
  auto options = MaskOptions::FromJson(j);
  if (!options.ok()) {
    *error = std::string(options.status().message());
    return false;
  }
  *out = *std::move(options);
  return true;
}

std::string AbslUnparseFlag(const MaskOptions& options) {
  return absl::UnparseFlag(options.ToJson().dump());
}

}  // namespace rastermask
