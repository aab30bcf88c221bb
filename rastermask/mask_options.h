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

#ifndef RASTERMASK_MASK_OPTIONS_H_
#define RASTERMASK_MASK_OPTIONS_H_

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "rastermask/index.h"
#include "rastermask/util/result.h"
#include "rastermask/window.h"

namespace rastermask {

/// Parameters of a mask run.
///
/// JSON representation::
///
///     {
///       "threshold": 0.4,
///       "downsample_factor": 4,
///       "compression": "LZW",
///       "tiled": true,
///       "tile_shape": [256, 256]
///     }
///
/// All members are optional.  Unknown members are rejected.
struct MaskOptions {
  /// Threshold as a fraction of the full data range, e.g. `0.4` for 40%.
  double threshold = 0.4;

  /// Integer factor by which the output is downsampled.  Absent, 0, and 1
  /// all disable downsampling.
  std::optional<Index> downsample_factor;

  /// Output compression scheme; one of `kSupportedCompressions`.
  std::string compression = "LZW";

  /// Whether the output is stored in tiles rather than strips.
  bool tiled = true;

  /// Output tile shape, `[rows, cols]`.
  Shape tile_shape{256, 256};

  /// Returns the effective downsample factor, `>= 1`.
  Index effective_downsample_factor() const {
    return downsample_factor.value_or(1) > 1 ? *downsample_factor : 1;
  }

  /// Checks that all members are within range.
  absl::Status Validate() const;

  /// Parses and validates options from `j`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `j` is not an object, has
  ///     an unknown member, a member of the wrong type, or an invalid value.
  static Result<MaskOptions> FromJson(const ::nlohmann::json& j);

  ::nlohmann::json ToJson() const;

  friend bool operator==(const MaskOptions& a, const MaskOptions& b);
  friend bool operator!=(const MaskOptions& a, const MaskOptions& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const MaskOptions& o);

  /// Enables `MaskOptions` as an `ABSL_FLAG` type, given as JSON text.  The
  /// empty string denotes the default options.
  friend bool AbslParseFlag(std::string_view in, MaskOptions* out,
                            std::string* error);
  friend std::string AbslUnparseFlag(const MaskOptions& options);
};

/// Compression schemes accepted by `MaskOptions::compression`.
inline constexpr std::string_view kSupportedCompressions[] = {
    "NONE", "LZW", "DEFLATE", "ZSTD", "LZMA", "PACKBITS",
};

}  // namespace rastermask

#endif  // RASTERMASK_MASK_OPTIONS_H_
