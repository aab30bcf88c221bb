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

#ifndef RASTERMASK_GEO_TRANSFORM_H_
#define RASTERMASK_GEO_TRANSFORM_H_

#include <array>
#include <iosfwd>

#include "rastermask/index.h"

namespace rastermask {

/// Affine map from pixel/line coordinates to georeferenced coordinates, in
/// GDAL coefficient order:
///
///     x = c[0] + col * c[1] + row * c[2]
///     y = c[3] + col * c[4] + row * c[5]
struct GeoTransform {
  std::array<double, 6> coefficients = {0, 1, 0, 0, 0, 1};

  /// Returns the georeferenced coordinates of the pixel corner `(row, col)`.
  std::array<double, 2> Apply(double row, double col) const {
    const auto& c = coefficients;
    return {c[0] + col * c[1] + row * c[2], c[3] + col * c[4] + row * c[5]};
  }

  friend bool operator==(const GeoTransform& a, const GeoTransform& b) {
    return a.coefficients == b.coefficients;
  }
  friend bool operator!=(const GeoTransform& a, const GeoTransform& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const GeoTransform& t);
};

/// Returns `transform` composed with a scaling of pixel coordinates by
/// `factor` along both axes, so that one output pixel spans `factor` source
/// pixels.  The origin is unchanged.
///
/// This is the georeferencing used for downsampled masks.  It is exact only
/// when the grid extents are multiples of `factor`; otherwise the last partial
/// row and column of source pixels are dropped and the output covers a
/// slightly smaller area than the source.
GeoTransform ScaleGeoTransform(const GeoTransform& transform, Index factor);

}  // namespace rastermask

#endif  // RASTERMASK_GEO_TRANSFORM_H_
