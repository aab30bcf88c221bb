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

#include "rastermask/geo_transform.h"

#include <ostream>

#include "absl/strings/str_join.h"
#include "rastermask/index.h"

namespace rastermask {

std::ostream& operator<<(std::ostream& os, const GeoTransform& t) {
  return os << "[" << absl::StrJoin(t.coefficients, ", ") << "]";
}

GeoTransform ScaleGeoTransform(const GeoTransform& transform, Index factor) {
  if (factor <= 1) return transform;
  GeoTransform scaled = transform;
  const double f = static_cast<double>(factor);
  scaled.coefficients[1] *= f;
  scaled.coefficients[2] *= f;
  scaled.coefficients[4] *= f;
  scaled.coefficients[5] *= f;
  return scaled;
}

}  // namespace rastermask
