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

#ifndef RASTERMASK_INDEX_H_
#define RASTERMASK_INDEX_H_

#include <cstdint>

namespace rastermask {

/// Type for representing a pixel coordinate in, or an extent of, a raster
/// grid.
using Index = std::int64_t;

}  // namespace rastermask

#endif  // RASTERMASK_INDEX_H_
