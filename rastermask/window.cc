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

#include "rastermask/window.h"

#include <algorithm>
#include <cassert>
#include <ostream>

#include "rastermask/index.h"

namespace rastermask {

std::ostream& operator<<(std::ostream& os, const Shape& shape) {
  return os << "{" << shape.rows << ", " << shape.cols << "}";
}

std::ostream& operator<<(std::ostream& os, const Window& window) {
  return os << "{row_offset=" << window.row_offset
            << ", col_offset=" << window.col_offset
            << ", height=" << window.height << ", width=" << window.width
            << "}";
}

bool Contains(const Window& outer, const Window& inner) {
  return inner.row_offset >= outer.row_offset &&
         inner.col_offset >= outer.col_offset &&
         inner.row_end() <= outer.row_end() &&
         inner.col_end() <= outer.col_end();
}

bool Contains(Shape shape, const Window& window) {
  return window.row_offset >= 0 && window.col_offset >= 0 &&
         window.height >= 0 && window.width >= 0 &&
         Contains(FullWindow(shape), window);
}

bool Intersects(const Window& a, const Window& b) {
  if (a.empty() || b.empty()) return false;
  return a.row_offset < b.row_end() && b.row_offset < a.row_end() &&
         a.col_offset < b.col_end() && b.col_offset < a.col_end();
}

Index NearestNeighborSourceIndex(Index out_index, Index in_extent,
                                 Index out_extent) {
  assert(out_extent > 0);
  assert(out_index >= 0 && out_index < out_extent);
  // floor((out_index + 0.5) * in_extent / out_extent), in integer arithmetic.
  const Index index = (2 * out_index + 1) * in_extent / (2 * out_extent);
  return std::min(index, in_extent - 1);
}

}  // namespace rastermask
