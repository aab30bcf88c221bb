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

#ifndef RASTERMASK_WINDOW_H_
#define RASTERMASK_WINDOW_H_

/// \file
/// Rectangular regions of a two-dimensional raster grid.

#include <iosfwd>

#include "rastermask/index.h"

namespace rastermask {

/// Extent of a two-dimensional row-major array.
struct Shape {
  Index rows = 0;
  Index cols = 0;

  /// Returns the number of elements, `rows * cols`.
  Index num_elements() const { return rows * cols; }

  /// Returns `true` if either extent is zero.
  bool empty() const { return rows == 0 || cols == 0; }

  friend bool operator==(const Shape& a, const Shape& b) {
    return a.rows == b.rows && a.cols == b.cols;
  }
  friend bool operator!=(const Shape& a, const Shape& b) { return !(a == b); }

  friend std::ostream& operator<<(std::ostream& os, const Shape& shape);
};

/// Rectangular sub-region of a raster grid, in pixel coordinates.
///
/// A window is always contained within the grid it refers to; all members are
/// non-negative.
struct Window {
  Index row_offset = 0;
  Index col_offset = 0;
  Index height = 0;
  Index width = 0;

  /// Exclusive end row, `row_offset + height`.
  Index row_end() const { return row_offset + height; }

  /// Exclusive end column, `col_offset + width`.
  Index col_end() const { return col_offset + width; }

  Shape shape() const { return Shape{height, width}; }

  Index num_elements() const { return height * width; }

  bool empty() const { return height == 0 || width == 0; }

  friend bool operator==(const Window& a, const Window& b) {
    return a.row_offset == b.row_offset && a.col_offset == b.col_offset &&
           a.height == b.height && a.width == b.width;
  }
  friend bool operator!=(const Window& a, const Window& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const Window& window);
};

/// Returns the window covering an entire grid of the given `shape`.
inline Window FullWindow(Shape shape) {
  return Window{0, 0, shape.rows, shape.cols};
}

/// Returns `true` if `inner` lies entirely within `outer`.
bool Contains(const Window& outer, const Window& inner);

/// Returns `true` if `window` lies entirely within a grid of `shape`.
bool Contains(Shape shape, const Window& window);

/// Returns `true` if `a` and `b` share at least one cell.
bool Intersects(const Window& a, const Window& b);

/// Returns the position, in `[0, in_extent)`, of the source sample selected by
/// nearest-neighbour decimation for output position `out_index` when resizing
/// an extent of `in_extent` to `out_extent`.
///
/// The sample nearest the centre of the output cell is chosen, which matches
/// the convention used by GDAL's `GRIORA_NearestNeighbour` reads.
///
/// \dchecks `0 <= out_index < out_extent`
/// \dchecks `0 < out_extent`
Index NearestNeighborSourceIndex(Index out_index, Index in_extent,
                                 Index out_extent);

}  // namespace rastermask

#endif  // RASTERMASK_WINDOW_H_
