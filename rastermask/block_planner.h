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

#ifndef RASTERMASK_BLOCK_PLANNER_H_
#define RASTERMASK_BLOCK_PLANNER_H_

/// \file
/// Maps source blocks to read requests and destination windows.
///
/// Without downsampling, every source block is read as is and written to the
/// same window of the output grid.  With a downsample factor `f > 1`, each
/// block is decimated independently to `floor(height / f) x floor(width / f)`
/// samples and written at `floor(offset / f)` in the output grid.  Blocks for
/// which either decimated extent is zero are skipped and leave a gap in the
/// output; when block extents are multiples of `f` the destination windows
/// tile the output grid exactly.

#include <cstddef>
#include <iosfwd>
#include <iterator>
#include <optional>

#include "rastermask/block_layout.h"
#include "rastermask/index.h"
#include "rastermask/window.h"

namespace rastermask {

/// Read and write geometry for one source block.
struct BlockPlan {
  /// Full-resolution region of the source to read.
  Window source_window;
  /// Shape requested from the read, and of the resulting mask block.
  Shape target_shape;
  /// Region of the output grid receiving the mask block.  Its shape equals
  /// `target_shape`.
  Window dest_window;

  friend bool operator==(const BlockPlan& a, const BlockPlan& b) {
    return a.source_window == b.source_window &&
           a.target_shape == b.target_shape && a.dest_window == b.dest_window;
  }
  friend bool operator!=(const BlockPlan& a, const BlockPlan& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const BlockPlan& plan);
};

/// Returns the shape of the output grid for a source grid of `shape`
/// downsampled by `downsample_factor`.
///
/// Each extent is floor-divided by the factor, with a minimum of 1.  A factor
/// `<= 1` leaves `shape` unchanged.
Shape DownsampledShape(Shape shape, Index downsample_factor);

/// Returns the plan for the source block `block`, or `std::nullopt` if the
/// block is skipped because its decimated shape is empty.
std::optional<BlockPlan> PlanBlock(const Window& block,
                                   Index downsample_factor);

/// Single-pass range of the `BlockPlan` for each non-skipped block of a
/// `BlockLayout`, in the layout's enumeration order.
///
/// Plans are computed on demand; the planner holds no per-block state.
///
/// Example::
///
///     for (const BlockPlan& plan : BlockPlanner(layout, 4)) {
///       ...
///     }
class BlockPlanner {
 public:
  class iterator;
  using sentinel = std::nullptr_t;

  /// Constructs a planner over the blocks of `layout`.  A `downsample_factor`
  /// `<= 1` disables downsampling.
  BlockPlanner(BlockLayout layout, Index downsample_factor)
      : layout_(layout), downsample_factor_(downsample_factor) {}

  const BlockLayout& layout() const { return layout_; }
  Index downsample_factor() const { return downsample_factor_; }

  /// Shape of the output grid.
  Shape output_shape() const {
    return DownsampledShape(layout_.grid_shape(), downsample_factor_);
  }

  iterator begin() const;
  sentinel end() const { return nullptr; }

 private:
  BlockLayout layout_;
  Index downsample_factor_;
};

/// Input iterator over the plans of a `BlockPlanner`.
class BlockPlanner::iterator {
 public:
  using iterator_category = std::input_iterator_tag;
  using value_type = BlockPlan;
  using difference_type = std::ptrdiff_t;
  using pointer = const BlockPlan*;
  using reference = const BlockPlan&;

  reference operator*() const { return *plan_; }
  pointer operator->() const { return &*plan_; }

  iterator& operator++() {
    ++block_index_;
    Advance();
    return *this;
  }

  /// Row-major index, in the source layout, of the current block.
  Index block_index() const { return block_index_; }

  /// Number of blocks skipped so far.
  Index skipped_blocks() const { return skipped_blocks_; }

  friend bool operator==(const iterator& it, sentinel) {
    return !it.plan_.has_value();
  }
  friend bool operator!=(const iterator& it, sentinel s) { return !(it == s); }
  friend bool operator==(sentinel s, const iterator& it) { return it == s; }
  friend bool operator!=(sentinel s, const iterator& it) { return !(it == s); }

 private:
  friend class BlockPlanner;
  explicit iterator(const BlockPlanner* planner) : planner_(planner) {
    Advance();
  }

  // Moves to the first non-skipped block at or after `block_index_`.
  void Advance();

  const BlockPlanner* planner_;
  Index block_index_ = 0;
  Index skipped_blocks_ = 0;
  std::optional<BlockPlan> plan_;
};

inline BlockPlanner::iterator BlockPlanner::begin() const {
  return iterator(this);
}

}  // namespace rastermask

#endif  // RASTERMASK_BLOCK_PLANNER_H_
