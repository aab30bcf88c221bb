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

#ifndef RASTERMASK_BLOCK_LAYOUT_H_
#define RASTERMASK_BLOCK_LAYOUT_H_

/// \file
/// Regular partition of a raster grid into block windows.

#include <cstddef>
#include <iosfwd>
#include <iterator>

#include "rastermask/index.h"
#include "rastermask/util/result.h"
#include "rastermask/window.h"

namespace rastermask {

/// Partitions a grid of `grid_shape()` into non-overlapping windows of
/// `block_shape()`, clipped at the right and bottom edges.
///
/// Blocks are enumerated in row-major order: all blocks of the first block row
/// from left to right, then the next block row.  A grid with a zero extent has
/// no blocks.
///
/// Block windows are computed on demand; a layout never materializes the list
/// of its blocks, so arbitrarily large grids are represented in constant
/// space.
class BlockLayout {
 public:
  class iterator;

  /// Constructs an empty layout.
  BlockLayout() = default;

  /// Returns a layout for `grid_shape` partitioned into blocks of
  /// `block_shape`.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `grid_shape` has a negative
  ///     extent or `block_shape` has a non-positive extent.
  static Result<BlockLayout> Make(Shape grid_shape, Shape block_shape);

  Shape grid_shape() const { return grid_shape_; }
  Shape block_shape() const { return block_shape_; }

  /// Number of block rows and block columns.
  Shape grid_blocks() const { return grid_blocks_; }

  /// Total number of blocks.
  Index num_blocks() const { return grid_blocks_.num_elements(); }

  bool empty() const { return num_blocks() == 0; }

  /// Returns the window of the block with row-major index `block_index`.
  ///
  /// \dchecks `0 <= block_index < num_blocks()`
  Window GetBlockWindow(Index block_index) const;

  iterator begin() const;
  iterator end() const;

  friend bool operator==(const BlockLayout& a, const BlockLayout& b) {
    return a.grid_shape_ == b.grid_shape_ && a.block_shape_ == b.block_shape_;
  }
  friend bool operator!=(const BlockLayout& a, const BlockLayout& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const BlockLayout& layout);

 private:
  BlockLayout(Shape grid_shape, Shape block_shape, Shape grid_blocks)
      : grid_shape_(grid_shape),
        block_shape_(block_shape),
        grid_blocks_(grid_blocks) {}

  Shape grid_shape_;
  Shape block_shape_;
  Shape grid_blocks_;
};

/// Iterates over the block windows of a `BlockLayout`.
class BlockLayout::iterator {
 public:
  using iterator_category = std::forward_iterator_tag;
  using value_type = Window;
  using difference_type = std::ptrdiff_t;
  using pointer = const Window*;
  using reference = Window;

  iterator() = default;

  Window operator*() const { return layout_->GetBlockWindow(index_); }

  iterator& operator++() {
    ++index_;
    return *this;
  }
  iterator operator++(int) {
    iterator copy = *this;
    ++index_;
    return copy;
  }

  /// Row-major index of the current block.
  Index index() const { return index_; }

  friend bool operator==(const iterator& a, const iterator& b) {
    return a.index_ == b.index_;
  }
  friend bool operator!=(const iterator& a, const iterator& b) {
    return !(a == b);
  }

 private:
  friend class BlockLayout;
  iterator(const BlockLayout* layout, Index index)
      : layout_(layout), index_(index) {}

  const BlockLayout* layout_ = nullptr;
  Index index_ = 0;
};

inline BlockLayout::iterator BlockLayout::begin() const {
  return iterator(this, 0);
}
inline BlockLayout::iterator BlockLayout::end() const {
  return iterator(this, num_blocks());
}

}  // namespace rastermask

#endif  // RASTERMASK_BLOCK_LAYOUT_H_
