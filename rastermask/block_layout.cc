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

#include "rastermask/block_layout.h"

#include <algorithm>
#include <cassert>
#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "rastermask/index.h"
#include "rastermask/util/result.h"
#include "rastermask/window.h"

namespace rastermask {
namespace {

Index CeilOfRatio(Index numerator, Index denominator) {
  return (numerator + denominator - 1) / denominator;
}

}  // namespace

Result<BlockLayout> BlockLayout::Make(Shape grid_shape, Shape block_shape) {
  if (grid_shape.rows < 0 || grid_shape.cols < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Grid shape {", grid_shape.rows, ", ", grid_shape.cols,
                     "} has a negative extent"));
  }
  if (block_shape.rows <= 0 || block_shape.cols <= 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Block shape {", block_shape.rows, ", ", block_shape.cols,
                     "} must be positive"));
  }
  Shape grid_blocks{CeilOfRatio(grid_shape.rows, block_shape.rows),
                    CeilOfRatio(grid_shape.cols, block_shape.cols)};
  return BlockLayout(grid_shape, block_shape, grid_blocks);
}

Window BlockLayout::GetBlockWindow(Index block_index) const {
  assert(block_index >= 0 && block_index < num_blocks());
  const Index block_row = block_index / grid_blocks_.cols;
  const Index block_col = block_index % grid_blocks_.cols;
  Window window;
  window.row_offset = block_row * block_shape_.rows;
  window.col_offset = block_col * block_shape_.cols;
  window.height =
      std::min(block_shape_.rows, grid_shape_.rows - window.row_offset);
  window.width =
      std::min(block_shape_.cols, grid_shape_.cols - window.col_offset);
  return window;
}

std::ostream& operator<<(std::ostream& os, const BlockLayout& layout) {
  return os << "{grid_shape=" << layout.grid_shape()
            << ", block_shape=" << layout.block_shape() << "}";
}

}  // namespace rastermask
