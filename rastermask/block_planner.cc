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

#include "rastermask/block_planner.h"

#include <algorithm>
#include <optional>
#include <ostream>

#include "rastermask/index.h"
#include "rastermask/window.h"

namespace rastermask {

std::ostream& operator<<(std::ostream& os, const BlockPlan& plan) {
  return os << "{source_window=" << plan.source_window
            << ", target_shape=" << plan.target_shape
            << ", dest_window=" << plan.dest_window << "}";
}

Shape DownsampledShape(Shape shape, Index downsample_factor) {
  if (downsample_factor <= 1) return shape;
  return Shape{std::max<Index>(1, shape.rows / downsample_factor),
               std::max<Index>(1, shape.cols / downsample_factor)};
}

std::optional<BlockPlan> PlanBlock(const Window& block,
                                   Index downsample_factor) {
  BlockPlan plan;
  plan.source_window = block;
  if (downsample_factor <= 1) {
    plan.target_shape = block.shape();
    plan.dest_window = block;
    return plan;
  }
  plan.target_shape = Shape{block.height / downsample_factor,
                            block.width / downsample_factor};
  if (plan.target_shape.empty()) return std::nullopt;
  plan.dest_window = Window{block.row_offset / downsample_factor,
                            block.col_offset / downsample_factor,
                            plan.target_shape.rows, plan.target_shape.cols};
  return plan;
}

void BlockPlanner::iterator::Advance() {
  const BlockLayout& layout = planner_->layout_;
  plan_.reset();
  for (; block_index_ < layout.num_blocks(); ++block_index_) {
    plan_ = PlanBlock(layout.GetBlockWindow(block_index_),
                      planner_->downsample_factor_);
    if (plan_) return;
    ++skipped_blocks_;
  }
}

}  // namespace rastermask
