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

#include "rastermask/raster.h"

#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "rastermask/util/status_testutil.h"
#include "rastermask/window.h"

namespace {

using ::rastermask::MatchesStatus;
using ::rastermask::RasterSinkSpec;
using ::rastermask::SampleType;
using ::rastermask::Shape;
using ::rastermask::ValidateWindowAccess;
using ::rastermask::Window;

TEST(ValidateWindowAccessTest, Valid) {
  RASTERMASK_EXPECT_OK(
      ValidateWindowAccess(Shape{10, 10}, Window{2, 3, 4, 5}, Shape{4, 5}, 20));
  RASTERMASK_EXPECT_OK(
      ValidateWindowAccess(Shape{10, 10}, Window{0, 0, 10, 10}, Shape{2, 2},
                           4));
}

TEST(ValidateWindowAccessTest, OutsideGrid) {
  EXPECT_THAT(
      ValidateWindowAccess(Shape{10, 10}, Window{8, 0, 4, 2}, Shape{4, 2}, 8),
      MatchesStatus(absl::StatusCode::kInvalidArgument,
                    "Window [{]8, 0, 4, 2[}] is outside grid of shape "
                    "[{]10, 10[}]"));
  EXPECT_THAT(
      ValidateWindowAccess(Shape{10, 10}, Window{-1, 0, 2, 2}, Shape{2, 2}, 4),
      MatchesStatus(absl::StatusCode::kInvalidArgument, ".*outside grid.*"));
}

TEST(ValidateWindowAccessTest, BufferMismatch) {
  EXPECT_THAT(
      ValidateWindowAccess(Shape{10, 10}, Window{0, 0, 4, 4}, Shape{2, 2}, 16),
      MatchesStatus(absl::StatusCode::kInvalidArgument,
                    "Buffer of 16 elements does not match shape [{]2, 2[}]"));
}

TEST(SampleTypeTest, PrintToOstream) {
  std::ostringstream os;
  os << SampleType::kUint16 << " " << SampleType::kFloat64;
  EXPECT_EQ("uint16 float64", os.str());
}

TEST(RasterSinkSpecTest, Defaults) {
  RasterSinkSpec spec;
  EXPECT_EQ(1, spec.band_count);
  EXPECT_EQ(SampleType::kUint8, spec.sample_type);
  EXPECT_EQ(0, spec.nodata);
  EXPECT_TRUE(spec.tiled);
  EXPECT_EQ((Shape{256, 256}), spec.tile_shape);
  EXPECT_EQ("LZW", spec.compression);
}

}  // namespace
