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

#include "rastermask/scale_estimator.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "rastermask/errors.h"
#include "rastermask/internal/raster_testutil.h"
#include "rastermask/util/status_testutil.h"
#include "rastermask/window.h"

namespace {

using ::rastermask::ClassifyScale;
using ::rastermask::ComputePercentile;
using ::rastermask::EstimateScale;
using ::rastermask::ExtractValidValues;
using ::rastermask::Index;
using ::rastermask::IsEmptySourceError;
using ::rastermask::MatchesStatus;
using ::rastermask::ScaleEstimate;
using ::rastermask::Shape;
using ::rastermask::Window;
using ::rastermask::internal_testing::InMemoryRasterSource;
using ::testing::DoubleEq;
using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::Field;

TEST(ClassifyScaleTest, BucketBoundaries) {
  EXPECT_EQ(1, ClassifyScale(1.0));
  EXPECT_EQ(100, ClassifyScale(1.000001));
  EXPECT_EQ(100, ClassifyScale(110.0));
  EXPECT_EQ(10000, ClassifyScale(110.000001));
  EXPECT_EQ(10000, ClassifyScale(11000.0));
  EXPECT_EQ(1, ClassifyScale(11000.000001));
  EXPECT_EQ(1, ClassifyScale(50000));
}

TEST(ClassifyScaleTest, SmallAndNegative) {
  EXPECT_EQ(1, ClassifyScale(0));
  EXPECT_EQ(1, ClassifyScale(-5));
  EXPECT_EQ(1, ClassifyScale(0.5));
}

TEST(ExtractValidValuesTest, NoValidityMaskDropsNaN) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  std::vector<double> values{1, nan, 3};
  EXPECT_THAT(ExtractValidValues(values, {}), ElementsAre(1, 3));
}

TEST(ExtractValidValuesTest, HonorsValidityMask) {
  std::vector<double> values{1, 2, 3, 4};
  std::vector<uint8_t> validity{255, 0, 0, 1};
  EXPECT_THAT(ExtractValidValues(values, validity), ElementsAre(1, 4));
}

TEST(ComputePercentileTest, LinearInterpolation) {
  std::vector<double> values{4, 1, 3, 2, 5};
  EXPECT_THAT(ComputePercentile(values, 50), DoubleEq(3));
  EXPECT_THAT(ComputePercentile(values, 100), DoubleEq(5));
  EXPECT_THAT(ComputePercentile(values, 0), DoubleEq(1));
  // rank = 0.25 * 4 = 1 -> 2; rank = 0.9 * 4 = 3.6 -> 4.6
  EXPECT_THAT(ComputePercentile(values, 25), DoubleEq(2));
  EXPECT_THAT(ComputePercentile(values, 90), DoubleNear(4.6, 1e-12));
}

TEST(ComputePercentileTest, SingleValue) {
  std::vector<double> values{7};
  EXPECT_THAT(ComputePercentile(values, 99.9), DoubleEq(7));
}

TEST(ComputePercentileTest, RobustToSparseOutliers) {
  // 10000 values in [0, 100) and 5 large outliers: the 99.9th percentile
  // stays below the outliers.
  std::vector<double> values;
  for (int i = 0; i < 10000; ++i) values.push_back(i % 100);
  for (int i = 0; i < 5; ++i) values.push_back(65535);
  EXPECT_LE(ComputePercentile(values, 99.9), 99);
}

TEST(EstimateScaleTest, EndToEndExample) {
  auto source = InMemoryRasterSource::FromValues(
      Shape{4, 4}, Shape{4, 4},
      {0, 20, 40, 60, 80, 100, 0, 20, 40, 60, 80, 100, 0, 0, 0, 0});
  RASTERMASK_ASSERT_OK_AND_ASSIGN(ScaleEstimate estimate,
                                  EstimateScale(*source, 0.4));
  EXPECT_THAT(estimate.sampled_max, DoubleNear(100, 1e-9));
  EXPECT_EQ(100, estimate.scale_factor);
  EXPECT_THAT(estimate.native_threshold, DoubleNear(40, 1e-9));
}

TEST(EstimateScaleTest, ReadsOnlyFirstBlock) {
  // The first block holds fractions; later blocks hold large values that
  // would select a different scale.
  InMemoryRasterSource source(Shape{64, 64}, Shape{16, 16},
                              [](Index row, Index col) {
                                return (row < 16 && col < 16) ? 0.5 : 5000.0;
                              });
  RASTERMASK_ASSERT_OK_AND_ASSIGN(ScaleEstimate estimate,
                                  EstimateScale(source, 0.25));
  EXPECT_EQ(1, estimate.scale_factor);
  EXPECT_EQ(0.25, estimate.native_threshold);
  EXPECT_EQ(1, source.num_reads());
  EXPECT_EQ(16 * 16, source.max_read_elements());
}

TEST(EstimateScaleTest, FixedPointScale) {
  InMemoryRasterSource source(
      Shape{8, 8}, Shape{8, 8},
      [](Index row, Index col) { return (row * 8 + col) * 150.0; });
  RASTERMASK_ASSERT_OK_AND_ASSIGN(ScaleEstimate estimate,
                                  EstimateScale(source, 0.4));
  EXPECT_EQ(10000, estimate.scale_factor);
  EXPECT_THAT(estimate.native_threshold, DoubleNear(4000, 1e-9));
}

TEST(EstimateScaleTest, NoDataExcluded) {
  // No-data sentinel 65535 would otherwise force the unscaled fallback.
  InMemoryRasterSource source(Shape{10, 10}, Shape{10, 10},
                              [](Index row, Index col) {
                                return row == 0 ? 65535.0 : col * 10.0;
                              });
  source.set_validity([](Index row, Index col) { return row != 0; });
  RASTERMASK_ASSERT_OK_AND_ASSIGN(ScaleEstimate estimate,
                                  EstimateScale(source, 0.5));
  EXPECT_EQ(100, estimate.scale_factor);
  EXPECT_THAT(estimate.native_threshold, DoubleNear(50, 1e-9));
}

TEST(EstimateScaleTest, AllInvalidFallsBackToOne) {
  InMemoryRasterSource source(Shape{4, 4}, Shape{4, 4},
                              [](Index, Index) { return 9999.0; });
  source.set_validity([](Index, Index) { return false; });
  RASTERMASK_ASSERT_OK_AND_ASSIGN(ScaleEstimate estimate,
                                  EstimateScale(source, 0.4));
  EXPECT_EQ(1.0, estimate.sampled_max);
  EXPECT_EQ(1, estimate.scale_factor);
  EXPECT_THAT(estimate.native_threshold, DoubleEq(0.4));
}

TEST(EstimateScaleTest, AllNaNFallsBackToOne) {
  InMemoryRasterSource source(
      Shape{4, 4}, Shape{2, 2},
      [](Index, Index) { return std::numeric_limits<double>::quiet_NaN(); });
  RASTERMASK_ASSERT_OK_AND_ASSIGN(ScaleEstimate estimate,
                                  EstimateScale(source, 0.4));
  EXPECT_EQ(1.0, estimate.sampled_max);
}

TEST(EstimateScaleTest, EmptySource) {
  InMemoryRasterSource source(Shape{0, 0}, Shape{256, 256},
                              [](Index, Index) { return 0.0; });
  auto result = EstimateScale(source, 0.4);
  EXPECT_THAT(result, MatchesStatus(absl::StatusCode::kFailedPrecondition));
  EXPECT_TRUE(IsEmptySourceError(result.status()));
  EXPECT_EQ(0, source.num_reads());
}

TEST(EstimateScaleTest, ReadErrorPropagates) {
  InMemoryRasterSource source(Shape{4, 4}, Shape{4, 4},
                              [](Index, Index) { return 0.0; });
  source.FailReadsFrom(0, absl::DataLossError("corrupt block"));
  EXPECT_THAT(EstimateScale(source, 0.4),
              MatchesStatus(absl::StatusCode::kDataLoss,
                            "Reading sample block: corrupt block"));
}

}  // namespace
