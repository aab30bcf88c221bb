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

#ifndef RASTERMASK_SCALE_ESTIMATOR_H_
#define RASTERMASK_SCALE_ESTIMATOR_H_

/// \file
/// Infers the storage convention of a fractional raster from one sample block.
///
/// Rasters holding fractional quantities are commonly stored as 0-1 floats,
/// 0-100 percentages, or 0-10000 fixed-point integers.  `EstimateScale` reads
/// the first block of the source, takes a robust upper bound of its valid
/// values, and picks the matching scale factor.

#include <cstdint>
#include <iosfwd>
#include <vector>

#include "absl/types/span.h"
#include "rastermask/raster.h"
#include "rastermask/util/result.h"

namespace rastermask {

/// Result of scale inference.  Produced once per run.
struct ScaleEstimate {
  /// 99.9th percentile of the valid sample values, or 1 if the sample has no
  /// valid values.
  double sampled_max = 1.0;
  /// One of 1, 100, 10000.
  double scale_factor = 1.0;
  /// `requested_fraction * scale_factor`, in the units of the stored values.
  double native_threshold = 0.0;

  friend bool operator==(const ScaleEstimate& a, const ScaleEstimate& b) {
    return a.sampled_max == b.sampled_max &&
           a.scale_factor == b.scale_factor &&
           a.native_threshold == b.native_threshold;
  }
  friend bool operator!=(const ScaleEstimate& a, const ScaleEstimate& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const ScaleEstimate& e);
};

/// Entry of the scale classification table.
struct ScaleBucket {
  double upper_bound;
  double scale_factor;
};

/// Scale classification table, evaluated in order; the first bucket with
/// `sampled_max <= upper_bound` wins.  Values above every bound are treated
/// as unscaled.
inline constexpr ScaleBucket kScaleBuckets[] = {
    {1.0, 1.0},
    {110.0, 100.0},
    {11000.0, 10000.0},
};

/// Scale factor used when `sampled_max` exceeds every bucket.
inline constexpr double kUnscaledFactor = 1.0;

/// Percentile of the valid sample values used as the robust maximum.
inline constexpr double kSampledMaxPercentile = 99.9;

/// Returns the scale factor for `sampled_max` according to `kScaleBuckets`.
double ClassifyScale(double sampled_max);

/// Returns the values of `values` that are valid: not NaN, and, if
/// `validity` is non-empty, whose corresponding `validity` entry is non-zero.
///
/// \dchecks `validity.empty() || validity.size() == values.size()`
std::vector<double> ExtractValidValues(absl::Span<const double> values,
                                       absl::Span<const uint8_t> validity);

/// Returns the `percentile`-th percentile of `values`, using linear
/// interpolation between the two nearest ranks.  `values` is reordered.
///
/// \param values Non-empty list of values, none of which is NaN.
/// \param percentile Percentile in `[0, 100]`.
double ComputePercentile(std::vector<double>& values, double percentile);

/// Estimates the scale of `source` from its first block and derives the
/// threshold in stored units for `requested_fraction`.
///
/// Reads exactly one block of band 1.
///
/// \error `absl::StatusCode::kFailedPrecondition` (`IsEmptySourceError`) if the
///     source has no blocks.
/// \error Any error returned by `source.Read`.
Result<ScaleEstimate> EstimateScale(RasterSource& source,
                                    double requested_fraction);

}  // namespace rastermask

#endif  // RASTERMASK_SCALE_ESTIMATOR_H_
