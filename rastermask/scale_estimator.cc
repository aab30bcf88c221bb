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

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "rastermask/block_layout.h"
#include "rastermask/errors.h"
#include "rastermask/raster.h"
#include "rastermask/util/result.h"
#include "rastermask/util/status.h"
#include "rastermask/window.h"

namespace rastermask {

std::ostream& operator<<(std::ostream& os, const ScaleEstimate& e) {
  return os << "{sampled_max=" << e.sampled_max
            << ", scale_factor=" << e.scale_factor
            << ", native_threshold=" << e.native_threshold << "}";
}

double ClassifyScale(double sampled_max) {
  for (const auto& bucket : kScaleBuckets) {
    if (sampled_max <= bucket.upper_bound) return bucket.scale_factor;
  }
  return kUnscaledFactor;
}

std::vector<double> ExtractValidValues(absl::Span<const double> values,
                                       absl::Span<const uint8_t> validity) {
  assert(validity.empty() || validity.size() == values.size());
  std::vector<double> valid;
  valid.reserve(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    if (!validity.empty() && validity[i] == 0) continue;
    if (std::isnan(values[i])) continue;
    valid.push_back(values[i]);
  }
  return valid;
}

double ComputePercentile(std::vector<double>& values, double percentile) {
  assert(!values.empty());
  const double rank =
      percentile / 100.0 * static_cast<double>(values.size() - 1);
  const size_t lower = static_cast<size_t>(std::floor(rank));
  const double fraction = rank - static_cast<double>(lower);

  auto lower_it = values.begin() + lower;
  std::nth_element(values.begin(), lower_it, values.end());
  const double lower_value = *lower_it;
  if (fraction == 0 || lower + 1 >= values.size()) return lower_value;

  // After nth_element, the next rank is the minimum of the upper partition.
  const double upper_value = *std::min_element(lower_it + 1, values.end());
  return lower_value + fraction * (upper_value - lower_value);
}

Result<ScaleEstimate> EstimateScale(RasterSource& source,
                                    double requested_fraction) {
  const BlockLayout layout = source.block_layout();
  if (layout.empty()) {
    return EmptySourceError("No block windows found in the source raster");
  }
  const Window sample_window = *layout.begin();

  std::vector<double> values(sample_window.num_elements());
  std::vector<uint8_t> validity(sample_window.num_elements());
  RASTERMASK_RETURN_IF_ERROR(
      source.Read(sample_window, sample_window.shape(), absl::MakeSpan(values),
                  absl::MakeSpan(validity)),
      MaybeAnnotateStatus(_, "Reading sample block"));

  std::vector<double> valid = ExtractValidValues(values, validity);
  // Release the sample block before computing the percentile.
  std::vector<double>().swap(values);

  ScaleEstimate estimate;
  estimate.sampled_max =
      valid.empty() ? 1.0 : ComputePercentile(valid, kSampledMaxPercentile);
  estimate.scale_factor = ClassifyScale(estimate.sampled_max);
  estimate.native_threshold = requested_fraction * estimate.scale_factor;
  return estimate;
}

}  // namespace rastermask
