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

#ifndef RASTERMASK_MASK_PIPELINE_H_
#define RASTERMASK_MASK_PIPELINE_H_

/// \file
/// Streams a source raster through a threshold into a binary mask raster.
///
/// `RunMaskPipeline` estimates the data scale once from the first source
/// block, then processes the source one block at a time in the order given by
/// its block layout: read (decimating when downsampling), threshold, write.
/// At most one block of samples is held in memory, independent of the size of
/// the raster.
///
/// Example::
///
///     RASTERMASK_ASSIGN_OR_RETURN(auto source, OpenGdalRasterSource(input));
///     MaskOptions options;
///     options.threshold = 0.4;
///     RASTERMASK_ASSIGN_OR_RETURN(
///         MaskSummary summary,
///         RunMaskPipeline(*source, GdalRasterSinkFactory(output), options));

#include <cstdint>
#include <iosfwd>

#include "absl/types/span.h"
#include "rastermask/index.h"
#include "rastermask/mask_options.h"
#include "rastermask/raster.h"
#include "rastermask/scale_estimator.h"
#include "rastermask/util/result.h"
#include "rastermask/window.h"

namespace rastermask {

/// Outcome of a successful mask run.
struct MaskSummary {
  ScaleEstimate estimate;
  /// Shape of the output grid.
  Shape output_shape;
  /// Number of source blocks written to the output.
  Index blocks_written = 0;
  /// Number of source blocks skipped because their decimated shape was empty.
  Index blocks_skipped = 0;

  friend std::ostream& operator<<(std::ostream& os, const MaskSummary& s);
};

/// Sets `mask[i]` to 1 if `values[i] >= native_threshold` and to 0 otherwise.
/// NaN values map to 0.
///
/// \dchecks `values.size() == mask.size()`
void ThresholdBlock(absl::Span<const double> values, double native_threshold,
                    absl::Span<uint8_t> mask);

/// Returns the configuration of the output raster for `source`: single band,
/// `uint8`, no-data 0, with the shape and georeferencing adjusted for the
/// downsample factor.
///
/// When downsampling, the transform is `ScaleGeoTransform` of the source
/// transform, an approximation that is exact only for grid extents that are
/// multiples of the factor.
RasterSinkSpec MakeSinkSpec(const RasterSource& source,
                            const MaskOptions& options);

/// Writes the threshold mask of `source` to a sink created by `make_sink`.
///
/// The sink is created only after scale estimation succeeds, so an empty
/// source creates no output.
///
/// \error `absl::StatusCode::kInvalidArgument` if `options` is invalid.
/// \error `absl::StatusCode::kFailedPrecondition` (`IsEmptySourceError`) if
///     the source has no blocks.
/// \error Any error returned by the source, the sink factory or the sink;
///     the run stops at the first error.
Result<MaskSummary> RunMaskPipeline(RasterSource& source,
                                    const RasterSinkFactory& make_sink,
                                    const MaskOptions& options);

}  // namespace rastermask

#endif  // RASTERMASK_MASK_PIPELINE_H_
