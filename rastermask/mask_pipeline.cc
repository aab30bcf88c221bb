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

#include "rastermask/mask_pipeline.h"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <utility>
#include <vector>

#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "rastermask/block_planner.h"
#include "rastermask/mask_options.h"
#include "rastermask/raster.h"
#include "rastermask/scale_estimator.h"
#include "rastermask/util/result.h"
#include "rastermask/util/status.h"
#include "rastermask/window.h"

namespace rastermask {

std::ostream& operator<<(std::ostream& os, const MaskSummary& s) {
  return os << "{estimate=" << s.estimate << ", output_shape=" << s.output_shape
            << ", blocks_written=" << s.blocks_written
            << ", blocks_skipped=" << s.blocks_skipped << "}";
}

void ThresholdBlock(absl::Span<const double> values, double native_threshold,
                    absl::Span<uint8_t> mask) {
  assert(values.size() == mask.size());
  for (size_t i = 0; i < values.size(); ++i) {
    mask[i] = values[i] >= native_threshold ? 1 : 0;
  }
}

RasterSinkSpec MakeSinkSpec(const RasterSource& source,
                            const MaskOptions& options) {
  const Index factor = options.effective_downsample_factor();
  RasterSinkSpec spec;
  spec.shape = DownsampledShape(source.shape(), factor);
  spec.transform = ScaleGeoTransform(source.transform(), factor);
  spec.projection = source.projection();
  spec.band_count = 1;
  spec.sample_type = SampleType::kUint8;
  spec.nodata = 0;
  spec.tiled = options.tiled;
  spec.tile_shape = options.tile_shape;
  spec.compression = options.compression;
  return spec;
}

Result<MaskSummary> RunMaskPipeline(RasterSource& source,
                                    const RasterSinkFactory& make_sink,
                                    const MaskOptions& options) {
  RASTERMASK_RETURN_IF_ERROR(options.Validate());

  MaskSummary summary;
  RASTERMASK_ASSIGN_OR_RETURN(summary.estimate,
                              EstimateScale(source, options.threshold));
  ABSL_LOG(INFO) << absl::StrFormat(
      "Data max~%.2f, scale_guess=%g, threshold_native=%.2f",
      summary.estimate.sampled_max, summary.estimate.scale_factor,
      summary.estimate.native_threshold);

  const RasterSinkSpec sink_spec = MakeSinkSpec(source, options);
  summary.output_shape = sink_spec.shape;
  ABSL_VLOG(1) << "Creating sink " << sink_spec;
  RASTERMASK_ASSIGN_OR_RETURN(
      std::unique_ptr<RasterSink> sink, make_sink(sink_spec),
      MaybeAnnotateStatus(_, "Creating output raster"));

  const BlockPlanner planner(source.block_layout(),
                             options.effective_downsample_factor());
  std::vector<double> values;
  std::vector<uint8_t> mask;
  auto it = planner.begin();
  for (; it != planner.end(); ++it) {
    const BlockPlan& plan = *it;
    const size_t num_elements = plan.target_shape.num_elements();
    values.resize(num_elements);
    mask.resize(num_elements);

    RASTERMASK_RETURN_IF_ERROR(
        source.Read(plan.source_window, plan.target_shape,
                    absl::MakeSpan(values), {}),
        MaybeAnnotateStatus(_, absl::StrCat("Reading block ",
                                            it.block_index())));
    ThresholdBlock(values, summary.estimate.native_threshold,
                   absl::MakeSpan(mask));
    RASTERMASK_RETURN_IF_ERROR(
        sink->Write(plan.dest_window, mask),
        MaybeAnnotateStatus(_, absl::StrCat("Writing block ",
                                            it.block_index())));
    ++summary.blocks_written;
    ABSL_VLOG(1) << "Block " << it.block_index() << ": " << plan;
  }
  summary.blocks_skipped = it.skipped_blocks();
  if (summary.blocks_skipped > 0) {
    ABSL_LOG(WARNING) << summary.blocks_skipped
                      << " source blocks are smaller than the downsample "
                         "factor and were not written";
  }

  RASTERMASK_RETURN_IF_ERROR(sink->Close(),
                             MaybeAnnotateStatus(_, "Closing output raster"));
  return summary;
}

}  // namespace rastermask
