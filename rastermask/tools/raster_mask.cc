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

/// \file
/// Writes a binary mask of a large single-band raster.
///
///     raster_mask --input=fraction.tif --output=mask_40.tif --threshold=0.4
///
/// The threshold is a fraction of the data range; whether the raster stores
/// fractions as 0-1, 0-100 or 0-10000 values is inferred from its first
/// block.  Use --downsample=N to write a mask N times smaller along each
/// axis, and --options='{"compression": "DEFLATE"}' to configure the output.
/// Per-block tracing is enabled with --vmodule=mask_pipeline=1,gdal_raster=1.

#include <cstdint>
#include <filesystem>  // NOLINT
#include <iostream>
#include <optional>
#include <string>
#include <system_error>  // NOLINT

#include "absl/base/log_severity.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/absl_log.h"
#include "absl/log/flags.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "rastermask/driver/gdal/gdal_raster.h"
#include "rastermask/errors.h"
#include "rastermask/mask_options.h"
#include "rastermask/mask_pipeline.h"
#include "rastermask/util/result.h"
#include "rastermask/util/status.h"

ABSL_FLAG(std::string, input, "", "Input raster path.");
ABSL_FLAG(std::string, output, "", "Output mask GeoTIFF path.");
ABSL_FLAG(std::optional<double>, threshold, std::nullopt,
          "Threshold as a fraction of the data range (0.4 = 40%). "
          "Overrides --options. Defaults to 0.4.");
ABSL_FLAG(std::optional<int64_t>, downsample, std::nullopt,
          "Optional downsample factor for the output (e.g. 2, 4). "
          "0 = full resolution. Overrides --options.");
ABSL_FLAG(rastermask::MaskOptions, options, {},
          "Mask options as JSON, e.g. "
          "'{\"compression\": \"DEFLATE\", \"tile_shape\": [512, 512]}'.");

namespace {

using ::rastermask::MaskOptions;
using ::rastermask::MaskSummary;

constexpr int kExitMissingInput = 2;

absl::Status Run(const std::string& input, const std::string& output,
                 const MaskOptions& options) {
  RASTERMASK_ASSIGN_OR_RETURN(auto source,
                              rastermask::OpenGdalRasterSource(input));
  RASTERMASK_ASSIGN_OR_RETURN(
      MaskSummary summary,
      rastermask::RunMaskPipeline(
          *source, rastermask::GdalRasterSinkFactory(output), options));
  ABSL_LOG(INFO) << "Wrote " << summary.blocks_written << " blocks, "
                 << summary.output_shape.rows << " x "
                 << summary.output_shape.cols;
  return absl::OkStatus();
}

int RealMain(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Writes a binary threshold mask of a single-band raster.\n"
      "Usage: raster_mask --input=<path> --output=<path> "
      "[--threshold=0.4] [--downsample=N] [--options=<json>]");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);

  const std::string input = absl::GetFlag(FLAGS_input);
  const std::string output = absl::GetFlag(FLAGS_output);
  if (input.empty() || output.empty()) {
    std::cerr << absl::ProgramUsageMessage() << std::endl;
    return 1;
  }

  MaskOptions options = absl::GetFlag(FLAGS_options);
  if (auto threshold = absl::GetFlag(FLAGS_threshold)) {
    options.threshold = *threshold;
  }
  if (auto downsample = absl::GetFlag(FLAGS_downsample)) {
    options.downsample_factor = *downsample;
  }

  std::error_code ec;
  if (!std::filesystem::exists(input, ec)) {
    std::cerr << rastermask::MissingInputError(input).message() << std::endl;
    return kExitMissingInput;
  }

  absl::Status status = Run(input, output, options);
  if (!status.ok()) {
    std::cerr << status << std::endl;
    return 1;
  }
  std::cout << "[OK] Mask written to: " << output << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char** argv) { return RealMain(argc, argv); }
