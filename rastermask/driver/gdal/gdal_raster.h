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

#ifndef RASTERMASK_DRIVER_GDAL_GDAL_RASTER_H_
#define RASTERMASK_DRIVER_GDAL_GDAL_RASTER_H_

/// \file
/// `RasterSource` and `RasterSink` backed by GDAL.
///
/// Sources may be any raster format GDAL can open; band 1 is read through
/// `GDALRasterBand::RasterIO` with nearest-neighbour resampling, and validity
/// comes from the band's mask band (no-data value, alpha band or per-dataset
/// mask).  Sinks are GeoTIFF files.

#include <memory>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "rastermask/raster.h"
#include "rastermask/util/result.h"

namespace rastermask {

/// Opens the raster at `path` for reading.
///
/// \error `absl::StatusCode::kNotFound` if the file cannot be opened.
/// \error `absl::StatusCode::kInvalidArgument` if the dataset has no bands.
Result<std::unique_ptr<RasterSource>> OpenGdalRasterSource(
    const std::string& path);

/// Creates, or overwrites, a GeoTIFF at `path` configured by `spec`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `spec` requests a sample
///     type other than `uint8`.
/// \error Any error reported by GDAL while creating the file.
Result<std::unique_ptr<RasterSink>> CreateGdalRasterSink(
    const std::string& path, const RasterSinkSpec& spec);

/// Returns a factory that calls `CreateGdalRasterSink(path, spec)`.
RasterSinkFactory GdalRasterSinkFactory(std::string path);

namespace internal_gdal {

/// Converts the last error recorded by GDAL (`CPLGetLastErrorNo`,
/// `CPLGetLastErrorMsg`) to a status, prefixed by `action`.
absl::Status GdalErrorToStatus(std::string_view action);

}  // namespace internal_gdal
}  // namespace rastermask

#endif  // RASTERMASK_DRIVER_GDAL_GDAL_RASTER_H_
