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

#ifndef RASTERMASK_RASTER_H_
#define RASTERMASK_RASTER_H_

/// \file
/// Interfaces to the raster I/O collaborator.
///
/// The mask pipeline never decodes pixels or encodes output storage itself;
/// it reads windows of a `RasterSource` and writes windows of a `RasterSink`.
/// `rastermask/driver/gdal/gdal_raster.h` implements both on top of GDAL.

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "rastermask/block_layout.h"
#include "rastermask/geo_transform.h"
#include "rastermask/index.h"
#include "rastermask/util/result.h"
#include "rastermask/window.h"

namespace rastermask {

/// Pixel sample type of a raster band.
enum class SampleType {
  kUnknown,
  kUint8,
  kInt8,
  kUint16,
  kInt16,
  kUint32,
  kInt32,
  kFloat32,
  kFloat64,
};

std::ostream& operator<<(std::ostream& os, SampleType sample_type);

/// Read-only view of a single-band raster grid.
///
/// Only band 1 is consumed; `band_count()` is informational.
class RasterSource {
 public:
  virtual ~RasterSource();

  /// Grid extent, in pixels.
  virtual Shape shape() const = 0;

  virtual GeoTransform transform() const = 0;

  /// Projection as WKT, or empty if the source has no spatial reference.
  virtual std::string projection() const = 0;

  virtual int band_count() const = 0;

  virtual SampleType sample_type() const = 0;

  /// Native block layout of band 1.  Its block windows tile `shape()`
  /// exactly.
  virtual BlockLayout block_layout() const = 0;

  /// Reads band 1 over `window`, resampled to `out_shape` by nearest-neighbour
  /// decimation, into `values` in row-major order.
  ///
  /// If `validity` is non-empty, it receives a row-major mask of `out_shape`
  /// with a non-zero entry for every sample that holds valid data and zero for
  /// no-data or otherwise masked samples.
  ///
  /// \param window Region of the grid to read, contained in `shape()`.
  /// \param out_shape Shape of the returned samples.  Equal to
  ///     `window.shape()` for a plain read.
  /// \param values Output buffer, `out_shape.num_elements()` elements.
  /// \param validity Optional output buffer, empty or
  ///     `out_shape.num_elements()` elements.
  /// \error `absl::StatusCode::kInvalidArgument` if the window is outside the
  ///     grid or the buffers do not match `out_shape`.
  /// \error Any I/O error reported by the underlying storage.
  virtual absl::Status Read(const Window& window, Shape out_shape,
                            absl::Span<double> values,
                            absl::Span<uint8_t> validity) = 0;
};

/// Configuration of a destination raster.
struct RasterSinkSpec {
  Shape shape;
  GeoTransform transform;
  std::string projection;
  int band_count = 1;
  SampleType sample_type = SampleType::kUint8;
  double nodata = 0;
  bool tiled = true;
  /// Tile shape used when `tiled` is `true`.
  Shape tile_shape{256, 256};
  /// Compression scheme name, e.g. "LZW", or "NONE".
  std::string compression = "LZW";
};

std::ostream& operator<<(std::ostream& os, const RasterSinkSpec& spec);

/// Write-only view of a single-band `uint8` raster grid.
class RasterSink {
 public:
  virtual ~RasterSink();

  /// Writes `mask` to band 1 over `window`.
  ///
  /// \param window Destination region, contained in the sink's shape.
  /// \param mask Row-major samples, `window.num_elements()` elements.
  virtual absl::Status Write(const Window& window,
                             absl::Span<const uint8_t> mask) = 0;

  /// Flushes all pending writes and releases the underlying storage.  No
  /// writes are permitted afterwards.
  virtual absl::Status Close() = 0;
};

/// Creates the destination raster for a given configuration.
using RasterSinkFactory =
    std::function<Result<std::unique_ptr<RasterSink>>(const RasterSinkSpec&)>;

/// Returns an error unless `window` lies within `shape` and `buffer_size`
/// equals `out_shape.num_elements()`.
absl::Status ValidateWindowAccess(Shape shape, const Window& window,
                                  Shape out_shape, size_t buffer_size);

}  // namespace rastermask

#endif  // RASTERMASK_RASTER_H_
