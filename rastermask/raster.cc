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

#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "rastermask/window.h"

namespace rastermask {

RasterSource::~RasterSource() = default;

RasterSink::~RasterSink() = default;

std::ostream& operator<<(std::ostream& os, SampleType sample_type) {
  switch (sample_type) {
    case SampleType::kUint8:
      return os << "uint8";
    case SampleType::kInt8:
      return os << "int8";
    case SampleType::kUint16:
      return os << "uint16";
    case SampleType::kInt16:
      return os << "int16";
    case SampleType::kUint32:
      return os << "uint32";
    case SampleType::kInt32:
      return os << "int32";
    case SampleType::kFloat32:
      return os << "float32";
    case SampleType::kFloat64:
      return os << "float64";
    default:
      return os << "<unknown sample type>";
  }
}

std::ostream& operator<<(std::ostream& os, const RasterSinkSpec& spec) {
  os << "{shape=" << spec.shape << ", transform=" << spec.transform
     << ", band_count=" << spec.band_count
     << ", sample_type=" << spec.sample_type << ", nodata=" << spec.nodata
     << ", tiled=" << (spec.tiled ? "true" : "false");
  if (spec.tiled) os << ", tile_shape=" << spec.tile_shape;
  return os << ", compression=" << spec.compression << "}";
}

absl::Status ValidateWindowAccess(Shape shape, const Window& window,
                                  Shape out_shape, size_t buffer_size) {
  if (!Contains(shape, window)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Window {", window.row_offset, ", ", window.col_offset,
                     ", ", window.height, ", ", window.width,
                     "} is outside grid of shape {", shape.rows, ", ",
                     shape.cols, "}"));
  }
  if (out_shape.rows < 0 || out_shape.cols < 0 ||
      static_cast<size_t>(out_shape.num_elements()) != buffer_size) {
    return absl::InvalidArgumentError(
        absl::StrCat("Buffer of ", buffer_size,
                     " elements does not match shape {", out_shape.rows, ", ",
                     out_shape.cols, "}"));
  }
  return absl::OkStatus();
}

}  // namespace rastermask
