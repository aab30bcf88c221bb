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

#include "rastermask/driver/gdal/gdal_raster.h"

#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/base/call_once.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "rastermask/block_layout.h"
#include "rastermask/geo_transform.h"
#include "rastermask/index.h"
#include "rastermask/raster.h"
#include "rastermask/util/result.h"
#include "rastermask/util/status.h"
#include "rastermask/window.h"

#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <gdal.h>
#include <gdal_priv.h>

namespace rastermask {
namespace internal_gdal {

absl::Status GdalErrorToStatus(std::string_view action) {
  const CPLErrorNum error_no = CPLGetLastErrorNo();
  std::string message = absl::StrCat(action, ": ", CPLGetLastErrorMsg());
  switch (error_no) {
    case CPLE_OpenFailed:
      return absl::NotFoundError(message);
    case CPLE_NoWriteAccess:
      return absl::PermissionDeniedError(message);
    case CPLE_OutOfMemory:
      return absl::ResourceExhaustedError(message);
    case CPLE_FileIO:
      return absl::DataLossError(message);
    case CPLE_IllegalArg:
    case CPLE_NotSupported:
      return absl::InvalidArgumentError(message);
    default:
      return absl::UnknownError(message);
  }
}

}  // namespace internal_gdal

namespace {

using ::rastermask::internal_gdal::GdalErrorToStatus;

void RegisterGdalDrivers() {
  static absl::once_flag once;
  absl::call_once(once, [] { GDALAllRegister(); });
}

struct DatasetCloser {
  void operator()(GDALDataset* dataset) const {
    GDALClose(static_cast<GDALDatasetH>(dataset));
  }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

SampleType GetSampleType(GDALDataType type) {
  switch (type) {
    case GDT_Byte:
      return SampleType::kUint8;
#if GDAL_VERSION_NUM >= GDAL_COMPUTE_VERSION(3, 7, 0)
    case GDT_Int8:
      return SampleType::kInt8;
#endif
    case GDT_UInt16:
      return SampleType::kUint16;
    case GDT_Int16:
      return SampleType::kInt16;
    case GDT_UInt32:
      return SampleType::kUint32;
    case GDT_Int32:
      return SampleType::kInt32;
    case GDT_Float32:
      return SampleType::kFloat32;
    case GDT_Float64:
      return SampleType::kFloat64;
    default:
      return SampleType::kUnknown;
  }
}

// RasterIO takes `int` offsets and sizes.
absl::Status CheckIntRange(const Window& window, Shape out_shape) {
  constexpr Index kMax = std::numeric_limits<int>::max();
  if (window.row_end() > kMax || window.col_end() > kMax ||
      out_shape.rows > kMax || out_shape.cols > kMax) {
    return absl::OutOfRangeError(
        absl::StrCat("Window exceeds GDAL's addressable range: ",
                     window.row_end(), " x ", window.col_end()));
  }
  return absl::OkStatus();
}

class GdalRasterSource : public RasterSource {
 public:
  GdalRasterSource(DatasetPtr dataset, BlockLayout layout)
      : dataset_(std::move(dataset)),
        band_(dataset_->GetRasterBand(1)),
        layout_(layout) {}

  Shape shape() const override { return layout_.grid_shape(); }

  GeoTransform transform() const override {
    GeoTransform transform;
    if (dataset_->GetGeoTransform(transform.coefficients.data()) != CE_None) {
      return GeoTransform{};
    }
    return transform;
  }

  std::string projection() const override {
    const char* wkt = dataset_->GetProjectionRef();
    return wkt ? std::string(wkt) : std::string();
  }

  int band_count() const override { return dataset_->GetRasterCount(); }

  SampleType sample_type() const override {
    return GetSampleType(band_->GetRasterDataType());
  }

  BlockLayout block_layout() const override { return layout_; }

  absl::Status Read(const Window& window, Shape out_shape,
                    absl::Span<double> values,
                    absl::Span<uint8_t> validity) override {
    RASTERMASK_RETURN_IF_ERROR(
        ValidateWindowAccess(shape(), window, out_shape, values.size()));
    if (!validity.empty() && validity.size() != values.size()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Validity buffer of ", validity.size(),
                       " elements does not match ", values.size(),
                       " values"));
    }
    RASTERMASK_RETURN_IF_ERROR(CheckIntRange(window, out_shape));
    if (out_shape.empty()) return absl::OkStatus();

    GDALRasterIOExtraArg args;
    INIT_RASTERIO_EXTRA_ARG(args);
    args.eResampleAlg = GRIORA_NearestNeighbour;

    CPLErrorReset();
    if (band_->RasterIO(GF_Read, static_cast<int>(window.col_offset),
                        static_cast<int>(window.row_offset),
                        static_cast<int>(window.width),
                        static_cast<int>(window.height), values.data(),
                        static_cast<int>(out_shape.cols),
                        static_cast<int>(out_shape.rows), GDT_Float64, 0, 0,
                        &args) != CE_None) {
      return GdalErrorToStatus("RasterIO read failed");
    }
    if (!validity.empty()) {
      GDALRasterBand* mask_band = band_->GetMaskBand();
      if (mask_band->RasterIO(GF_Read, static_cast<int>(window.col_offset),
                              static_cast<int>(window.row_offset),
                              static_cast<int>(window.width),
                              static_cast<int>(window.height), validity.data(),
                              static_cast<int>(out_shape.cols),
                              static_cast<int>(out_shape.rows), GDT_Byte, 0, 0,
                              &args) != CE_None) {
        return GdalErrorToStatus("RasterIO mask read failed");
      }
    }
    ABSL_VLOG(1) << "Read " << window << " as " << out_shape << " from "
                 << dataset_->GetDescription();
    return absl::OkStatus();
  }

 private:
  DatasetPtr dataset_;
  GDALRasterBand* band_;
  BlockLayout layout_;
};

class GdalRasterSink : public RasterSink {
 public:
  GdalRasterSink(DatasetPtr dataset, Shape shape)
      : dataset_(std::move(dataset)),
        band_(dataset_->GetRasterBand(1)),
        shape_(shape) {}

  absl::Status Write(const Window& window,
                     absl::Span<const uint8_t> mask) override {
    if (!dataset_) {
      return absl::FailedPreconditionError("Write to closed GDAL sink");
    }
    RASTERMASK_RETURN_IF_ERROR(
        ValidateWindowAccess(shape_, window, window.shape(), mask.size()));
    RASTERMASK_RETURN_IF_ERROR(CheckIntRange(window, window.shape()));
    if (window.empty()) return absl::OkStatus();

    CPLErrorReset();
    // RasterIO does not modify the buffer for GF_Write.
    if (band_->RasterIO(GF_Write, static_cast<int>(window.col_offset),
                        static_cast<int>(window.row_offset),
                        static_cast<int>(window.width),
                        static_cast<int>(window.height),
                        const_cast<uint8_t*>(mask.data()),
                        static_cast<int>(window.width),
                        static_cast<int>(window.height), GDT_Byte, 0, 0,
                        nullptr) != CE_None) {
      return GdalErrorToStatus("RasterIO write failed");
    }
    return absl::OkStatus();
  }

  absl::Status Close() override {
    if (!dataset_) {
      return absl::FailedPreconditionError("GDAL sink already closed");
    }
    const std::string description = dataset_->GetDescription();
    CPLErrorReset();
    dataset_.reset();
    band_ = nullptr;
    if (CPLGetLastErrorType() == CE_Failure ||
        CPLGetLastErrorType() == CE_Fatal) {
      return GdalErrorToStatus(absl::StrCat("Closing ", description));
    }
    return absl::OkStatus();
  }

 private:
  DatasetPtr dataset_;
  GDALRasterBand* band_;
  Shape shape_;
};

}  // namespace

Result<std::unique_ptr<RasterSource>> OpenGdalRasterSource(
    const std::string& path) {
  RegisterGdalDrivers();
  CPLErrorReset();
  DatasetPtr dataset(static_cast<GDALDataset*>(
      GDALOpenEx(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr,
                 nullptr, nullptr)));
  if (!dataset) {
    absl::Status status = GdalErrorToStatus(absl::StrCat("Opening ", path));
    if (status.code() == absl::StatusCode::kUnknown) {
      return absl::NotFoundError(status.message());
    }
    return status;
  }
  if (dataset->GetRasterCount() < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("Raster has no bands: ", path));
  }
  GDALRasterBand* band = dataset->GetRasterBand(1);
  int block_cols = 0, block_rows = 0;
  band->GetBlockSize(&block_cols, &block_rows);
  RASTERMASK_ASSIGN_OR_RETURN(
      BlockLayout layout,
      BlockLayout::Make(
          Shape{dataset->GetRasterYSize(), dataset->GetRasterXSize()},
          Shape{block_rows, block_cols}),
      MaybeAnnotateStatus(_, absl::StrCat("Opening ", path)));
  ABSL_VLOG(1) << "Opened " << path << " with layout " << layout << ", "
               << dataset->GetRasterCount() << " band(s), "
               << GetSampleType(band->GetRasterDataType());
  return std::unique_ptr<RasterSource>(
      std::make_unique<GdalRasterSource>(std::move(dataset), layout));
}

Result<std::unique_ptr<RasterSink>> CreateGdalRasterSink(
    const std::string& path, const RasterSinkSpec& spec) {
  if (spec.sample_type != SampleType::kUint8 || spec.band_count != 1) {
    return absl::InvalidArgumentError(
        "GDAL sink supports only single-band uint8 output");
  }
  constexpr Index kMax = std::numeric_limits<int>::max();
  if (spec.shape.empty() || spec.shape.rows > kMax || spec.shape.cols > kMax) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid output shape {", spec.shape.rows, ", ", spec.shape.cols,
        "}"));
  }
  RegisterGdalDrivers();
  GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
  if (driver == nullptr) {
    return absl::UnimplementedError("GDAL GTiff driver is not available");
  }

  CPLStringList options;
  options.SetNameValue("COMPRESS", spec.compression.c_str());
  if (spec.tiled) {
    options.SetNameValue("TILED", "YES");
    options.SetNameValue("BLOCKXSIZE",
                         absl::StrCat(spec.tile_shape.cols).c_str());
    options.SetNameValue("BLOCKYSIZE",
                         absl::StrCat(spec.tile_shape.rows).c_str());
  }

  CPLErrorReset();
  DatasetPtr dataset(driver->Create(
      path.c_str(), static_cast<int>(spec.shape.cols),
      static_cast<int>(spec.shape.rows), spec.band_count, GDT_Byte,
      options.List()));
  if (!dataset) {
    return GdalErrorToStatus(absl::StrCat("Creating ", path));
  }

  // Closes and deletes the partially initialized file.
  auto discard = [&](absl::Status status) {
    dataset.reset();
    if (driver->Delete(path.c_str()) != CE_None) {
      ABSL_LOG(WARNING) << "Failed to delete partially created " << path;
    }
    return status;
  };
  std::array<double, 6> transform = spec.transform.coefficients;
  if (dataset->SetGeoTransform(transform.data()) != CE_None) {
    return discard(
        GdalErrorToStatus(absl::StrCat("Setting geotransform of ", path)));
  }
  if (!spec.projection.empty() &&
      dataset->SetProjection(spec.projection.c_str()) != CE_None) {
    return discard(
        GdalErrorToStatus(absl::StrCat("Setting projection of ", path)));
  }
  GDALRasterBand* band = dataset->GetRasterBand(1);
  if (band->SetNoDataValue(spec.nodata) != CE_None) {
    return discard(
        GdalErrorToStatus(absl::StrCat("Setting no-data value of ", path)));
  }
  ABSL_VLOG(1) << "Created " << path << ": " << spec;
  return std::unique_ptr<RasterSink>(
      std::make_unique<GdalRasterSink>(std::move(dataset), spec.shape));
}

RasterSinkFactory GdalRasterSinkFactory(std::string path) {
  return [path = std::move(path)](const RasterSinkSpec& spec) {
    return CreateGdalRasterSink(path, spec);
  };
}

}  // namespace rastermask
