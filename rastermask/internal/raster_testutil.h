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

#ifndef RASTERMASK_INTERNAL_RASTER_TESTUTIL_H_
#define RASTERMASK_INTERNAL_RASTER_TESTUTIL_H_

/// \file
/// In-memory `RasterSource` and `RasterSink` implementations for tests.
///
/// Both record every access so that tests can check which windows were read
/// and written, how many samples each request covered, and in what order
/// reads and writes were interleaved.

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "rastermask/block_layout.h"
#include "rastermask/geo_transform.h"
#include "rastermask/index.h"
#include "rastermask/raster.h"
#include "rastermask/util/result.h"
#include "rastermask/window.h"

namespace rastermask {
namespace internal_testing {

/// Kind of a recorded raster access.
enum class AccessKind { kRead, kWrite };

struct AccessEvent {
  AccessKind kind;
  Window window;
  Shape out_shape;
};

/// Source whose sample values are produced by a function of the pixel
/// position, so that grids far larger than memory can be represented.
class InMemoryRasterSource : public RasterSource {
 public:
  using ValueFunction = std::function<double(Index row, Index col)>;
  using ValidityFunction = std::function<bool(Index row, Index col)>;

  /// Constructs a source of `shape` with blocks of `block_shape` whose sample
  /// at `(row, col)` is `value(row, col)`.
  InMemoryRasterSource(Shape shape, Shape block_shape, ValueFunction value);

  /// Constructs a source from row-major `values` of `shape`.
  static std::unique_ptr<InMemoryRasterSource> FromValues(
      Shape shape, Shape block_shape, std::vector<double> values);

  /// Marks samples for which `valid(row, col)` is `false` as no-data.
  void set_validity(ValidityFunction valid) { valid_ = std::move(valid); }

  void set_transform(const GeoTransform& transform) { transform_ = transform; }
  void set_projection(std::string projection) {
    projection_ = std::move(projection);
  }
  void set_sample_type(SampleType sample_type) { sample_type_ = sample_type; }

  /// Causes the `n`-th read (0-based) and all later reads to fail with
  /// `status`.
  void FailReadsFrom(Index n, absl::Status status) {
    fail_reads_from_ = n;
    read_error_ = std::move(status);
  }

  Shape shape() const override { return shape_; }
  GeoTransform transform() const override { return transform_; }
  std::string projection() const override { return projection_; }
  int band_count() const override { return 1; }
  SampleType sample_type() const override { return sample_type_; }
  BlockLayout block_layout() const override { return layout_; }

  absl::Status Read(const Window& window, Shape out_shape,
                    absl::Span<double> values,
                    absl::Span<uint8_t> validity) override;

  /// Number of successful reads.
  Index num_reads() const { return num_reads_; }

  /// Largest number of samples returned by a single read.
  Index max_read_elements() const { return max_read_elements_; }

  /// Largest source window area covered by a single read.
  Index max_read_window_elements() const { return max_read_window_elements_; }

  /// Optional shared log receiving an event for each read.
  void set_event_log(std::vector<AccessEvent>* log) { event_log_ = log; }

 private:
  Shape shape_;
  BlockLayout layout_;
  ValueFunction value_;
  ValidityFunction valid_;
  GeoTransform transform_;
  std::string projection_;
  SampleType sample_type_ = SampleType::kFloat64;
  std::optional<Index> fail_reads_from_;
  absl::Status read_error_;
  Index num_reads_ = 0;
  Index num_read_attempts_ = 0;
  Index max_read_elements_ = 0;
  Index max_read_window_elements_ = 0;
  std::vector<AccessEvent>* event_log_ = nullptr;
};

/// Sink that either stores every cell of the output grid, or, for large grids,
/// only records the written windows and the number of cells set to each
/// value.
class InMemoryRasterSink : public RasterSink {
 public:
  /// Constructs a sink for `spec`.  If `store_cells` is `true`, the full grid
  /// is allocated and initialized to `spec.nodata`.
  explicit InMemoryRasterSink(const RasterSinkSpec& spec,
                              bool store_cells = true);

  absl::Status Write(const Window& window,
                     absl::Span<const uint8_t> mask) override;
  absl::Status Close() override;

  const RasterSinkSpec& spec() const { return spec_; }
  bool closed() const { return closed_; }

  /// Row-major cells of the output grid.  Empty unless storing cells.
  const std::vector<uint8_t>& cells() const { return cells_; }

  /// Windows written, in order.
  const std::vector<Window>& written_windows() const { return written_; }

  /// Number of written cells equal to `value`, over all writes.
  Index CountWritten(uint8_t value) const { return value_counts_[value]; }

  void set_event_log(std::vector<AccessEvent>* log) { event_log_ = log; }

 private:
  RasterSinkSpec spec_;
  bool store_cells_;
  bool closed_ = false;
  std::vector<uint8_t> cells_;
  std::vector<Window> written_;
  Index value_counts_[256] = {};
  std::vector<AccessEvent>* event_log_ = nullptr;
};

/// Returns a factory that constructs `*sink` from the requested spec and
/// returns a sink forwarding to it, so that `*sink` outlives the run.
///
/// `*sink` remains null if the factory is never invoked.
RasterSinkFactory InMemoryRasterSinkFactory(
    std::unique_ptr<InMemoryRasterSink>* sink, bool store_cells = true);

}  // namespace internal_testing
}  // namespace rastermask

#endif  // RASTERMASK_INTERNAL_RASTER_TESTUTIL_H_
