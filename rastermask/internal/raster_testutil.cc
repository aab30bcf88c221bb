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

#include "rastermask/internal/raster_testutil.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "rastermask/block_layout.h"
#include "rastermask/raster.h"
#include "rastermask/util/result.h"
#include "rastermask/util/status.h"
#include "rastermask/window.h"

namespace rastermask {
namespace internal_testing {

InMemoryRasterSource::InMemoryRasterSource(Shape shape, Shape block_shape,
                                           ValueFunction value)
    : shape_(shape),
      layout_(BlockLayout::Make(shape, block_shape).value()),
      value_(std::move(value)) {}

std::unique_ptr<InMemoryRasterSource> InMemoryRasterSource::FromValues(
    Shape shape, Shape block_shape, std::vector<double> values) {
  auto shared_values =
      std::make_shared<const std::vector<double>>(std::move(values));
  const Index cols = shape.cols;
  return std::make_unique<InMemoryRasterSource>(
      shape, block_shape, [shared_values, cols](Index row, Index col) {
        return (*shared_values)[row * cols + col];
      });
}

absl::Status InMemoryRasterSource::Read(const Window& window, Shape out_shape,
                                        absl::Span<double> values,
                                        absl::Span<uint8_t> validity) {
  if (fail_reads_from_ && num_read_attempts_++ >= *fail_reads_from_) {
    return read_error_;
  }
  RASTERMASK_RETURN_IF_ERROR(
      ValidateWindowAccess(shape_, window, out_shape, values.size()));
  if (!validity.empty() && validity.size() != values.size()) {
    return absl::InvalidArgumentError("Validity buffer size mismatch");
  }
  for (Index r = 0; r < out_shape.rows; ++r) {
    const Index row = window.row_offset +
                      NearestNeighborSourceIndex(r, window.height,
                                                 out_shape.rows);
    for (Index c = 0; c < out_shape.cols; ++c) {
      const Index col = window.col_offset +
                        NearestNeighborSourceIndex(c, window.width,
                                                   out_shape.cols);
      const Index i = r * out_shape.cols + c;
      values[i] = value_(row, col);
      if (!validity.empty()) {
        validity[i] = (!valid_ || valid_(row, col)) ? 255 : 0;
      }
    }
  }
  ++num_reads_;
  max_read_elements_ =
      std::max(max_read_elements_, out_shape.num_elements());
  max_read_window_elements_ =
      std::max(max_read_window_elements_, window.num_elements());
  if (event_log_) {
    event_log_->push_back(AccessEvent{AccessKind::kRead, window, out_shape});
  }
  return absl::OkStatus();
}

InMemoryRasterSink::InMemoryRasterSink(const RasterSinkSpec& spec,
                                       bool store_cells)
    : spec_(spec), store_cells_(store_cells) {
  if (store_cells_) {
    cells_.assign(spec_.shape.num_elements(),
                  static_cast<uint8_t>(spec_.nodata));
  }
}

absl::Status InMemoryRasterSink::Write(const Window& window,
                                       absl::Span<const uint8_t> mask) {
  if (closed_) {
    return absl::FailedPreconditionError("Write to closed sink");
  }
  RASTERMASK_RETURN_IF_ERROR(
      ValidateWindowAccess(spec_.shape, window, window.shape(), mask.size()));
  for (Index r = 0; r < window.height; ++r) {
    for (Index c = 0; c < window.width; ++c) {
      const uint8_t v = mask[r * window.width + c];
      ++value_counts_[v];
      if (store_cells_) {
        cells_[(window.row_offset + r) * spec_.shape.cols + window.col_offset +
               c] = v;
      }
    }
  }
  written_.push_back(window);
  if (event_log_) {
    event_log_->push_back(
        AccessEvent{AccessKind::kWrite, window, window.shape()});
  }
  return absl::OkStatus();
}

absl::Status InMemoryRasterSink::Close() {
  if (closed_) {
    return absl::FailedPreconditionError("Sink already closed");
  }
  closed_ = true;
  return absl::OkStatus();
}

namespace {

class ForwardingRasterSink : public RasterSink {
 public:
  explicit ForwardingRasterSink(RasterSink* target) : target_(target) {}

  absl::Status Write(const Window& window,
                     absl::Span<const uint8_t> mask) override {
    return target_->Write(window, mask);
  }
  absl::Status Close() override { return target_->Close(); }

 private:
  RasterSink* target_;
};

}  // namespace

RasterSinkFactory InMemoryRasterSinkFactory(
    std::unique_ptr<InMemoryRasterSink>* sink, bool store_cells) {
  return [sink, store_cells](const RasterSinkSpec& spec)
             -> Result<std::unique_ptr<RasterSink>> {
    *sink = std::make_unique<InMemoryRasterSink>(spec, store_cells);
    return std::unique_ptr<RasterSink>(
        std::make_unique<ForwardingRasterSink>(sink->get()));
  };
}

}  // namespace internal_testing
}  // namespace rastermask
