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

#include "rastermask/mask_options.h"

#include <limits>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "rastermask/util/status_testutil.h"
#include "rastermask/window.h"

namespace {

using ::nlohmann::json;
using ::rastermask::MaskOptions;
using ::rastermask::MatchesStatus;
using ::rastermask::Shape;

TEST(MaskOptionsTest, Defaults) {
  MaskOptions options;
  EXPECT_EQ(0.4, options.threshold);
  EXPECT_FALSE(options.downsample_factor.has_value());
  EXPECT_EQ(1, options.effective_downsample_factor());
  EXPECT_EQ("LZW", options.compression);
  EXPECT_TRUE(options.tiled);
  EXPECT_EQ((Shape{256, 256}), options.tile_shape);
  RASTERMASK_EXPECT_OK(options.Validate());
}

TEST(MaskOptionsTest, EffectiveDownsampleFactor) {
  MaskOptions options;
  options.downsample_factor = 0;
  EXPECT_EQ(1, options.effective_downsample_factor());
  options.downsample_factor = 1;
  EXPECT_EQ(1, options.effective_downsample_factor());
  options.downsample_factor = 8;
  EXPECT_EQ(8, options.effective_downsample_factor());
}

TEST(MaskOptionsTest, Validate) {
  MaskOptions options;
  options.threshold = std::numeric_limits<double>::infinity();
  EXPECT_THAT(options.Validate(),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "threshold must be finite.*"));

  options = MaskOptions{};
  options.downsample_factor = -2;
  EXPECT_THAT(options.Validate(),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "downsample_factor must be non-negative.*"));

  options = MaskOptions{};
  options.compression = "JPEG";
  EXPECT_THAT(options.Validate(),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Unsupported compression \"JPEG\".*"));

  options = MaskOptions{};
  options.tile_shape = Shape{100, 256};
  EXPECT_THAT(options.Validate(),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "tile_shape must be positive multiples of 16.*"));

  // Tile shape is ignored for striped output.
  options.tiled = false;
  RASTERMASK_EXPECT_OK(options.Validate());
}

TEST(MaskOptionsTest, ThresholdOutsideUnitIntervalIsAccepted) {
  MaskOptions options;
  options.threshold = 1.5;
  RASTERMASK_EXPECT_OK(options.Validate());
  options.threshold = -0.25;
  RASTERMASK_EXPECT_OK(options.Validate());
}

TEST(MaskOptionsTest, FromJson) {
  RASTERMASK_ASSERT_OK_AND_ASSIGN(
      MaskOptions options,
      MaskOptions::FromJson(json{{"threshold", 0.25},
                                 {"downsample_factor", 4},
                                 {"compression", "deflate"},
                                 {"tiled", true},
                                 {"tile_shape", {512, 128}}}));
  EXPECT_EQ(0.25, options.threshold);
  EXPECT_EQ(4, options.downsample_factor.value_or(-1));
  EXPECT_EQ("DEFLATE", options.compression);
  EXPECT_EQ((Shape{512, 128}), options.tile_shape);
}

TEST(MaskOptionsTest, FromJsonEmptyObjectGivesDefaults) {
  EXPECT_THAT(MaskOptions::FromJson(json::object()),
              ::rastermask::IsOkAndHolds(MaskOptions{}));
}

TEST(MaskOptionsTest, FromJsonNullDownsampleFactor) {
  EXPECT_THAT(MaskOptions::FromJson(json{{"downsample_factor", nullptr}}),
              ::rastermask::IsOkAndHolds(MaskOptions{}));
}

TEST(MaskOptionsTest, FromJsonErrors) {
  EXPECT_THAT(MaskOptions::FromJson(json(3)),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Expected object, but received: 3"));
  EXPECT_THAT(MaskOptions::FromJson(json{{"bogus", 1}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Object includes extra members: \"bogus\""));
  EXPECT_THAT(
      MaskOptions::FromJson(json{{"threshold", "high"}}),
      MatchesStatus(absl::StatusCode::kInvalidArgument,
                    "Error parsing object member \"threshold\": "
                    "Expected number, but received: \"high\""));
  EXPECT_THAT(MaskOptions::FromJson(json{{"downsample_factor", 2.5}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Error parsing object member "
                            "\"downsample_factor\": Expected integer.*"));
  EXPECT_THAT(MaskOptions::FromJson(json{{"tiled", 1}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Error parsing object member \"tiled\": "
                            "Expected boolean.*"));
  EXPECT_THAT(MaskOptions::FromJson(json{{"tile_shape", json::array({256})}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Error parsing object member \"tile_shape\": "
                            "Expected array of 2 integers.*"));
  EXPECT_THAT(MaskOptions::FromJson(json{{"compression", "rle"}}),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Unsupported compression \"RLE\".*"));
}

TEST(MaskOptionsTest, ToJson) {
  MaskOptions options;
  EXPECT_EQ(json({{"threshold", 0.4},
                  {"compression", "LZW"},
                  {"tiled", true},
                  {"tile_shape", {256, 256}}}),
            options.ToJson());
  options.downsample_factor = 2;
  EXPECT_EQ(2, options.ToJson()["downsample_factor"]);
}

TEST(MaskOptionsTest, ParseFlag) {
  MaskOptions options;
  std::string error;
  EXPECT_TRUE(AbslParseFlag(R"({"threshold": 0.6, "compression": "zstd"})",
                            &options, &error));
  EXPECT_EQ(0.6, options.threshold);
  EXPECT_EQ("ZSTD", options.compression);

  EXPECT_TRUE(AbslParseFlag("", &options, &error));
  EXPECT_EQ(MaskOptions{}, options);

  EXPECT_FALSE(AbslParseFlag("{not json", &options, &error));
  EXPECT_EQ("Failed to parse JSON", error);

  EXPECT_FALSE(AbslParseFlag(R"({"tiled": "yes"})", &options, &error));
  EXPECT_THAT(error, ::testing::HasSubstr("Expected boolean"));
}

TEST(MaskOptionsTest, UnparseFlag) {
  MaskOptions options;
  options.threshold = 0.5;
  options.downsample_factor = 3;
  MaskOptions parsed;
  std::string error;
  ASSERT_TRUE(AbslParseFlag(AbslUnparseFlag(options), &parsed, &error))
      << error;
  EXPECT_EQ(options, parsed);
}

}  // namespace
