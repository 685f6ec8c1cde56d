/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#include <cstdint>
#include <limits>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "decima/decimal.h"
#include "decima/decimal_properties.h"
#include "decima/rounding_mode.h"
#include "decima/test/matchers.h"

namespace decima {

namespace {

struct RoundingParam {
  std::string input;
  int32_t scale;
  RoundingMode mode;
  std::string expected;
};

class RoundingTest : public ::testing::TestWithParam<RoundingParam> {};

}  // namespace

TEST_P(RoundingTest, Round) {
  const auto& param = GetParam();
  auto rounded = Decimal(param.input).Round(param.scale, param.mode);
  EXPECT_THAT(rounded, HasDecimalString(param.expected))
      << param.input << " at scale " << param.scale << " (" << ToString(param.mode)
      << ")";
}

INSTANTIATE_TEST_SUITE_P(
    HalfUp, RoundingTest,
    ::testing::Values(RoundingParam{"2.5", 0, RoundingMode::kHalfUp, "3"},
                      RoundingParam{"-2.5", 0, RoundingMode::kHalfUp, "-3"},
                      RoundingParam{"2.4", 0, RoundingMode::kHalfUp, "2"},
                      RoundingParam{"0.5", 0, RoundingMode::kHalfUp, "1"},
                      RoundingParam{"-0.4", 0, RoundingMode::kHalfUp, "0"},
                      RoundingParam{"1.005", 2, RoundingMode::kHalfUp, "1.01"},
                      RoundingParam{"1.004", 2, RoundingMode::kHalfUp, "1.00"},
                      RoundingParam{"-1.005", 2, RoundingMode::kHalfUp, "-1.01"},
                      RoundingParam{"123.456", 1, RoundingMode::kHalfUp, "123.5"},
                      RoundingParam{"9.99", 1, RoundingMode::kHalfUp, "10.0"},
                      RoundingParam{"1.5", 3, RoundingMode::kHalfUp, "1.500"},
                      RoundingParam{"7", 0, RoundingMode::kHalfUp, "7"}));

INSTANTIATE_TEST_SUITE_P(
    Floor, RoundingTest,
    ::testing::Values(RoundingParam{"1.2", 0, RoundingMode::kFloor, "1"},
                      RoundingParam{"-1.2", 0, RoundingMode::kFloor, "-2"},
                      RoundingParam{"3.0", 0, RoundingMode::kFloor, "3"},
                      RoundingParam{"0.5", 0, RoundingMode::kFloor, "0"},
                      RoundingParam{"1.234", 2, RoundingMode::kFloor, "1.23"},
                      RoundingParam{"-1.234", 2, RoundingMode::kFloor, "-1.24"},
                      RoundingParam{"-1.230", 2, RoundingMode::kFloor, "-1.23"},
                      RoundingParam{"1.2", 3, RoundingMode::kFloor, "1.200"}));

INSTANTIATE_TEST_SUITE_P(
    Ceil, RoundingTest,
    ::testing::Values(RoundingParam{"1.2", 0, RoundingMode::kCeil, "2"},
                      RoundingParam{"-1.2", 0, RoundingMode::kCeil, "-1"},
                      RoundingParam{"3.0", 0, RoundingMode::kCeil, "3"},
                      RoundingParam{"-0.5", 0, RoundingMode::kCeil, "0"},
                      RoundingParam{"1.234", 2, RoundingMode::kCeil, "1.24"},
                      RoundingParam{"-1.234", 2, RoundingMode::kCeil, "-1.23"},
                      RoundingParam{"9.99", 1, RoundingMode::kCeil, "10.0"}));

TEST(DecimalRoundingTest, FloorAndCeil) {
  EXPECT_THAT(Decimal("1.7").Floor(), HasDecimalString("1"));
  EXPECT_THAT(Decimal("-1.7").Floor(), HasDecimalString("-2"));
  EXPECT_THAT(Decimal("1.2").Ceil(), HasDecimalString("2"));
  EXPECT_THAT(Decimal("-1.7").Ceil(), HasDecimalString("-1"));
  EXPECT_THAT(Decimal("5").Floor(), HasDecimalString("5"));

  auto ceil = Decimal("-0.5").Ceil();
  ASSERT_THAT(ceil, IsOk());
  EXPECT_FALSE(ceil->IsNegative());
}

TEST(DecimalRoundingTest, RoundedResultHasRequestedScale) {
  for (int32_t scale = 0; scale < 5; ++scale) {
    auto rounded = Decimal("-3.14159").Round(scale);
    ASSERT_THAT(rounded, IsOk());
    EXPECT_EQ(rounded->scale(), scale);
  }
}

TEST(DecimalRoundingTest, NegativeScale) {
  EXPECT_THAT(Decimal("1.5").Round(-1), IsError(ErrorKind::kInvalidInput));
  EXPECT_THAT(Decimal("1.5").Round(-1, RoundingMode::kFloor),
              IsError(ErrorKind::kInvalidInput));
  EXPECT_THAT(Decimal("1.5").Truncate(-1), IsError(ErrorKind::kInvalidInput));
}

TEST(DecimalRoundingTest, ScaleBeyondDigitLimit) {
  constexpr int32_t kScale = std::numeric_limits<int32_t>::max();
  EXPECT_THAT(Decimal("1.5").Round(kScale), IsError(ErrorKind::kOverflow));
  EXPECT_THAT(Decimal("1.5").Round(kScale, RoundingMode::kCeil),
              IsError(ErrorKind::kOverflow));
}

TEST(DecimalRoundingTest, RoundWithProperties) {
  DecimalProperties props;
  EXPECT_THAT(Decimal("1.25").Round(1, props), HasDecimalString("1.3"));

  props.Set(DecimalProperties::kRoundingMode, RoundingMode::kFloor);
  EXPECT_THAT(Decimal("1.29").Round(1, props), HasDecimalString("1.2"));

  props.Set(DecimalProperties::kRoundingMode, RoundingMode::kCeil);
  EXPECT_THAT(Decimal("1.21").Round(1, props), HasDecimalString("1.3"));
}

TEST(DecimalRoundingTest, RoundWithPropertiesFromMap) {
  auto props = DecimalProperties::FromMap({{"decimal.rounding-mode", "FLOOR"}});
  ASSERT_THAT(props, IsOk());
  EXPECT_THAT(Decimal("-2.5").Round(0, *props), HasDecimalString("-3"));
}

TEST(DecimalRoundingTest, Truncate) {
  EXPECT_THAT(Decimal("1.999").Truncate(), HasDecimalString("1"));
  EXPECT_THAT(Decimal("1.999").Truncate(2), HasDecimalString("1.99"));
  EXPECT_THAT(Decimal("-1.999").Truncate(1), HasDecimalString("-1.9"));
  EXPECT_THAT(Decimal("1.5").Truncate(5), HasDecimalString("1.5"));

  auto truncated = Decimal("-0.09").Truncate(1);
  ASSERT_THAT(truncated, IsOk());
  EXPECT_EQ(truncated->ToString(), "0.0");
  EXPECT_FALSE(truncated->IsNegative());
}

TEST(RoundingModeTest, FromString) {
  EXPECT_THAT(RoundingModeFromString("half-up"), HasValue(RoundingMode::kHalfUp));
  EXPECT_THAT(RoundingModeFromString("Ceil"), HasValue(RoundingMode::kCeil));
  EXPECT_THAT(RoundingModeFromString("FLOOR"), HasValue(RoundingMode::kFloor));
  EXPECT_THAT(RoundingModeFromString("bankers"), IsError(ErrorKind::kInvalidInput));
  EXPECT_THAT(RoundingModeFromString("bankers"), HasErrorMessage("bankers"));
}

TEST(RoundingModeTest, ToStringRoundTrips) {
  for (auto mode : {RoundingMode::kHalfUp, RoundingMode::kCeil, RoundingMode::kFloor}) {
    EXPECT_THAT(RoundingModeFromString(ToString(mode)), HasValue(mode));
  }
}

}  // namespace decima
