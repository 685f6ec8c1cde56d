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

#include "decima/decimal.h"

#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "decima/exception.h"
#include "decima/test/matchers.h"
#include "decima/util/formatter.h"

namespace decima {

namespace {

void AssertParsed(std::string_view input, std::string_view expected_integral,
                  std::string_view expected_fractional, bool expected_negative) {
  auto result = Decimal::Make(input);
  ASSERT_THAT(result, IsOk()) << "input: " << input;
  EXPECT_EQ(result->integral_part(), expected_integral) << "input: " << input;
  EXPECT_EQ(result->fractional_part(), expected_fractional) << "input: " << input;
  EXPECT_EQ(result->IsNegative(), expected_negative) << "input: " << input;
  EXPECT_EQ(result->scale(), static_cast<int32_t>(expected_fractional.size()))
      << "input: " << input;
}

class Price : public util::Formattable {
 public:
  std::string ToString() const override { return "19.99"; }
};

}  // namespace

TEST(DecimalTest, ParsePlainInteger) {
  AssertParsed("123", "123", "", false);
  AssertParsed("-42", "42", "", true);
  AssertParsed("+7", "7", "", false);
  AssertParsed("007", "7", "", false);
  AssertParsed("-007", "7", "", true);
  AssertParsed("0", "0", "", false);
  AssertParsed("0000", "0", "", false);
}

TEST(DecimalTest, ParseFixedPoint) {
  AssertParsed("1.50", "1", "50", false);
  AssertParsed(".5", "0", "5", false);
  AssertParsed("-.5", "0", "5", true);
  AssertParsed("+.25", "0", "25", false);
  AssertParsed("5.", "5", "", false);
  AssertParsed("00.25", "0", "25", false);
  AssertParsed("-0012.340", "12", "340", true);
}

TEST(DecimalTest, ParseScientific) {
  AssertParsed("1.005e2", "100", "5", false);
  AssertParsed("1.5e-3", "0", "0015", false);
  AssertParsed("2E+4", "20000", "", false);
  AssertParsed("-1.23e-8", "0", "0000000123", true);
  AssertParsed("1.0e-2", "0", "01", false);
  AssertParsed("1.50e1", "15", "0", false);
  AssertParsed("12.5e-1", "1", "25", false);
  AssertParsed(".5e1", "5", "", false);
  AssertParsed("1e0", "1", "", false);
  AssertParsed("0e5", "0", "", false);
}

TEST(DecimalTest, ParseRejectsOversizedExponent) {
  EXPECT_THAT(Decimal::Make("1e2000000000"), IsError(ErrorKind::kOverflow));
  EXPECT_THAT(Decimal::Make("-1.5e-2000000000"), IsError(ErrorKind::kOverflow));
  EXPECT_THAT(Decimal::Make(std::format("1e{}", ArithmeticEngine::kMaxDigits)),
              IsError(ErrorKind::kOverflow));

  auto largest = Decimal::Make(std::format("1e{}", ArithmeticEngine::kMaxDigits - 1));
  ASSERT_THAT(largest, IsOk());
  EXPECT_EQ(largest->integral_part().size(),
            static_cast<size_t>(ArithmeticEngine::kMaxDigits));
}

TEST(DecimalTest, ParseTrimsWhitespace) {
  EXPECT_THAT(Decimal::Make("  3.14\n"), HasDecimalString("3.14"));
  EXPECT_THAT(Decimal::Make("\t-8 "), HasDecimalString("-8"));
}

TEST(DecimalTest, ParseRejectsMalformedInput) {
  for (const auto* input : {"", "   ", "abc", "1.2.3", "--1", "+-1", "1e", "e5", "1e1.5",
                            "0x1A", "1,5", ".", "-", "12a", "1 2", "1e-", "NaN"}) {
    EXPECT_THAT(Decimal::Make(input), IsError(ErrorKind::kInvalidInput))
        << "input: '" << input << "'";
  }
}

TEST(DecimalTest, NegativeZeroIsZero) {
  for (const auto* input : {"-0", "-0.00", "-0e3", "-.0"}) {
    auto result = Decimal::Make(input);
    ASSERT_THAT(result, IsOk());
    EXPECT_TRUE(result->IsZero()) << input;
    EXPECT_FALSE(result->IsNegative()) << input;
    EXPECT_EQ(result->Sign(), 0) << input;
  }
  EXPECT_THAT(Decimal::Make("-0"), HasDecimalString("0"));
  EXPECT_THAT(Decimal::Make("-0.00"), HasDecimalString("0.00"));
}

TEST(DecimalTest, ExplicitScalePadsAndTruncates) {
  EXPECT_THAT(Decimal::Make("1.5", 3), HasDecimalString("1.500"));
  EXPECT_THAT(Decimal::Make("7", 2), HasDecimalString("7.00"));
  EXPECT_THAT(Decimal::Make("1.2345", 2), HasDecimalString("1.23"));
  EXPECT_THAT(Decimal::Make("1.2345", 2, false), HasDecimalString("1.23"));
  EXPECT_THAT(Decimal::Make("9.99", 0), HasDecimalString("9"));
  EXPECT_THAT(Decimal::Make("1.5e-3", 2), HasDecimalString("0.00"));
  EXPECT_THAT(Decimal::Make("1.5e-3", 6), HasDecimalString("0.001500"));

  auto truncated_to_zero = Decimal::Make("-0.001", 2);
  ASSERT_THAT(truncated_to_zero, IsOk());
  EXPECT_EQ(truncated_to_zero->ToString(), "0.00");
  EXPECT_FALSE(truncated_to_zero->IsNegative());
  EXPECT_EQ(truncated_to_zero->scale(), 2);
}

TEST(DecimalTest, StrictScaleRejectsPrecisionLoss) {
  auto result = Decimal::Make("1.2345", 2, true);
  EXPECT_THAT(result, IsError(ErrorKind::kPrecisionLoss));
  EXPECT_THAT(result, HasErrorMessage("Detected scale `4` > `2`"));

  EXPECT_THAT(Decimal::Make("1.005e2", 0, true), IsError(ErrorKind::kPrecisionLoss));
  EXPECT_THAT(Decimal::Make("1.20", 2, true), HasDecimalString("1.20"));
  EXPECT_THAT(Decimal::Make("1.2", 4, true), HasDecimalString("1.2000"));
}

TEST(DecimalTest, NegativeScaleIsInvalid) {
  EXPECT_THAT(Decimal::Make("1", -1), IsError(ErrorKind::kInvalidInput));
}

TEST(DecimalTest, ScaleBeyondDigitLimit) {
  EXPECT_THAT(Decimal::Make("1", 2000000000), IsError(ErrorKind::kOverflow));
  EXPECT_THAT(Decimal::Make("1", ArithmeticEngine::kMaxDigits + 1),
              IsError(ErrorKind::kOverflow));
}

TEST(DecimalTest, MakeFromIntegers) {
  EXPECT_THAT(Decimal::Make(42), HasDecimalString("42"));
  EXPECT_THAT(Decimal::Make(-17L), HasDecimalString("-17"));
  EXPECT_THAT(Decimal::Make(0), HasDecimalString("0"));
  EXPECT_THAT(Decimal::Make(std::numeric_limits<int64_t>::min()),
              HasDecimalString("-9223372036854775808"));
  EXPECT_THAT(Decimal::Make(std::numeric_limits<uint64_t>::max()),
              HasDecimalString("18446744073709551615"));
  EXPECT_THAT(Decimal::Make(5, 2), HasDecimalString("5.00"));
}

TEST(DecimalTest, MakeFromFloatingPoint) {
  EXPECT_THAT(Decimal::Make(0.1), HasDecimalString("0.1"));
  EXPECT_THAT(Decimal::Make(0.1f), HasDecimalString("0.1"));
  EXPECT_THAT(Decimal::Make(-2.5), HasDecimalString("-2.5"));
  EXPECT_THAT(Decimal::Make(1e25), HasDecimalString("10000000000000000000000000"));
  EXPECT_THAT(Decimal::Make(1.5, 3), HasDecimalString("1.500"));
  EXPECT_THAT(Decimal::Make(std::numeric_limits<double>::quiet_NaN()),
              IsError(ErrorKind::kInvalidInput));
  EXPECT_THAT(Decimal::Make(std::numeric_limits<double>::infinity()),
              IsError(ErrorKind::kInvalidInput));
}

TEST(DecimalTest, MakeFromFormattable) {
  EXPECT_THAT(Decimal::Make(Price{}), HasDecimalString("19.99"));
  EXPECT_THAT(Decimal::Make(Price{}, 1), HasDecimalString("19.9"));
  EXPECT_THAT(Decimal::Make(DebugInfo("1.5", 1)), IsError(ErrorKind::kInvalidInput));
}

TEST(DecimalTest, MakeFromDecimal) {
  Decimal original("1.5");
  EXPECT_THAT(Decimal::Make(original), HasDecimalString("1.5"));
  EXPECT_THAT(Decimal::Make(original, 4), HasDecimalString("1.5000"));
  EXPECT_THAT(Decimal::Make(Decimal("1.234"), 2, true),
              IsError(ErrorKind::kPrecisionLoss));
  EXPECT_EQ(original.ToString(), "1.5");
}

TEST(DecimalTest, MakeWithProperties) {
  DecimalProperties props;
  EXPECT_THAT(Decimal::Make("3.14159", props), HasDecimalString("3.14159"));

  props.Set(DecimalProperties::kScale, 2);
  EXPECT_THAT(Decimal::Make("3.14159", props), HasDecimalString("3.14"));

  props.Set(DecimalProperties::kStrict, true);
  EXPECT_THAT(Decimal::Make("3.14159", props), IsError(ErrorKind::kPrecisionLoss));
  EXPECT_THAT(Decimal::Make(3, props), HasDecimalString("3.00"));
}

TEST(DecimalTest, ThrowingConstructor) {
  EXPECT_NO_THROW(Decimal("12.5"));
  EXPECT_EQ(Decimal("12.5").ToString(), "12.5");
  EXPECT_THROW(Decimal("abc"), DecimaError);
  EXPECT_THROW(Decimal(""), DecimaError);
}

TEST(DecimalTest, DefaultIsZero) {
  Decimal zero;
  EXPECT_TRUE(zero.IsZero());
  EXPECT_EQ(zero.ToString(), "0");
  EXPECT_EQ(zero.scale(), 0);
  EXPECT_EQ(zero.engine()->name(), "cpp_int");
}

TEST(DecimalTest, Trim) {
  Decimal value("1.2300");
  Decimal trimmed = value.Trim();
  EXPECT_EQ(trimmed.ToString(), "1.23");
  EXPECT_EQ(trimmed.scale(), 2);
  EXPECT_EQ(value.ToString(), "1.2300");
  EXPECT_EQ(value.scale(), 4);

  EXPECT_EQ(Decimal("5.000").Trim().ToString(), "5");
  EXPECT_EQ(Decimal("5.000").Trim().scale(), 0);
  EXPECT_EQ(Decimal("-100").Trim().ToString(), "-100");
}

TEST(DecimalTest, AbsoluteAndNegate) {
  Decimal value("-3.5");
  EXPECT_EQ(value.Absolute().ToString(), "3.5");
  EXPECT_EQ(value.Negate().ToString(), "3.5");
  EXPECT_EQ(value.Negate().Negate().ToString(), "-3.5");
  EXPECT_EQ(Decimal("3.5").Negate().ToString(), "-3.5");
  EXPECT_EQ(Decimal("3.5").Absolute().ToString(), "3.5");
  EXPECT_EQ(value.ToString(), "-3.5");

  Decimal zero("0.0");
  EXPECT_FALSE(zero.Negate().IsNegative());
  EXPECT_EQ(zero.Negate().ToString(), "0.0");
  EXPECT_EQ((-Decimal("2")).ToString(), "-2");
}

TEST(DecimalTest, SignAndPredicates) {
  EXPECT_EQ(Decimal("0.00").Sign(), 0);
  EXPECT_EQ(Decimal("-0.01").Sign(), -1);
  EXPECT_EQ(Decimal("12").Sign(), 1);

  EXPECT_TRUE(Decimal("5.000").IsInteger());
  EXPECT_TRUE(Decimal("5").IsInteger());
  EXPECT_FALSE(Decimal("5.001").IsInteger());

  EXPECT_TRUE(Decimal("0.000").IsZero());
  EXPECT_FALSE(Decimal("0.001").IsZero());
  EXPECT_FALSE(Decimal("10").IsZero());

  EXPECT_TRUE(Decimal("0.001").IsPositive());
  EXPECT_FALSE(Decimal("0").IsPositive());
  EXPECT_FALSE(Decimal("-1").IsPositive());
  EXPECT_TRUE(Decimal("-1").IsNegative());
  EXPECT_FALSE(Decimal("0").IsNegative());
}

TEST(DecimalTest, BigIntegerAndBigDecimal) {
  EXPECT_FALSE(Decimal("9223372036854775807").IsBigInteger());
  EXPECT_TRUE(Decimal("9223372036854775808").IsBigInteger());
  EXPECT_FALSE(Decimal("-9223372036854775808").IsBigInteger());
  EXPECT_TRUE(Decimal("-9223372036854775809").IsBigInteger());

  EXPECT_TRUE(Decimal("9223372036854775808").IsBigDecimal());
  EXPECT_TRUE(Decimal("1.9223372036854775808").IsBigDecimal());
  EXPECT_FALSE(Decimal("1.9223372036854775807").IsBigDecimal());
  EXPECT_FALSE(Decimal("0.00000000000000000001").IsBigDecimal());
}

TEST(DecimalTest, ToInt64) {
  EXPECT_THAT(Decimal("123.99").ToInt64(), HasValue(123));
  EXPECT_THAT(Decimal("-123.99").ToInt64(), HasValue(-123));
  EXPECT_THAT(Decimal("-9223372036854775808").ToInt64(),
              HasValue(std::numeric_limits<int64_t>::min()));
  EXPECT_THAT(Decimal("9223372036854775808").ToInt64(), IsError(ErrorKind::kOverflow));
}

TEST(DecimalTest, ToDouble) {
  EXPECT_THAT(Decimal("0.1").ToDouble(), HasValue(::testing::DoubleEq(0.1)));
  EXPECT_THAT(Decimal("-2.5").ToDouble(), HasValue(::testing::DoubleEq(-2.5)));
  EXPECT_THAT(Decimal("1.9223372036854775808").ToDouble(),
              IsError(ErrorKind::kOverflow));
  EXPECT_THAT(Decimal("1e30").ToDouble(), IsError(ErrorKind::kOverflow));
}

TEST(DecimalTest, ToScientific) {
  EXPECT_EQ(Decimal("123.456").ToScientific(), "1.23456e2");
  EXPECT_EQ(Decimal("-0.00123").ToScientific(), "-1.23e-3");
  EXPECT_EQ(Decimal("5").ToScientific(), "5e0");
  EXPECT_EQ(Decimal("100").ToScientific(), "1.00e2");
  EXPECT_EQ(Decimal("0.5").ToScientific(), "5e-1");
  EXPECT_EQ(Decimal("10.50").ToScientific(), "1.050e1");
  EXPECT_EQ(Decimal("0").ToScientific(), "0e0");
  EXPECT_EQ(Decimal("0.00").ToScientific(), "0.00e0");

  // The notation parses back to the same value.
  for (const auto* input : {"123.456", "-0.00123", "100", "0.5"}) {
    Decimal value(input);
    EXPECT_EQ(Decimal(value.ToScientific()).ToString(), value.ToString()) << input;
  }
}

TEST(DecimalTest, StringRoundTrip) {
  const std::vector<std::pair<std::string, int32_t>> cases = {
      {"0", 0},
      {"-1.50", 2},
      {"123456789012345678901234567890.000001", 6},
      {"0.0001", 4},
      {"-98765.4321", 4},
  };
  for (const auto& [text, scale] : cases) {
    auto parsed = Decimal::Make(text, scale);
    ASSERT_THAT(parsed, IsOk());
    EXPECT_EQ(parsed->ToString(), text);

    auto reparsed = Decimal::Make(parsed->ToString(), scale);
    ASSERT_THAT(reparsed, IsOk());
    EXPECT_EQ(*reparsed, *parsed);
    EXPECT_EQ(reparsed->ToString(), parsed->ToString());
    EXPECT_EQ(reparsed->scale(), parsed->scale());
  }
}

TEST(DecimalTest, DebugInfo) {
  auto info = Decimal("1.50").ToDebugInfo();
  EXPECT_EQ(info, DebugInfo("1.50", 2));
  EXPECT_EQ(info.value(), "1.50");
  EXPECT_EQ(info.scale(), 2);
  EXPECT_EQ(std::format("{}", info), "Decimal(value=1.50, scale=2)");
}

TEST(DecimalTest, Formatting) {
  EXPECT_EQ(std::format("{}", Decimal("-2.5")), "-2.5");
  EXPECT_EQ(std::format("[{:>6}]", Decimal("1.5")), "[   1.5]");

  std::ostringstream oss;
  oss << Decimal("0.10");
  EXPECT_EQ(oss.str(), "0.10");

  EXPECT_EQ(std::format("{}", ErrorKind::kPrecisionLoss), "PrecisionLoss");
}

}  // namespace decima
