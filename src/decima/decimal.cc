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

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

#include "decima/exception.h"
#include "decima/util/formatter.h"
#include "decima/util/macros.h"
#include "decima/util/string_util.h"

namespace decima {

namespace {

constexpr std::string_view kInt64MaxDigits = "9223372036854775807";
constexpr std::string_view kInt64MinMagnitude = "9223372036854775808";

/// \brief The lexical pieces of a number: [sign] whole [. fraction] [e exponent].
struct NumberComponents {
  char sign{0};
  std::string_view whole_digits;
  std::string_view fractional_digits;
  bool has_radix_mark{false};
  bool has_exponent{false};
  int32_t exponent{0};
};

/// \brief Sign, digits and fractional digits of a parsed number.
struct ParsedNumber {
  std::string integral;
  std::string fractional;
  bool negative{false};
};

inline bool IsSign(char c) { return c == '+' || c == '-'; }

inline bool StartsExponent(char c) { return c == 'e' || c == 'E'; }

inline size_t ParseDigitsRun(std::string_view str, size_t pos, std::string_view* out) {
  size_t start = pos;
  while (pos < str.size() && StringUtils::IsDigit(str[pos])) {
    ++pos;
  }
  *out = str.substr(start, pos - start);
  return pos;
}

Result<NumberComponents> Tokenize(std::string_view str) {
  NumberComponents out;
  size_t pos = 0;

  if (pos < str.size() && IsSign(str[pos])) {
    out.sign = str[pos++];
  }
  pos = ParseDigitsRun(str, pos, &out.whole_digits);
  if (pos < str.size() && str[pos] == Decimal::kRadixMark) {
    out.has_radix_mark = true;
    pos = ParseDigitsRun(str, ++pos, &out.fractional_digits);
  }
  if (out.whole_digits.empty() && out.fractional_digits.empty()) {
    return InvalidInput("Invalid non numeric value '{}'", str);
  }

  if (pos < str.size() && StartsExponent(str[pos])) {
    out.has_exponent = true;
    ++pos;
    bool negative_exponent = false;
    if (pos < str.size() && IsSign(str[pos])) {
      negative_exponent = str[pos++] == '-';
    }
    std::string_view exponent_digits;
    pos = ParseDigitsRun(str, pos, &exponent_digits);
    if (exponent_digits.empty() || pos != str.size()) {
      return InvalidInput("Invalid scientific value/notation: {}", str);
    }
    int64_t exponent = 0;
    auto [_, ec] = std::from_chars(
        exponent_digits.data(), exponent_digits.data() + exponent_digits.size(),
        exponent);
    if (ec != std::errc() || exponent > std::numeric_limits<int32_t>::max()) {
      return InvalidInput("Exponent out of range in '{}'", str);
    }
    out.exponent = static_cast<int32_t>(negative_exponent ? -exponent : exponent);
  }

  if (pos != str.size()) {
    return InvalidInput("Invalid non numeric value '{}'", str);
  }
  return out;
}

ParsedNumber FromInteger(const NumberComponents& components) {
  return {.integral =
              std::string(StringUtils::StripLeadingZeros(components.whole_digits)),
          .fractional = {},
          .negative = components.sign == '-'};
}

ParsedNumber FromFixedPoint(const NumberComponents& components) {
  // ".5" has an empty whole part, which reads as "0".
  return {.integral =
              std::string(StringUtils::StripLeadingZeros(components.whole_digits)),
          .fractional = std::string(components.fractional_digits),
          .negative = components.sign == '-'};
}

/// \brief Expand mantissa * 10^exponent into integral and fractional digits by
/// moving the radix mark of the mantissa `exponent` places.
Result<ParsedNumber> FromScientific(const NumberComponents& components) {
  std::string_view fraction = components.fractional_digits;
  // "1.0e-2" reads as "1e-2".
  if (fraction == "0") {
    fraction = {};
  }

  std::string digits;
  digits.reserve(components.whole_digits.size() + fraction.size());
  digits.append(components.whole_digits).append(fraction);

  const int64_t point =
      static_cast<int64_t>(components.whole_digits.size()) + components.exponent;

  // Digits of the expanded value: leading zeros before the mantissa, or
  // trailing zeros after it.
  const int64_t expanded =
      point <= 0 ? static_cast<int64_t>(digits.size()) - point
                 : std::max(point, static_cast<int64_t>(digits.size()));
  if (expanded > ArithmeticEngine::kMaxDigits) {
    return Overflow("Exponent {} expands the value past the {} digit limit",
                    components.exponent, ArithmeticEngine::kMaxDigits);
  }

  ParsedNumber out{.negative = components.sign == '-'};
  if (point <= 0) {
    out.integral = "0";
    out.fractional = std::string(static_cast<size_t>(-point), '0') + digits;
  } else if (static_cast<size_t>(point) >= digits.size()) {
    digits.append(static_cast<size_t>(point) - digits.size(), '0');
    out.integral = std::string(StringUtils::StripLeadingZeros(digits));
  } else {
    const auto split = static_cast<size_t>(point);
    out.integral = std::string(StringUtils::StripLeadingZeros(digits.substr(0, split)));
    out.fractional = digits.substr(split);
  }
  return out;
}

/// \brief Pad or cut the fractional digits to exactly `scale` digits.
Status ApplyScale(ParsedNumber& number, int32_t scale, bool strict) {
  if (scale < 0) {
    return InvalidInput("Scale must be >= 0, was {}", scale);
  }
  if (scale > ArithmeticEngine::kMaxDigits) {
    return Overflow("Scale {} exceeds the {} digit limit", scale,
                    ArithmeticEngine::kMaxDigits);
  }
  const auto width = static_cast<size_t>(scale);
  if (number.fractional.size() > width) {
    if (strict) {
      return PrecisionLoss(
          "Loss of precision detected. Detected scale `{}` > `{}` as defined.",
          number.fractional.size(), scale);
    }
    number.fractional.resize(width);
  } else {
    number.fractional.append(width - number.fractional.size(), '0');
  }
  return {};
}

std::string PowerOfTen(int32_t exponent) {
  std::string out = "1";
  out.append(static_cast<size_t>(exponent), '0');
  return out;
}

/// \brief The smallest positive value at `scale`, e.g. "0.01" for 2.
std::string Ulp(int32_t scale) {
  if (scale == 0) {
    return "1";
  }
  std::string out = "0.";
  out.append(static_cast<size_t>(scale - 1), '0');
  out.push_back('1');
  return out;
}

}  // namespace

std::string DebugInfo::ToString() const {
  return std::format("Decimal(value={}, scale={})", value_, scale_);
}

Decimal::Decimal() : engine_(ArithmeticEngine::Default()) {}

Decimal::Decimal(std::string_view str) {
  auto result = Decimal::Make(str);
  DECIMA_CHECK_OR_DIE(result, "Failed to parse Decimal from string: {}, error: {}", str,
                      result.error().message);
  *this = std::move(result.value());
}

Decimal::Decimal(std::string integral_part, std::string fractional_part, bool negative,
                 std::shared_ptr<const ArithmeticEngine> engine)
    : integral_part_(std::move(integral_part)),
      fractional_part_(std::move(fractional_part)),
      negative_(negative),
      engine_(std::move(engine)) {
  DECIMA_DCHECK(StringUtils::IsDigits(integral_part_), "integral part must be digits");
  if (negative_ && IsZero()) {
    negative_ = false;
  }
}

Result<Decimal> Decimal::Make(std::string_view value, std::optional<int32_t> scale,
                              bool strict) {
  std::string_view trimmed = StringUtils::Trim(value);
  if (trimmed.empty()) {
    return InvalidInput("Invalid non numeric value '{}'", value);
  }

  DECIMA_ASSIGN_OR_RAISE(auto components, Tokenize(trimmed));
  ParsedNumber number;
  if (components.has_exponent) {
    DECIMA_ASSIGN_OR_RAISE(number, FromScientific(components));
  } else if (components.has_radix_mark) {
    number = FromFixedPoint(components);
  } else {
    number = FromInteger(components);
  }

  if (scale.has_value()) {
    DECIMA_RETURN_UNEXPECTED(ApplyScale(number, *scale, strict));
  }
  return Decimal(std::move(number.integral), std::move(number.fractional),
                 number.negative, ArithmeticEngine::Default());
}

Result<Decimal> Decimal::Make(const util::Formattable& value,
                              std::optional<int32_t> scale, bool strict) {
  return Make(std::string_view(value.ToString()), scale, strict);
}

Result<Decimal> Decimal::Make(const Decimal& value, std::optional<int32_t> scale,
                              bool strict) {
  if (!scale.has_value()) {
    return value;
  }
  DECIMA_ASSIGN_OR_RAISE(auto rescaled,
                         Make(std::string_view(value.ToString()), scale, strict));
  rescaled.engine_ = value.engine_;
  return rescaled;
}

namespace {

template <typename Real>
Result<Decimal> FromRealImpl(Real value, std::optional<int32_t> scale, bool strict) {
  if (!std::isfinite(value)) {
    return InvalidInput("Cannot make a Decimal from non-finite value {}", value);
  }
  // Shortest representation that parses back to the same value.
  char buffer[64];
  auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return InvalidInput("Cannot format floating-point value {}", value);
  }
  return Decimal::Make(std::string_view(buffer, end - buffer), scale, strict);
}

}  // namespace

Result<Decimal> Decimal::FromReal(double value, std::optional<int32_t> scale,
                                  bool strict) {
  return FromRealImpl(value, scale, strict);
}

Result<Decimal> Decimal::FromReal(float value, std::optional<int32_t> scale,
                                  bool strict) {
  return FromRealImpl(value, scale, strict);
}

Decimal Decimal::WithEngine(std::shared_ptr<const ArithmeticEngine> engine) const {
  Decimal copy(*this);
  copy.engine_ = std::move(engine);
  return copy;
}

Decimal Decimal::Copy(std::optional<std::string> integral_part,
                      std::optional<std::string> fractional_part,
                      std::optional<bool> negative) const {
  return {std::move(integral_part).value_or(integral_part_),
          std::move(fractional_part).value_or(fractional_part_),
          negative.value_or(negative_), engine_};
}

Result<Decimal> Decimal::Derive(Result<std::string> computed,
                                std::optional<int32_t> scale) const {
  DECIMA_ASSIGN_OR_RAISE(auto text, std::move(computed));
  DECIMA_ASSIGN_OR_RAISE(auto result, Make(std::string_view(text), scale));
  result.engine_ = engine_;
  return result;
}

Result<Decimal> Decimal::Add(const Decimal& value, std::optional<int32_t> scale) const {
  const int32_t result_scale = scale.value_or(std::max(this->scale(), value.scale()));
  return Derive(engine_->Add(ToString(), value.ToString(), result_scale));
}

Result<Decimal> Decimal::Subtract(const Decimal& value,
                                  std::optional<int32_t> scale) const {
  const int32_t result_scale = scale.value_or(std::max(this->scale(), value.scale()));
  return Derive(engine_->Subtract(ToString(), value.ToString(), result_scale));
}

Result<Decimal> Decimal::Multiply(const Decimal& value,
                                  std::optional<int32_t> scale) const {
  const int32_t result_scale = scale.value_or(this->scale() + value.scale());
  return Derive(engine_->Multiply(ToString(), value.ToString(), result_scale));
}

Result<Decimal> Decimal::Divide(const Decimal& value, int32_t scale) const {
  if (value.IsZero()) {
    return DivisionByZero("Cannot divide {} by zero", ToString());
  }
  return Derive(engine_->Divide(ToString(), value.ToString(), scale));
}

Result<Decimal> Decimal::Pow(const Decimal& exponent,
                             std::optional<int32_t> scale) const {
  return Derive(
      engine_->Pow(ToString(), exponent.ToString(), scale.value_or(this->scale())));
}

Result<Decimal> Decimal::Sqrt(std::optional<int32_t> scale) const {
  if (negative_) {
    return InvalidInput("Cannot take the square root of negative value {}", ToString());
  }
  return Derive(engine_->Sqrt(ToString(), scale.value_or(this->scale())));
}

Result<Decimal> Decimal::Mod(const Decimal& value, std::optional<int32_t> scale) const {
  if (value.IsZero()) {
    return DivisionByZero("Cannot compute {} modulo zero", ToString());
  }
  return Derive(
      engine_->Mod(ToString(), value.ToString(), scale.value_or(this->scale())));
}

Result<int> Decimal::CompareTo(const Decimal& value) const {
  return engine_->Compare(ToString(), value.ToString(),
                          std::max(this->scale(), value.scale()));
}

Result<bool> Decimal::Equals(const Decimal& value) const {
  DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
  return cmp == 0;
}

Result<bool> Decimal::GreaterThan(const Decimal& value) const {
  DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
  return cmp > 0;
}

Result<bool> Decimal::LessThan(const Decimal& value) const {
  DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
  return cmp < 0;
}

Result<bool> Decimal::GreaterThanOrEquals(const Decimal& value) const {
  DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
  return cmp >= 0;
}

Result<bool> Decimal::LessThanOrEquals(const Decimal& value) const {
  DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
  return cmp <= 0;
}

Decimal Decimal::Trim() const {
  return Copy(std::nullopt,
              std::string(StringUtils::StripTrailingZeros(fractional_part_)),
              std::nullopt);
}

Decimal Decimal::Absolute() const { return Copy(std::nullopt, std::nullopt, false); }

Decimal Decimal::Negate() const { return Copy(std::nullopt, std::nullopt, !negative_); }

int Decimal::Sign() const {
  if (IsZero()) {
    return 0;
  }
  return negative_ ? -1 : 1;
}

bool Decimal::IsInteger() const {
  return fractional_part_.find_first_not_of('0') == std::string::npos;
}

bool Decimal::IsZero() const { return integral_part_ == "0" && IsInteger(); }

bool Decimal::IsBigInteger() const {
  return StringUtils::CompareDigits(integral_part_,
                                    negative_ ? kInt64MinMagnitude : kInt64MaxDigits) > 0;
}

bool Decimal::IsBigDecimal() const {
  return IsBigInteger() ||
         StringUtils::CompareDigits(fractional_part_, kInt64MaxDigits) > 0;
}

Result<Decimal> Decimal::Round(int32_t scale, RoundingMode mode) const {
  if (scale < 0) {
    return InvalidInput("Scale must be >= 0, was {}", scale);
  }
  if (scale > ArithmeticEngine::kMaxDigits) {
    return Overflow("Scale {} exceeds the {} digit limit", scale,
                    ArithmeticEngine::kMaxDigits);
  }

  switch (mode) {
    case RoundingMode::kFloor:
      return RoundTowardInfinity(scale, /*toward_positive=*/false);
    case RoundingMode::kCeil:
      return RoundTowardInfinity(scale, /*toward_positive=*/true);
    case RoundingMode::kHalfUp:
      break;
  }

  // Shift one digit past the target, add a signed half unit and shift back.
  const std::string shift = PowerOfTen(scale + 1);
  DECIMA_ASSIGN_OR_RAISE(auto shifted, engine_->Multiply(ToString(), shift, 0));
  DECIMA_ASSIGN_OR_RAISE(auto biased, engine_->Add(shifted, negative_ ? "-5" : "5", 0));
  return Derive(engine_->Divide(biased, shift, scale), scale);
}

Result<Decimal> Decimal::Round(int32_t scale, const DecimalProperties& properties) const {
  DECIMA_ASSIGN_OR_RAISE(auto mode, properties.TryGet(DecimalProperties::kRoundingMode));
  return Round(scale, mode);
}

Result<Decimal> Decimal::RoundTowardInfinity(int32_t scale, bool toward_positive) const {
  const auto width = static_cast<size_t>(scale);
  const bool exact = fractional_part_.size() <= width ||
                     fractional_part_.find_first_not_of('0', width) == std::string::npos;
  if (exact) {
    return Make(*this, scale);
  }

  DECIMA_ASSIGN_OR_RAISE(auto truncated, Truncate(scale));
  // Truncation moved a negative value up and a positive value down; step one
  // unit further when that was the wrong direction.
  if (toward_positive && !negative_) {
    return Derive(engine_->Add(truncated.ToString(), Ulp(scale), scale), scale);
  }
  if (!toward_positive && negative_) {
    return Derive(engine_->Subtract(truncated.ToString(), Ulp(scale), scale), scale);
  }
  return Make(truncated, scale);
}

Result<Decimal> Decimal::Floor() const { return Round(0, RoundingMode::kFloor); }

Result<Decimal> Decimal::Ceil() const { return Round(0, RoundingMode::kCeil); }

Result<Decimal> Decimal::Truncate(int32_t scale) const {
  if (scale < 0) {
    return InvalidInput("Scale must be >= 0, was {}", scale);
  }
  return Copy(std::nullopt, fractional_part_.substr(0, static_cast<size_t>(scale)),
              std::nullopt);
}

Result<double> Decimal::ToDouble() const {
  if (IsBigDecimal()) {
    return Overflow("Cannot cast big decimal {} to double", ToString());
  }
  const std::string str = ToString();
  double out = 0;
  auto [_, ec] = std::from_chars(str.data(), str.data() + str.size(), out);
  if (ec != std::errc()) {
    return Overflow("Cannot cast {} to double", str);
  }
  return out;
}

Result<int64_t> Decimal::ToInt64() const {
  if (IsBigInteger()) {
    return Overflow("Cannot cast big integer {} to int64", ToString());
  }
  const std::string str = (negative_ ? "-" : "") + integral_part_;
  int64_t out = 0;
  auto [_, ec] = std::from_chars(str.data(), str.data() + str.size(), out);
  if (ec != std::errc()) {
    return Overflow("Cannot cast {} to int64", str);
  }
  return out;
}

std::string Decimal::ToScientific() const {
  char lead = '0';
  std::string rest;
  int64_t exponent = 0;

  if (integral_part_ != "0") {
    lead = integral_part_.front();
    rest = integral_part_.substr(1) + fractional_part_;
    exponent = static_cast<int64_t>(integral_part_.size()) - 1;
  } else if (auto first = fractional_part_.find_first_not_of('0');
             first != std::string::npos) {
    // 0.00123 -> 1.23e-3
    lead = fractional_part_[first];
    rest = fractional_part_.substr(first + 1);
    exponent = -static_cast<int64_t>(first) - 1;
  } else {
    rest = fractional_part_;
  }

  std::string out;
  if (negative_) {
    out.push_back('-');
  }
  out.push_back(lead);
  if (!rest.empty()) {
    out.push_back(kRadixMark);
    out.append(rest);
  }
  out.push_back(kExpMark);
  out.append(std::to_string(exponent));
  return out;
}

std::string Decimal::ToString() const {
  std::string out;
  out.reserve(integral_part_.size() + fractional_part_.size() + 2);
  if (negative_) {
    out.push_back('-');
  }
  out.append(integral_part_);
  if (!fractional_part_.empty()) {
    out.push_back(kRadixMark);
    out.append(fractional_part_);
  }
  return out;
}

DebugInfo Decimal::ToDebugInfo() const { return {ToString(), scale()}; }

bool operator==(const Decimal& lhs, const Decimal& rhs) {
  DECIMA_ASSIGN_OR_THROW(auto cmp, lhs.CompareTo(rhs));
  return cmp == 0;
}

std::weak_ordering operator<=>(const Decimal& lhs, const Decimal& rhs) {
  DECIMA_ASSIGN_OR_THROW(auto cmp, lhs.CompareTo(rhs));
  return cmp <=> 0;
}

Decimal operator-(const Decimal& operand) { return operand.Negate(); }

Decimal operator+(const Decimal& lhs, const Decimal& rhs) {
  DECIMA_ASSIGN_OR_THROW(auto sum, lhs.Add(rhs));
  return sum;
}

Decimal operator-(const Decimal& lhs, const Decimal& rhs) {
  DECIMA_ASSIGN_OR_THROW(auto difference, lhs.Subtract(rhs));
  return difference;
}

Decimal operator*(const Decimal& lhs, const Decimal& rhs) {
  DECIMA_ASSIGN_OR_THROW(auto product, lhs.Multiply(rhs));
  return product;
}

std::ostream& operator<<(std::ostream& os, const Decimal& decimal) {
  os << decimal.ToString();
  return os;
}

}  // namespace decima
