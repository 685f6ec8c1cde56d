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

#include "decima/cpp_int_engine.h"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/integer.hpp>

#include "decima/util/macros.h"
#include "decima/util/string_util.h"

namespace decima {

namespace {

using boost::multiprecision::cpp_int;

/// \brief A decimal operand: value == unscaled * 10^-scale.
struct ScaledValue {
  cpp_int unscaled;
  int32_t scale{0};
};

Result<ScaledValue> ParseOperand(std::string_view str) {
  std::string_view digits = str;
  bool negative = false;
  if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
    negative = digits.front() == '-';
    digits.remove_prefix(1);
  }

  std::string_view whole = digits;
  std::string_view fraction;
  if (auto dot = digits.find('.'); dot != std::string_view::npos) {
    whole = digits.substr(0, dot);
    fraction = digits.substr(dot + 1);
  }
  if ((whole.empty() && fraction.empty()) ||
      (!whole.empty() && !StringUtils::IsDigits(whole)) ||
      (!fraction.empty() && !StringUtils::IsDigits(fraction))) {
    return InvalidInput("Invalid decimal operand '{}'", str);
  }
  if (fraction.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
    return InvalidInput("Decimal operand '{}' has too many fractional digits", str);
  }

  std::string joined;
  joined.reserve(whole.size() + fraction.size());
  joined.append(whole).append(fraction);

  // cpp_int reads a leading 0 as an octal prefix.
  ScaledValue value{
      .unscaled = cpp_int(std::string(StringUtils::StripLeadingZeros(joined))),
      .scale = static_cast<int32_t>(fraction.size())};
  if (negative) {
    value.unscaled = -value.unscaled;
  }
  return value;
}

Result<cpp_int> Pow10(int64_t exponent) {
  if (exponent < 0 || exponent > ArithmeticEngine::kMaxDigits) {
    return Overflow("Power of ten 10^{} exceeds the {} digit limit", exponent,
                    ArithmeticEngine::kMaxDigits);
  }
  return cpp_int(
      boost::multiprecision::pow(cpp_int(10), static_cast<unsigned>(exponent)));
}

/// \brief Move `value` from `from` to `to` fractional digits, truncating
/// toward zero when digits are dropped.
Result<cpp_int> Rescale(const cpp_int& value, int64_t from, int64_t to) {
  if (to >= from) {
    DECIMA_ASSIGN_OR_RAISE(auto factor, Pow10(to - from));
    return cpp_int(value * factor);
  }
  DECIMA_ASSIGN_OR_RAISE(auto divisor, Pow10(from - to));
  return cpp_int(value / divisor);
}

std::string FormatScaled(const cpp_int& unscaled, int32_t scale) {
  const bool negative = unscaled < 0;
  std::string digits = cpp_int(boost::multiprecision::abs(unscaled)).str();
  if (scale > 0) {
    const auto width = static_cast<size_t>(scale);
    if (digits.size() <= width) {
      digits.insert(0, width - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - width, 1, '.');
  }
  if (negative) {
    digits.insert(0, 1, '-');
  }
  return digits;
}

Status CheckScale(int32_t scale) {
  if (scale < 0) {
    return InvalidInput("Scale must be >= 0, was {}", scale);
  }
  if (scale > ArithmeticEngine::kMaxDigits) {
    return Overflow("Scale {} exceeds the {} digit limit", scale,
                    ArithmeticEngine::kMaxDigits);
  }
  return {};
}

/// \brief Reject `base^exponent` when it has more than kMaxDigits digits.
///
/// 2^(msb * exponent) is a lower bound of the power, and every decimal digit
/// takes more than 3.32 bits.
Status CheckPowerSize(const cpp_int& base, int64_t exponent) {
  const cpp_int magnitude = boost::multiprecision::abs(base);
  if (magnitude <= 1) {
    return {};
  }
  const auto bits = static_cast<int64_t>(boost::multiprecision::msb(magnitude));
  if (bits * exponent > static_cast<int64_t>(ArithmeticEngine::kMaxDigits) * 10 / 3) {
    return Overflow("Power {}^{} exceeds the {} digit limit", base.str(), exponent,
                    ArithmeticEngine::kMaxDigits);
  }
  return {};
}

}  // namespace

std::shared_ptr<CppIntEngine> CppIntEngine::Make() {
  return std::make_shared<CppIntEngine>();
}

Result<std::string> CppIntEngine::Add(std::string_view lhs, std::string_view rhs,
                                      int32_t scale) const {
  DECIMA_RETURN_UNEXPECTED(CheckScale(scale));
  DECIMA_ASSIGN_OR_RAISE(auto a, ParseOperand(lhs));
  DECIMA_ASSIGN_OR_RAISE(auto b, ParseOperand(rhs));
  const int32_t common = std::max(a.scale, b.scale);
  DECIMA_ASSIGN_OR_RAISE(auto left, Rescale(a.unscaled, a.scale, common));
  DECIMA_ASSIGN_OR_RAISE(auto right, Rescale(b.unscaled, b.scale, common));
  DECIMA_ASSIGN_OR_RAISE(auto sum, Rescale(cpp_int(left + right), common, scale));
  return FormatScaled(sum, scale);
}

Result<std::string> CppIntEngine::Subtract(std::string_view lhs, std::string_view rhs,
                                           int32_t scale) const {
  DECIMA_RETURN_UNEXPECTED(CheckScale(scale));
  DECIMA_ASSIGN_OR_RAISE(auto a, ParseOperand(lhs));
  DECIMA_ASSIGN_OR_RAISE(auto b, ParseOperand(rhs));
  const int32_t common = std::max(a.scale, b.scale);
  DECIMA_ASSIGN_OR_RAISE(auto left, Rescale(a.unscaled, a.scale, common));
  DECIMA_ASSIGN_OR_RAISE(auto right, Rescale(b.unscaled, b.scale, common));
  DECIMA_ASSIGN_OR_RAISE(auto difference, Rescale(cpp_int(left - right), common, scale));
  return FormatScaled(difference, scale);
}

Result<std::string> CppIntEngine::Multiply(std::string_view lhs, std::string_view rhs,
                                           int32_t scale) const {
  DECIMA_RETURN_UNEXPECTED(CheckScale(scale));
  DECIMA_ASSIGN_OR_RAISE(auto a, ParseOperand(lhs));
  DECIMA_ASSIGN_OR_RAISE(auto b, ParseOperand(rhs));
  const int64_t product_scale = static_cast<int64_t>(a.scale) + b.scale;
  DECIMA_ASSIGN_OR_RAISE(auto product,
                         Rescale(cpp_int(a.unscaled * b.unscaled), product_scale, scale));
  return FormatScaled(product, scale);
}

Result<std::string> CppIntEngine::Divide(std::string_view lhs, std::string_view rhs,
                                         int32_t scale) const {
  DECIMA_RETURN_UNEXPECTED(CheckScale(scale));
  DECIMA_ASSIGN_OR_RAISE(auto a, ParseOperand(lhs));
  DECIMA_ASSIGN_OR_RAISE(auto b, ParseOperand(rhs));
  if (b.unscaled == 0) {
    return DivisionByZero("Cannot divide {} by zero", lhs);
  }
  // (a / 10^sa) / (b / 10^sb) * 10^scale == a * 10^(sb + scale) / (b * 10^sa)
  DECIMA_ASSIGN_OR_RAISE(auto shift, Pow10(static_cast<int64_t>(b.scale) + scale));
  DECIMA_ASSIGN_OR_RAISE(auto unit, Pow10(a.scale));
  cpp_int numerator = a.unscaled * shift;
  cpp_int denominator = b.unscaled * unit;
  return FormatScaled(numerator / denominator, scale);
}

Result<std::string> CppIntEngine::Pow(std::string_view base, std::string_view exponent,
                                      int32_t scale) const {
  DECIMA_RETURN_UNEXPECTED(CheckScale(scale));
  DECIMA_ASSIGN_OR_RAISE(auto a, ParseOperand(base));
  DECIMA_ASSIGN_OR_RAISE(auto e, ParseOperand(exponent));

  DECIMA_ASSIGN_OR_RAISE(auto unit, Pow10(e.scale));
  if (e.unscaled % unit != 0) {
    return InvalidInput("Exponent '{}' must not have a fractional part", exponent);
  }
  const cpp_int power = e.unscaled / unit;
  if (power > std::numeric_limits<int32_t>::max() ||
      power < std::numeric_limits<int32_t>::min()) {
    return Overflow("Exponent '{}' is out of range", exponent);
  }
  const auto n = power.convert_to<int64_t>();

  if (n < 0 && a.unscaled == 0) {
    return DivisionByZero("Cannot raise zero to the negative power {}", exponent);
  }
  const int64_t magnitude = n < 0 ? -n : n;
  DECIMA_RETURN_UNEXPECTED(CheckPowerSize(a.unscaled, magnitude));
  const int64_t power_scale = a.scale * magnitude;

  if (n >= 0) {
    cpp_int result = boost::multiprecision::pow(a.unscaled, static_cast<unsigned>(n));
    DECIMA_ASSIGN_OR_RAISE(auto rescaled, Rescale(result, power_scale, scale));
    return FormatScaled(rescaled, scale);
  }

  cpp_int denominator =
      boost::multiprecision::pow(a.unscaled, static_cast<unsigned>(magnitude));
  // 1 / (d / 10^(sa * |n|)) * 10^scale
  DECIMA_ASSIGN_OR_RAISE(auto numerator, Pow10(power_scale + scale));
  return FormatScaled(numerator / denominator, scale);
}

Result<std::string> CppIntEngine::Sqrt(std::string_view operand, int32_t scale) const {
  DECIMA_RETURN_UNEXPECTED(CheckScale(scale));
  DECIMA_ASSIGN_OR_RAISE(auto a, ParseOperand(operand));
  if (a.unscaled < 0) {
    return InvalidInput("Cannot take the square root of negative value {}", operand);
  }
  // sqrt(a / 10^sa) * 10^scale == sqrt(a * 10^(2 * scale - sa))
  DECIMA_ASSIGN_OR_RAISE(auto radicand,
                         Rescale(a.unscaled, a.scale, 2 * static_cast<int64_t>(scale)));
  return FormatScaled(cpp_int(boost::multiprecision::sqrt(radicand)), scale);
}

Result<std::string> CppIntEngine::Mod(std::string_view lhs, std::string_view rhs,
                                      int32_t scale) const {
  DECIMA_RETURN_UNEXPECTED(CheckScale(scale));
  DECIMA_ASSIGN_OR_RAISE(auto a, ParseOperand(lhs));
  DECIMA_ASSIGN_OR_RAISE(auto b, ParseOperand(rhs));
  if (b.unscaled == 0) {
    return DivisionByZero("Cannot compute {} modulo zero", lhs);
  }
  const int32_t common = std::max(a.scale, b.scale);
  DECIMA_ASSIGN_OR_RAISE(auto left, Rescale(a.unscaled, a.scale, common));
  DECIMA_ASSIGN_OR_RAISE(auto right, Rescale(b.unscaled, b.scale, common));
  DECIMA_ASSIGN_OR_RAISE(auto remainder, Rescale(cpp_int(left % right), common, scale));
  return FormatScaled(remainder, scale);
}

Result<int> CppIntEngine::Compare(std::string_view lhs, std::string_view rhs,
                                  int32_t scale) const {
  DECIMA_RETURN_UNEXPECTED(CheckScale(scale));
  DECIMA_ASSIGN_OR_RAISE(auto a, ParseOperand(lhs));
  DECIMA_ASSIGN_OR_RAISE(auto b, ParseOperand(rhs));
  DECIMA_ASSIGN_OR_RAISE(auto left, Rescale(a.unscaled, a.scale, scale));
  DECIMA_ASSIGN_OR_RAISE(auto right, Rescale(b.unscaled, b.scale, scale));
  if (left == right) {
    return 0;
  }
  return left < right ? -1 : 1;
}

const std::shared_ptr<const ArithmeticEngine>& ArithmeticEngine::Default() {
  static const std::shared_ptr<const ArithmeticEngine> kDefault = CppIntEngine::Make();
  return kDefault;
}

}  // namespace decima
