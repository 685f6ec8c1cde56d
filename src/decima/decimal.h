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

#pragma once

/// \file decima/decimal.h
/// \brief Immutable arbitrary-precision decimal numbers.

#include <compare>
#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "decima/arithmetic_engine.h"
#include "decima/decima_export.h"
#include "decima/decimal_properties.h"
#include "decima/result.h"
#include "decima/rounding_mode.h"
#include "decima/util/formattable.h"
#include "decima/util/macros.h"

namespace decima {

class Decimal;

/// \brief Values that can be turned into a Decimal by Decimal::Make.
template <typename T>
concept DecimalConvertible =
    !std::same_as<std::remove_cvref_t<T>, Decimal> &&
    ((std::is_arithmetic_v<T> && !std::same_as<T, bool>) ||
     std::convertible_to<const T&, std::string_view> ||
     std::derived_from<T, util::Formattable>);

/// \brief Printable snapshot of a Decimal: its canonical value and scale.
class DECIMA_EXPORT DebugInfo : public util::Formattable {
 public:
  DebugInfo(std::string value, int32_t scale) : value_(std::move(value)), scale_(scale) {}

  const std::string& value() const { return value_; }
  int32_t scale() const { return scale_; }

  std::string ToString() const override;

  friend bool operator==(const DebugInfo& lhs, const DebugInfo& rhs) {
    return lhs.value_ == rhs.value_ && lhs.scale_ == rhs.scale_;
  }

 private:
  std::string value_;
  int32_t scale_;
};

/// \brief An immutable decimal number of arbitrary size and precision.
///
/// A Decimal is a sign, a run of integral digits without leading zeros and a
/// run of fractional digits. The scale is the number of fractional digits
/// and trailing zeros are kept, so "1.50" and "1.5" compare equal but print
/// differently. Zero is never negative.
///
/// Arithmetic is delegated to an ArithmeticEngine; every operation returns a
/// new Decimal bound to the same engine. Results are truncated, not rounded,
/// to the output scale; use Round() to round explicitly.
class DECIMA_EXPORT Decimal : public util::Formattable {
 public:
  static constexpr char kExpMark = 'e';
  static constexpr char kRadixMark = '.';

  /// \brief Zero, with scale 0.
  Decimal();

  /// \brief Parse a Decimal, throwing DecimaError on malformed input.
  explicit Decimal(std::string_view str);

  /// \brief Parse a Decimal from text.
  ///
  /// Accepts plain integers ("-12"), fixed-point numbers ("0.50", ".5", "5.")
  /// and scientific notation ("1.5e-3", "2E+4"), with optional surrounding
  /// whitespace and a leading '+' or '-'.
  ///
  /// \param value The text to parse.
  /// \param scale Number of fractional digits to keep. Missing digits are
  /// padded with zeros; extra digits are truncated. Detected from the input
  /// when omitted.
  /// \param strict If true, fail with PrecisionLoss instead of truncating.
  /// \return InvalidInput for malformed text or a negative scale.
  static Result<Decimal> Make(std::string_view value,
                              std::optional<int32_t> scale = std::nullopt,
                              bool strict = false);

  /// \brief Make a Decimal from an integer.
  template <typename T>
    requires(std::integral<T> && !std::same_as<T, bool>)
  static Result<Decimal> Make(T value, std::optional<int32_t> scale = std::nullopt,
                              bool strict = false) {
    return Make(std::string_view(std::to_string(value)), scale, strict);
  }

  /// \brief Make a Decimal from the shortest text that round-trips `value`.
  ///
  /// \return InvalidInput for NaN and infinities.
  template <std::floating_point T>
  static Result<Decimal> Make(T value, std::optional<int32_t> scale = std::nullopt,
                              bool strict = false) {
    if constexpr (std::is_same_v<T, float>) {
      return FromReal(value, scale, strict);
    } else {
      return FromReal(static_cast<double>(value), scale, strict);
    }
  }

  /// \brief Make a Decimal from the ToString() form of `value`.
  static Result<Decimal> Make(const util::Formattable& value,
                              std::optional<int32_t> scale = std::nullopt,
                              bool strict = false);

  /// \brief Copy `value`, or re-parse it at `scale` when one is given.
  static Result<Decimal> Make(const Decimal& value,
                              std::optional<int32_t> scale = std::nullopt,
                              bool strict = false);

  /// \brief Make a Decimal using the scale and strictness in `properties`.
  template <typename T>
  static Result<Decimal> Make(const T& value, const DecimalProperties& properties) {
    DECIMA_ASSIGN_OR_RAISE(auto scale, properties.TryGet(DecimalProperties::kScale));
    DECIMA_ASSIGN_OR_RAISE(auto strict, properties.TryGet(DecimalProperties::kStrict));
    return Make(value, scale < 0 ? std::nullopt : std::optional<int32_t>(scale), strict);
  }

  /// \brief Return a copy that uses `engine` for arithmetic.
  Decimal WithEngine(std::shared_ptr<const ArithmeticEngine> engine) const;

  const std::string& integral_part() const { return integral_part_; }
  const std::string& fractional_part() const { return fractional_part_; }
  int32_t scale() const { return static_cast<int32_t>(fractional_part_.size()); }
  const std::shared_ptr<const ArithmeticEngine>& engine() const { return engine_; }

  /// \brief Sum, at the larger scale of both operands unless `scale` is given.
  Result<Decimal> Add(const Decimal& value,
                      std::optional<int32_t> scale = std::nullopt) const;

  /// \brief Difference, at the larger scale of both operands unless `scale` is
  /// given.
  Result<Decimal> Subtract(const Decimal& value,
                           std::optional<int32_t> scale = std::nullopt) const;

  /// \brief Product, at the sum of both scales unless `scale` is given.
  Result<Decimal> Multiply(const Decimal& value,
                           std::optional<int32_t> scale = std::nullopt) const;

  /// \brief Quotient, truncated to `scale` fractional digits.
  /// \return DivisionByZero if `value` is zero.
  Result<Decimal> Divide(const Decimal& value, int32_t scale) const;

  /// \brief This value raised to an integral power, at this scale unless
  /// `scale` is given.
  Result<Decimal> Pow(const Decimal& exponent,
                      std::optional<int32_t> scale = std::nullopt) const;

  /// \brief Square root, at this scale unless `scale` is given.
  /// \return InvalidInput if this value is negative.
  Result<Decimal> Sqrt(std::optional<int32_t> scale = std::nullopt) const;

  /// \brief Remainder of the truncated division by `value`, at this scale
  /// unless `scale` is given. The result has the sign of this value.
  /// \return DivisionByZero if `value` is zero.
  Result<Decimal> Mod(const Decimal& value,
                      std::optional<int32_t> scale = std::nullopt) const;

  /// \brief Compare with `value` at the larger scale of both operands.
  /// \return -1, 0 or 1.
  Result<int> CompareTo(const Decimal& value) const;

  Result<bool> Equals(const Decimal& value) const;
  Result<bool> GreaterThan(const Decimal& value) const;
  Result<bool> LessThan(const Decimal& value) const;
  Result<bool> GreaterThanOrEquals(const Decimal& value) const;
  Result<bool> LessThanOrEquals(const Decimal& value) const;

  // Overloads accepting anything Make() accepts. The operand is parsed with
  // its scale detected from the input.

  template <DecimalConvertible T>
  Result<Decimal> Add(const T& value, std::optional<int32_t> scale = std::nullopt) const {
    DECIMA_ASSIGN_OR_RAISE(auto decimal, Make(value));
    return Add(decimal, scale);
  }

  template <DecimalConvertible T>
  Result<Decimal> Subtract(const T& value,
                           std::optional<int32_t> scale = std::nullopt) const {
    DECIMA_ASSIGN_OR_RAISE(auto decimal, Make(value));
    return Subtract(decimal, scale);
  }

  template <DecimalConvertible T>
  Result<Decimal> Multiply(const T& value,
                           std::optional<int32_t> scale = std::nullopt) const {
    DECIMA_ASSIGN_OR_RAISE(auto decimal, Make(value));
    return Multiply(decimal, scale);
  }

  template <DecimalConvertible T>
  Result<Decimal> Divide(const T& value, int32_t scale) const {
    DECIMA_ASSIGN_OR_RAISE(auto decimal, Make(value));
    return Divide(decimal, scale);
  }

  template <DecimalConvertible T>
  Result<Decimal> Pow(const T& exponent,
                      std::optional<int32_t> scale = std::nullopt) const {
    DECIMA_ASSIGN_OR_RAISE(auto decimal, Make(exponent));
    return Pow(decimal, scale);
  }

  template <DecimalConvertible T>
  Result<Decimal> Mod(const T& value, std::optional<int32_t> scale = std::nullopt) const {
    DECIMA_ASSIGN_OR_RAISE(auto decimal, Make(value));
    return Mod(decimal, scale);
  }

  template <DecimalConvertible T>
  Result<int> CompareTo(const T& value) const {
    DECIMA_ASSIGN_OR_RAISE(auto decimal, Make(value));
    return CompareTo(decimal);
  }

  template <DecimalConvertible T>
  Result<bool> Equals(const T& value) const {
    DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
    return cmp == 0;
  }

  template <DecimalConvertible T>
  Result<bool> GreaterThan(const T& value) const {
    DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
    return cmp > 0;
  }

  template <DecimalConvertible T>
  Result<bool> LessThan(const T& value) const {
    DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
    return cmp < 0;
  }

  template <DecimalConvertible T>
  Result<bool> GreaterThanOrEquals(const T& value) const {
    DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
    return cmp >= 0;
  }

  template <DecimalConvertible T>
  Result<bool> LessThanOrEquals(const T& value) const {
    DECIMA_ASSIGN_OR_RAISE(auto cmp, CompareTo(value));
    return cmp <= 0;
  }

  /// \brief Copy without trailing fractional zeros.
  Decimal Trim() const;

  /// \brief Copy with the sign dropped.
  Decimal Absolute() const;

  /// \brief Copy with the sign flipped. Zero stays zero.
  Decimal Negate() const;

  /// \brief 0 if zero, -1 if negative, 1 if positive.
  int Sign() const;

  bool IsInteger() const;
  bool IsZero() const;
  bool IsNegative() const { return negative_; }
  bool IsPositive() const { return !negative_ && !IsZero(); }

  /// \brief Whether the integral part does not fit in an int64_t.
  bool IsBigInteger() const;

  /// \brief Whether either the integral part or the fractional digits, read as
  /// an integer, do not fit in an int64_t.
  bool IsBigDecimal() const;

  /// \brief Round to `scale` fractional digits.
  ///
  /// kHalfUp rounds half away from zero; kFloor and kCeil round toward
  /// negative and positive infinity at the same granularity.
  /// \return InvalidInput if `scale` is negative.
  Result<Decimal> Round(int32_t scale = 0,
                        RoundingMode mode = RoundingMode::kHalfUp) const;

  /// \brief Round with the mode configured in `properties`.
  Result<Decimal> Round(int32_t scale, const DecimalProperties& properties) const;

  /// \brief The closest integer toward negative infinity.
  Result<Decimal> Floor() const;

  /// \brief The closest integer toward positive infinity.
  Result<Decimal> Ceil() const;

  /// \brief Discard the fractional digits beyond `scale`.
  /// \return InvalidInput if `scale` is negative.
  Result<Decimal> Truncate(int32_t scale = 0) const;

  /// \brief Approximate this value with a double.
  /// \return Overflow if IsBigDecimal().
  Result<double> ToDouble() const;

  /// \brief The integral part as an int64_t, without rounding.
  /// \return Overflow if IsBigInteger().
  Result<int64_t> ToInt64() const;

  /// \brief Scientific notation "d.ddde±n" keeping every stored digit.
  std::string ToScientific() const;

  /// \brief Canonical form "[-]integral[.fractional]".
  ///
  /// Parsing the output at the same scale yields an equal Decimal.
  std::string ToString() const override;

  DebugInfo ToDebugInfo() const;

  friend bool operator==(const Decimal& lhs, const Decimal& rhs);
  /// 1.5 and 1.50 are equivalent but not interchangeable: their scales differ.
  friend std::weak_ordering operator<=>(const Decimal& lhs, const Decimal& rhs);

  friend Decimal operator-(const Decimal& operand);
  friend Decimal operator+(const Decimal& lhs, const Decimal& rhs);
  friend Decimal operator-(const Decimal& lhs, const Decimal& rhs);
  friend Decimal operator*(const Decimal& lhs, const Decimal& rhs);

 private:
  Decimal(std::string integral_part, std::string fractional_part, bool negative,
          std::shared_ptr<const ArithmeticEngine> engine);

  static Result<Decimal> FromReal(double value, std::optional<int32_t> scale,
                                  bool strict);
  static Result<Decimal> FromReal(float value, std::optional<int32_t> scale,
                                  bool strict);

  /// \brief Copy with the given fields replaced.
  Decimal Copy(std::optional<std::string> integral_part,
               std::optional<std::string> fractional_part,
               std::optional<bool> negative) const;

  /// \brief Parse an engine result into a Decimal bound to this engine.
  Result<Decimal> Derive(Result<std::string> computed,
                         std::optional<int32_t> scale = std::nullopt) const;

  Result<Decimal> RoundTowardInfinity(int32_t scale, bool toward_positive) const;

  std::string integral_part_{"0"};
  std::string fractional_part_;
  bool negative_{false};
  std::shared_ptr<const ArithmeticEngine> engine_;
};

DECIMA_EXPORT std::ostream& operator<<(std::ostream& os, const Decimal& decimal);

}  // namespace decima
