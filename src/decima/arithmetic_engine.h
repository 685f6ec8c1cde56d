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

/// \file decima/arithmetic_engine.h
/// \brief Arbitrary-precision arithmetic backend used by Decimal.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "decima/decima_export.h"
#include "decima/result.h"

namespace decima {

/// \brief Exact arithmetic over decimal strings.
///
/// Operands are plain decimal strings of the form `[-]digits[.digits]`.
/// Every operation takes the number of fractional digits wanted in the
/// result. Results carry exactly `scale` fractional digits (no radix mark
/// when `scale` is 0) and digits beyond the scale are truncated toward zero,
/// never rounded.
///
/// Implementations must be stateless or otherwise safe to share between
/// threads, because a single engine instance is shared by every Decimal
/// bound to it.
///
/// A result scale or a power-of-ten shift larger than kMaxDigits fails with
/// Overflow instead of exhausting memory.
class DECIMA_EXPORT ArithmeticEngine {
 public:
  /// \brief Upper bound on the number of digits of a scale, an exponent
  /// expansion or a power result.
  static constexpr int32_t kMaxDigits = 1'000'000;

  virtual ~ArithmeticEngine() = default;

  /// \brief A short name identifying the backend, e.g. "cpp_int".
  virtual std::string_view name() const = 0;

  virtual Result<std::string> Add(std::string_view lhs, std::string_view rhs,
                                  int32_t scale) const = 0;

  virtual Result<std::string> Subtract(std::string_view lhs, std::string_view rhs,
                                       int32_t scale) const = 0;

  virtual Result<std::string> Multiply(std::string_view lhs, std::string_view rhs,
                                       int32_t scale) const = 0;

  /// \brief Divide `lhs` by `rhs`.
  /// \return DivisionByZero if `rhs` is zero.
  virtual Result<std::string> Divide(std::string_view lhs, std::string_view rhs,
                                     int32_t scale) const = 0;

  /// \brief Raise `base` to an integral `exponent`.
  ///
  /// A negative exponent yields the reciprocal of the positive power.
  /// \return InvalidInput if the exponent has a non-zero fractional part,
  /// Overflow if it does not fit in 32 bits or the power would exceed
  /// kMaxDigits digits, DivisionByZero for a zero base raised to a negative
  /// power.
  virtual Result<std::string> Pow(std::string_view base, std::string_view exponent,
                                  int32_t scale) const = 0;

  /// \brief Square root of `operand`.
  /// \return InvalidInput if `operand` is negative.
  virtual Result<std::string> Sqrt(std::string_view operand, int32_t scale) const = 0;

  /// \brief Remainder of the truncated division of `lhs` by `rhs`.
  ///
  /// The result has the sign of `lhs`.
  /// \return DivisionByZero if `rhs` is zero.
  virtual Result<std::string> Mod(std::string_view lhs, std::string_view rhs,
                                  int32_t scale) const = 0;

  /// \brief Compare both operands after truncating them to `scale`.
  /// \return -1, 0 or 1.
  virtual Result<int> Compare(std::string_view lhs, std::string_view rhs,
                              int32_t scale) const = 0;

  /// \brief The engine used by Decimal values unless another one is bound.
  static const std::shared_ptr<const ArithmeticEngine>& Default();
};

}  // namespace decima
