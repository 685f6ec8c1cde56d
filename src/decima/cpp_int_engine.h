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

/// \file decima/cpp_int_engine.h
/// \brief ArithmeticEngine backed by boost::multiprecision::cpp_int.

#include <memory>

#include "decima/arithmetic_engine.h"
#include "decima/decima_export.h"

namespace decima {

/// \brief Fixed-point arithmetic on unbounded integers.
///
/// Each operand is held as an unscaled cpp_int together with its scale, so
/// `-12.340` is (-12340, 3). Operations align scales, compute exactly and
/// truncate the result to the requested scale.
class DECIMA_EXPORT CppIntEngine : public ArithmeticEngine {
 public:
  static std::shared_ptr<CppIntEngine> Make();

  std::string_view name() const override { return "cpp_int"; }

  Result<std::string> Add(std::string_view lhs, std::string_view rhs,
                          int32_t scale) const override;
  Result<std::string> Subtract(std::string_view lhs, std::string_view rhs,
                               int32_t scale) const override;
  Result<std::string> Multiply(std::string_view lhs, std::string_view rhs,
                               int32_t scale) const override;
  Result<std::string> Divide(std::string_view lhs, std::string_view rhs,
                             int32_t scale) const override;
  Result<std::string> Pow(std::string_view base, std::string_view exponent,
                          int32_t scale) const override;
  Result<std::string> Sqrt(std::string_view operand, int32_t scale) const override;
  Result<std::string> Mod(std::string_view lhs, std::string_view rhs,
                          int32_t scale) const override;
  Result<int> Compare(std::string_view lhs, std::string_view rhs,
                      int32_t scale) const override;
};

}  // namespace decima
