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

/// \file decima/rounding_mode.h
/// \brief Rounding modes understood by Decimal::Round.

#include <cstdint>
#include <string_view>

#include "decima/decima_export.h"
#include "decima/result.h"

namespace decima {

enum class RoundingMode : uint8_t {
  /// Round half away from zero.
  kHalfUp,
  /// Round toward positive infinity.
  kCeil,
  /// Round toward negative infinity.
  kFloor,
};

/// \brief Get the textual form of a rounding mode ("half-up", "ceil", "floor").
DECIMA_EXPORT std::string_view ToString(RoundingMode mode);

/// \brief Parse a rounding mode from its textual form, ignoring case.
DECIMA_EXPORT Result<RoundingMode> RoundingModeFromString(std::string_view str);

}  // namespace decima
