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

/// \file decima/decimal_properties.h
/// \brief Configurable defaults for constructing and rounding decimals.

#include <cstdint>
#include <string>
#include <unordered_map>

#include "decima/decima_export.h"
#include "decima/result.h"
#include "decima/rounding_mode.h"
#include "decima/util/config.h"

namespace decima {

/// \brief Properties controlling how Decimal values are built and rounded.
///
/// Properties are kept as strings so that they can be loaded from any
/// key-value source and validated in one place with FromMap().
class DECIMA_EXPORT DecimalProperties : public ConfigBase<DecimalProperties> {
 public:
  template <typename T>
  using Entry = const ConfigBase<DecimalProperties>::Entry<T>;

  /// \brief Scale applied on construction. A negative value means the scale is
  /// detected from the input.
  inline static Entry<int32_t> kScale{"decimal.scale", -1};
  /// \brief Reject inputs with more fractional digits than the scale allows
  /// instead of truncating them.
  inline static Entry<bool> kStrict{"decimal.strict", false};
  /// \brief Mode used by Decimal::Round when none is given explicitly.
  inline static Entry<RoundingMode> kRoundingMode{
      "decimal.rounding-mode", RoundingMode::kHalfUp,
      [](const RoundingMode& mode) { return std::string(ToString(mode)); },
      [](const std::string& str) -> RoundingMode {
        auto mode = RoundingModeFromString(str);
        if (!mode) {
          throw DecimaError(mode.error().message);
        }
        return *mode;
      }};

  /// \brief Build properties from a string map.
  ///
  /// Unknown keys are kept but ignored. Returns InvalidInput if a known key
  /// holds a value that cannot be converted.
  static Result<DecimalProperties> FromMap(
      const std::unordered_map<std::string, std::string>& properties);
};

}  // namespace decima
