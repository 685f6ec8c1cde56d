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

#include "decima/rounding_mode.h"

#include "decima/util/string_util.h"

namespace decima {

std::string_view ToString(RoundingMode mode) {
  switch (mode) {
    case RoundingMode::kHalfUp:
      return "half-up";
    case RoundingMode::kCeil:
      return "ceil";
    case RoundingMode::kFloor:
      return "floor";
  }
  return "unknown";
}

Result<RoundingMode> RoundingModeFromString(std::string_view str) {
  if (StringUtils::EqualsIgnoreCase(str, "half-up")) {
    return RoundingMode::kHalfUp;
  }
  if (StringUtils::EqualsIgnoreCase(str, "ceil")) {
    return RoundingMode::kCeil;
  }
  if (StringUtils::EqualsIgnoreCase(str, "floor")) {
    return RoundingMode::kFloor;
  }
  return InvalidInput("Unknown rounding mode: '{}'", str);
}

}  // namespace decima
