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

#include "decima/json_internal.h"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "decima/util/json_util_internal.h"
#include "decima/util/macros.h"

namespace decima {

namespace {

constexpr std::string_view kValue = "value";
constexpr std::string_view kScale = "scale";

}  // namespace

nlohmann::json ToJson(const Decimal& decimal) { return decimal.ToString(); }

Result<Decimal> DecimalFromJson(const nlohmann::json& json) {
  if (json.is_string()) {
    DECIMA_ASSIGN_OR_RAISE(auto text, GetTypedJsonValue<std::string>(json));
    return Decimal::Make(text);
  }
  if (json.is_number_unsigned()) {
    DECIMA_ASSIGN_OR_RAISE(auto value, GetTypedJsonValue<uint64_t>(json));
    return Decimal::Make(value);
  }
  if (json.is_number_integer()) {
    DECIMA_ASSIGN_OR_RAISE(auto value, GetTypedJsonValue<int64_t>(json));
    return Decimal::Make(value);
  }
  return JsonParseError("Cannot parse Decimal from {}", SafeDumpJson(json));
}

nlohmann::json ToJson(const DebugInfo& info) {
  nlohmann::json json;
  json[kValue] = info.value();
  json[kScale] = info.scale();
  return json;
}

Result<DebugInfo> DebugInfoFromJson(const nlohmann::json& json) {
  DECIMA_ASSIGN_OR_RAISE(auto value, GetJsonValue<std::string>(json, kValue));
  DECIMA_ASSIGN_OR_RAISE(auto scale, GetJsonValue<int32_t>(json, kScale));
  return DebugInfo(std::move(value), scale);
}

}  // namespace decima
