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

/// \file decima/json_internal.h
/// \brief JSON serialization of decimals.

#include <nlohmann/json_fwd.hpp>

#include "decima/decima_export.h"
#include "decima/decimal.h"
#include "decima/result.h"

namespace decima {

/// \brief Serializes a `Decimal` to JSON.
///
/// The result is a bare JSON string holding Decimal::ToString(), so no digit
/// is lost to a binary floating-point JSON number.
DECIMA_EXPORT nlohmann::json ToJson(const Decimal& decimal);

/// \brief Deserializes a `Decimal` from JSON.
///
/// Accepts a JSON string in any form Decimal::Make understands, or a JSON
/// integer. JSON floating-point numbers are rejected because they may already
/// have lost precision.
///
/// \param json The JSON value representing a `Decimal`.
/// \return The Decimal, JsonParseError for an unsupported JSON type, or the
/// error from parsing the string.
DECIMA_EXPORT Result<Decimal> DecimalFromJson(const nlohmann::json& json);

/// \brief Serializes a `DebugInfo` to a JSON object with "value" and "scale".
DECIMA_EXPORT nlohmann::json ToJson(const DebugInfo& info);

/// \brief Deserializes a `DebugInfo` from JSON.
DECIMA_EXPORT Result<DebugInfo> DebugInfoFromJson(const nlohmann::json& json);

}  // namespace decima
