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

/// \file decima/result.h
/// \brief Error kinds and the Result/Status aliases used across the library.

#include <expected>
#include <format>
#include <string>
#include <string_view>

#include "decima/decima_export.h"

namespace decima {

/// \brief Error types for decima.
enum class ErrorKind {
  kDivisionByZero,
  kInvalidInput,
  kJsonParseError,
  kNotSupported,
  kOverflow,
  kPrecisionLoss,
};

/// \brief Error with a kind and a message.
struct DECIMA_EXPORT [[nodiscard]] Error {
  ErrorKind kind;
  std::string message;
};

/// /brief Default error trait
template <typename T>
struct DefaultError {
  using type = Error;
};

/// \brief Result alias
template <typename T, typename E = typename DefaultError<T>::type>
using Result = std::expected<T, E>;

using Status = Result<void>;

/// \brief Macro to define error creation functions
#define DEFINE_ERROR_FUNCTION(name)                                           \
  template <typename... Args>                                                 \
  inline auto name(const std::format_string<Args...> fmt, Args&&... args)     \
      -> std::unexpected<Error> {                                             \
    return std::unexpected<Error>(                                            \
        {ErrorKind::k##name, std::format(fmt, std::forward<Args>(args)...)}); \
  }

DEFINE_ERROR_FUNCTION(DivisionByZero)
DEFINE_ERROR_FUNCTION(InvalidInput)
DEFINE_ERROR_FUNCTION(JsonParseError)
DEFINE_ERROR_FUNCTION(NotSupported)
DEFINE_ERROR_FUNCTION(Overflow)
DEFINE_ERROR_FUNCTION(PrecisionLoss)

#undef DEFINE_ERROR_FUNCTION

/// \brief Get the name of an error kind, e.g. "InvalidInput".
DECIMA_EXPORT std::string_view ToString(ErrorKind kind);

}  // namespace decima
