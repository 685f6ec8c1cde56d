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

/// \file decima/exception.h
/// Exception types for decima.  The library reports failures through
/// Result values.  Exceptions are only thrown where there is no return
/// channel: the parsing constructor of Decimal and its operator overloads.

#include <format>
#include <stdexcept>
#include <string>

#include "decima/decima_export.h"

namespace decima {

/// \brief Base exception class for exceptions thrown by decima.
class DECIMA_EXPORT DecimaError : public std::runtime_error {
 public:
  explicit DecimaError(const std::string& what) : std::runtime_error(what) {}
};

#define DECIMA_CHECK_OR_DIE(condition, ...)                 \
  do {                                                      \
    if (!(condition)) [[unlikely]] {                        \
      throw decima::DecimaError(std::format(__VA_ARGS__)); \
    }                                                       \
  } while (0)

}  // namespace decima
