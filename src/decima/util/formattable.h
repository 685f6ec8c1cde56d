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

/// \file decima/util/formattable.h
/// Interface for objects that can be formatted via std::format.  The
/// std::formatter specialization lives in decima/util/formatter.h so that
/// this header stays free of <format>.

#include <string>

#include "decima/decima_export.h"

namespace decima::util {

/// \brief Interface for objects that can be formatted via std::format.
///
/// Include decima/util/formatter.h when calling std::format.
class DECIMA_EXPORT Formattable {
 public:
  virtual ~Formattable() = default;

  /// \brief Get a user-readable string representation.
  virtual std::string ToString() const = 0;
};

}  // namespace decima::util
