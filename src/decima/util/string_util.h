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

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "decima/decima_export.h"

namespace decima {

class DECIMA_EXPORT StringUtils {
 public:
  /// \brief Characters removed by Trim(): space, tab, newline, carriage return,
  /// NUL and vertical tab.
  static constexpr std::string_view kWhitespace{" \t\n\r\0\x0B", 6};

  static std::string_view Trim(std::string_view str) {
    auto begin = str.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
      return {};
    }
    auto end = str.find_last_not_of(kWhitespace);
    return str.substr(begin, end - begin + 1);
  }

  static bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(
        lhs, rhs, [](char lc, char rc) { return std::tolower(lc) == std::tolower(rc); });
  }

  static bool IsDigit(char c) { return c >= '0' && c <= '9'; }

  /// \brief True if `str` is non-empty and made of ASCII digits only.
  static bool IsDigits(std::string_view str) {
    return !str.empty() && std::ranges::all_of(str, IsDigit);
  }

  /// \brief Strip leading zeros, keeping at least one digit ("007" -> "7",
  /// "000" -> "0", "" -> "0").
  static std::string_view StripLeadingZeros(std::string_view digits) {
    auto pos = digits.find_first_not_of('0');
    if (pos == std::string_view::npos) {
      return "0";
    }
    return digits.substr(pos);
  }

  /// \brief Strip trailing zeros ("500" -> "5", "000" -> "").
  static std::string_view StripTrailingZeros(std::string_view digits) {
    auto pos = digits.find_last_not_of('0');
    if (pos == std::string_view::npos) {
      return {};
    }
    return digits.substr(0, pos + 1);
  }

  /// \brief Compare two unsigned digit strings by numeric value.
  ///
  /// Leading zeros are ignored. Returns -1, 0 or 1.
  static int CompareDigits(std::string_view lhs, std::string_view rhs) {
    lhs = StripLeadingZeros(lhs);
    rhs = StripLeadingZeros(rhs);
    if (lhs.size() != rhs.size()) {
      return lhs.size() < rhs.size() ? -1 : 1;
    }
    int cmp = lhs.compare(rhs);
    return (cmp > 0) - (cmp < 0);
  }
};

}  // namespace decima
