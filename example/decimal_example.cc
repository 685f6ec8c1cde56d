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

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "decima/decimal.h"

int main(int argc, char** argv) {
  if (argc != 4) {
    std::cerr << "Usage: " << argv[0] << " <lhs> <rhs> <scale>" << std::endl;
    return 1;
  }

  auto lhs = decima::Decimal::Make(argv[1]);
  if (!lhs.has_value()) {
    std::cerr << "Failed to parse lhs: " << lhs.error().message << std::endl;
    return 1;
  }
  auto rhs = decima::Decimal::Make(argv[2]);
  if (!rhs.has_value()) {
    std::cerr << "Failed to parse rhs: " << rhs.error().message << std::endl;
    return 1;
  }
  auto scale = decima::Decimal::Make(argv[3]).and_then(
      [](const decima::Decimal& value) { return value.ToInt64(); });
  if (!scale.has_value()) {
    std::cerr << "Failed to parse scale: " << scale.error().message << std::endl;
    return 1;
  }
  if (scale.value() < 0 || scale.value() > std::numeric_limits<int32_t>::max()) {
    std::cerr << "Scale must be between 0 and " << std::numeric_limits<int32_t>::max()
              << ", was " << scale.value() << std::endl;
    return 1;
  }
  const auto result_scale = static_cast<int32_t>(scale.value());

  auto print = [](const std::string& label,
                  const decima::Result<decima::Decimal>& result) {
    if (result.has_value()) {
      std::cout << label << ": " << result.value() << std::endl;
    } else {
      std::cout << label << ": error: " << result.error().message << std::endl;
    }
  };

  print("sum", lhs->Add(*rhs, result_scale));
  print("difference", lhs->Subtract(*rhs, result_scale));
  print("product", lhs->Multiply(*rhs, result_scale));
  print("quotient", lhs->Divide(*rhs, result_scale));
  print("remainder", lhs->Mod(*rhs, result_scale));
  print("sqrt(lhs)", lhs->Sqrt(result_scale));
  print("round(lhs)", lhs->Round(result_scale));

  auto cmp = lhs->CompareTo(*rhs);
  if (!cmp.has_value()) {
    std::cerr << "Failed to compare: " << cmp.error().message << std::endl;
    return 1;
  }
  std::cout << "compare: " << cmp.value() << std::endl;
  std::cout << "lhs in scientific notation: " << lhs->ToScientific() << std::endl;
  return 0;
}
