// Copyright 2025 The txproc Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "txproc/amount.h"

#include <cstdlib>
#include <limits>

#include <spdlog/fmt/fmt.h>

namespace txproc {

namespace {
bool IsDigit(char c) { return c >= '0' && c <= '9'; }
}  // namespace

std::optional<Amount> Amount::Parse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto dot = text.find('.');
  std::string_view integer_part = text.substr(0, dot);
  std::string_view fraction_part = dot == std::string_view::npos ? std::string_view {} : text.substr(dot + 1);

  if (integer_part.empty() && fraction_part.empty()) {
    return std::nullopt;
  }
  if (fraction_part.size() > kFractionDigits) {
    return std::nullopt;
  }

  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  int64_t units = 0;
  for (char c : integer_part) {
    if (!IsDigit(c)) {
      return std::nullopt;
    }
    if (units > (kMax / kScale - (c - '0')) / 10) {
      return std::nullopt;
    }
    units = units * 10 + (c - '0');
  }

  int64_t fraction = 0;
  int64_t fraction_scale = kScale;
  for (char c : fraction_part) {
    if (!IsDigit(c)) {
      return std::nullopt;
    }
    fraction = fraction * 10 + (c - '0');
    fraction_scale /= 10;
  }
  fraction *= fraction_scale;

  if (units > (kMax - fraction) / kScale) {
    return std::nullopt;
  }
  return Amount(units * kScale + fraction);
}

std::string Amount::ToString() const {
  // raw_ may be INT64_MIN only through misuse, go through unsigned to stay defined
  uint64_t magnitude = raw_ < 0 ? 0 - static_cast<uint64_t>(raw_) : static_cast<uint64_t>(raw_);
  return fmt::format("{}{}.{:04}", raw_ < 0 ? "-" : "", magnitude / kScale, magnitude % kScale);
}

}  // namespace txproc
