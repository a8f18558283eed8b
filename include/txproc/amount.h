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

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace txproc {

/**
 * @brief Fixed-point monetary value, four decimal places. Stored as a signed count of 1/10000 units so that sums are
 * exact.
 */
class Amount {
 public:
  static constexpr int64_t kScale = 10000;
  static constexpr int kFractionDigits = 4;

  constexpr Amount() = default;

  static constexpr Amount FromRaw(int64_t raw) { return Amount(raw); }
  static constexpr Amount FromUnits(int64_t units) { return Amount(units * kScale); }

  /**
   * @brief Parse a non-negative decimal like `12`, `1.5` or `.0001`. Signs, exponents, more than four fraction digits
   * and values that don't fit are rejected.
   */
  static std::optional<Amount> Parse(std::string_view text);

  constexpr int64_t Raw() const { return raw_; }
  constexpr bool IsNegative() const { return raw_ < 0; }

  // Always four decimals, e.g. `1.5000`.
  std::string ToString() const;

  // Empty if the sum does not fit.
  constexpr std::optional<Amount> CheckedAdd(Amount rhs) const {
    int64_t sum = 0;
    if (__builtin_add_overflow(raw_, rhs.raw_, &sum)) {
      return std::nullopt;
    }
    return Amount(sum);
  }

  constexpr Amount& operator+=(Amount rhs) {
    raw_ += rhs.raw_;
    return *this;
  }
  constexpr Amount& operator-=(Amount rhs) {
    raw_ -= rhs.raw_;
    return *this;
  }
  friend constexpr Amount operator+(Amount lhs, Amount rhs) { return lhs += rhs; }
  friend constexpr Amount operator-(Amount lhs, Amount rhs) { return lhs -= rhs; }

  friend constexpr auto operator<=>(const Amount&, const Amount&) = default;

  friend std::ostream& operator<<(std::ostream& os, const Amount& amount) { return os << amount.ToString(); }

 private:
  constexpr explicit Amount(int64_t raw) : raw_(raw) {}
  int64_t raw_ = 0;
};

}  // namespace txproc
