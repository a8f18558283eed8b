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

#include "txproc/transaction_source.h"

#include <fstream>
#include <string_view>
#include <utility>
#include <variant>

#include "txproc/internal/logging.h"

namespace txproc {

namespace {
bool IsBlank(std::string_view line) { return line.find_first_not_of(" \t\r\n") == std::string_view::npos; }

// Header fields may carry whitespace, `type, client, tx, amount` is fine.
bool IsHeader(std::string_view line) {
  std::string compact;
  for (char c : line) {
    if (c != ' ' && c != '\t' && c != '\r') {
      compact.push_back(c);
    }
  }
  return compact == CsvTransactionSource::kHeader;
}
}  // namespace

CsvTransactionSource::CsvTransactionSource(const std::string& path)
    : CsvTransactionSource(std::make_unique<std::ifstream>(path), path) {}

CsvTransactionSource::CsvTransactionSource(std::unique_ptr<std::istream> input, std::string input_name)
    : input_(std::move(input)), input_name_(std::move(input_name)) {
  TXP_THROW_CHECK(input_ != nullptr) << "No input stream given for " << input_name_;
  TXP_THROW_IF(!*input_) << "Can't open input " << input_name_;
  ReadHeader();
}

void CsvTransactionSource::ReadHeader() {
  std::string line;
  while (std::getline(*input_, line)) {
    line_number_++;
    if (IsBlank(line)) {
      continue;
    }
    TXP_THROW_CHECK(IsHeader(line)) << "Bad header in " << input_name_ << " at line " << line_number_ << ", expected `"
                                    << kHeader << "`, got `" << line << "`";
    return;
  }
  TXP_THROW << "Missing header in " << input_name_ << ", expected `" << kHeader << "`";
}

std::optional<Transaction> CsvTransactionSource::Next() {
  std::string line;
  while (std::getline(*input_, line)) {
    line_number_++;
    if (IsBlank(line)) {
      continue;
    }
    auto result = ParseTransaction(line);
    if (auto* tx = std::get_if<Transaction>(&result)) {
      return *tx;
    }
    skipped_records_++;
    internal::logging::Warn("Skipping record at {}:{}, {}, record=`{}`", input_name_, line_number_,
                            ToString(std::get<ParseError>(result)), line);
  }
  TXP_THROW_IF(input_->bad()) << "Failed reading " << input_name_ << " after line " << line_number_;
  return std::nullopt;
}

}  // namespace txproc
