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

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "txproc/transaction.h"

namespace txproc {

/**
 * @brief A finite, single-pass sequence of transactions in input order. Only the dispatcher reads it, so
 * implementations don't need to be thread-safe.
 */
class TransactionSource {
 public:
  virtual ~TransactionSource() = default;

  // nullopt once the input is exhausted
  virtual std::optional<Transaction> Next() = 0;

  // Records that couldn't be turned into a transaction so far.
  virtual uint64_t SkippedRecords() const { return 0; }
};

class VectorTransactionSource : public TransactionSource {
 public:
  explicit VectorTransactionSource(std::vector<Transaction> transactions) : transactions_(std::move(transactions)) {}

  std::optional<Transaction> Next() override {
    if (next_index_ >= transactions_.size()) {
      return std::nullopt;
    }
    return transactions_[next_index_++];
  }

 private:
  std::vector<Transaction> transactions_;
  size_t next_index_ = 0;
};

/**
 * @brief Reads `type,client,tx,amount` CSV. The header line is mandatory. Records that fail to parse are logged with
 * their line number and skipped.
 */
class CsvTransactionSource : public TransactionSource {
 public:
  static constexpr char kHeader[] = "type,client,tx,amount";

  // Throws if the file can't be opened or the header is wrong.
  explicit CsvTransactionSource(const std::string& path);
  CsvTransactionSource(std::unique_ptr<std::istream> input, std::string input_name);

  std::optional<Transaction> Next() override;
  uint64_t SkippedRecords() const override { return skipped_records_; }

 private:
  std::unique_ptr<std::istream> input_;
  std::string input_name_;
  uint64_t line_number_ = 0;
  uint64_t skipped_records_ = 0;

  void ReadHeader();
};

}  // namespace txproc
