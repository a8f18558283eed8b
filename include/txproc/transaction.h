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

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <variant>

#include "txproc/amount.h"

namespace txproc {

using ClientId = uint16_t;
using TxId = uint32_t;

enum class TransactionKind : uint8_t {
  kDeposit = 0,
  kWithdrawal = 1,
  kDispute = 2,
  kResolve = 3,
  kChargeback = 4,
};

std::string_view ToString(TransactionKind kind);
std::optional<TransactionKind> ParseTransactionKind(std::string_view text);
std::ostream& operator<<(std::ostream& os, TransactionKind kind);

/**
 * @brief One instruction from the input. Immutable. Deposit and Withdrawal carry an amount, the dispute family
 * references an earlier Deposit/Withdrawal by tx id and carries none. Only constructible through the factories, so
 * the two shapes can't be mixed up.
 */
class Transaction {
 public:
  static Transaction Deposit(ClientId client_id, TxId tx_id, Amount amount);
  static Transaction Withdrawal(ClientId client_id, TxId tx_id, Amount amount);
  static Transaction Dispute(ClientId client_id, TxId tx_id);
  static Transaction Resolve(ClientId client_id, TxId tx_id);
  static Transaction Chargeback(ClientId client_id, TxId tx_id);

  TransactionKind GetKind() const { return kind_; }
  ClientId GetClientId() const { return client_id_; }
  TxId GetTxId() const { return tx_id_; }
  const std::optional<Amount>& GetAmount() const { return amount_; }

  friend bool operator==(const Transaction&, const Transaction&) = default;
  friend std::ostream& operator<<(std::ostream& os, const Transaction& tx);

 private:
  Transaction(TransactionKind kind, ClientId client_id, TxId tx_id, std::optional<Amount> amount)
      : kind_(kind), client_id_(client_id), tx_id_(tx_id), amount_(amount) {}

  TransactionKind kind_;
  ClientId client_id_;
  TxId tx_id_;
  std::optional<Amount> amount_;
};

enum class ParseError : uint8_t {
  kWrongFieldCount = 0,
  kUnknownType = 1,
  kBadClientId = 2,
  kBadTxId = 3,
  kBadAmount = 4,
  kMissingAmount = 5,
  kUnexpectedAmount = 6,
};

std::string_view ToString(ParseError error);
std::ostream& operator<<(std::ostream& os, ParseError error);

using ParseResult = std::variant<Transaction, ParseError>;

/**
 * @brief Parse one CSV record `type,client,tx[,amount]`. Whitespace around fields is ignored, an empty trailing amount
 * is accepted for dispute, resolve and chargeback.
 */
ParseResult ParseTransaction(std::string_view record);

}  // namespace txproc
