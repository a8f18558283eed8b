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

#include "txproc/transaction.h"

#include <charconv>
#include <limits>
#include <vector>

#include "txproc/internal/logging.h"

namespace txproc {

std::string_view ToString(TransactionKind kind) {
  switch (kind) {
    case TransactionKind::kDeposit:
      return "deposit";
    case TransactionKind::kWithdrawal:
      return "withdrawal";
    case TransactionKind::kDispute:
      return "dispute";
    case TransactionKind::kResolve:
      return "resolve";
    case TransactionKind::kChargeback:
      return "chargeback";
  }
  TXP_THROW << "Invalid transaction kind: " << static_cast<int>(kind);
}

std::optional<TransactionKind> ParseTransactionKind(std::string_view text) {
  for (auto kind : {TransactionKind::kDeposit, TransactionKind::kWithdrawal, TransactionKind::kDispute,
                    TransactionKind::kResolve, TransactionKind::kChargeback}) {
    if (text == ToString(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, TransactionKind kind) { return os << ToString(kind); }

Transaction Transaction::Deposit(ClientId client_id, TxId tx_id, Amount amount) {
  TXP_THROW_CHECK(!amount.IsNegative()) << "Deposit amount must not be negative, tx=" << tx_id;
  return {TransactionKind::kDeposit, client_id, tx_id, amount};
}

Transaction Transaction::Withdrawal(ClientId client_id, TxId tx_id, Amount amount) {
  TXP_THROW_CHECK(!amount.IsNegative()) << "Withdrawal amount must not be negative, tx=" << tx_id;
  return {TransactionKind::kWithdrawal, client_id, tx_id, amount};
}

Transaction Transaction::Dispute(ClientId client_id, TxId tx_id) {
  return {TransactionKind::kDispute, client_id, tx_id, std::nullopt};
}

Transaction Transaction::Resolve(ClientId client_id, TxId tx_id) {
  return {TransactionKind::kResolve, client_id, tx_id, std::nullopt};
}

Transaction Transaction::Chargeback(ClientId client_id, TxId tx_id) {
  return {TransactionKind::kChargeback, client_id, tx_id, std::nullopt};
}

std::ostream& operator<<(std::ostream& os, const Transaction& tx) {
  os << tx.kind_ << "(client=" << tx.client_id_ << ",tx=" << tx.tx_id_;
  if (tx.amount_.has_value()) {
    os << ",amount=" << *tx.amount_;
  }
  return os << ")";
}

std::string_view ToString(ParseError error) {
  switch (error) {
    case ParseError::kWrongFieldCount:
      return "wrong field count";
    case ParseError::kUnknownType:
      return "unknown transaction type";
    case ParseError::kBadClientId:
      return "bad client id";
    case ParseError::kBadTxId:
      return "bad tx id";
    case ParseError::kBadAmount:
      return "bad amount";
    case ParseError::kMissingAmount:
      return "missing amount";
    case ParseError::kUnexpectedAmount:
      return "unexpected amount";
  }
  TXP_THROW << "Invalid parse error: " << static_cast<int>(error);
}

std::ostream& operator<<(std::ostream& os, ParseError error) { return os << ToString(error); }

namespace {
std::string_view Trim(std::string_view text) {
  constexpr std::string_view kWhitespace = " \t\r\n";
  auto begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

std::vector<std::string_view> SplitFields(std::string_view record) {
  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    auto comma = record.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(Trim(record.substr(start)));
      return fields;
    }
    fields.push_back(Trim(record.substr(start, comma - start)));
    start = comma + 1;
  }
}

template <class T>
std::optional<T> ParseUnsigned(std::string_view text) {
  uint64_t value = 0;
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (text.empty() || ec != std::errc() || ptr != last || value > std::numeric_limits<T>::max()) {
    return std::nullopt;
  }
  return static_cast<T>(value);
}
}  // namespace

ParseResult ParseTransaction(std::string_view record) {
  auto fields = SplitFields(record);
  if (fields.size() != 3 && fields.size() != 4) {
    return ParseError::kWrongFieldCount;
  }

  auto kind = ParseTransactionKind(fields[0]);
  if (!kind.has_value()) {
    return ParseError::kUnknownType;
  }
  auto client_id = ParseUnsigned<ClientId>(fields[1]);
  if (!client_id.has_value()) {
    return ParseError::kBadClientId;
  }
  auto tx_id = ParseUnsigned<TxId>(fields[2]);
  if (!tx_id.has_value()) {
    return ParseError::kBadTxId;
  }

  std::string_view amount_field = fields.size() == 4 ? fields[3] : std::string_view {};
  bool carries_amount = *kind == TransactionKind::kDeposit || *kind == TransactionKind::kWithdrawal;
  if (!carries_amount) {
    if (!amount_field.empty()) {
      return ParseError::kUnexpectedAmount;
    }
    switch (*kind) {
      case TransactionKind::kDispute:
        return Transaction::Dispute(*client_id, *tx_id);
      case TransactionKind::kResolve:
        return Transaction::Resolve(*client_id, *tx_id);
      default:
        return Transaction::Chargeback(*client_id, *tx_id);
    }
  }

  if (amount_field.empty()) {
    return ParseError::kMissingAmount;
  }
  auto amount = Amount::Parse(amount_field);
  if (!amount.has_value()) {
    return ParseError::kBadAmount;
  }
  if (*kind == TransactionKind::kDeposit) {
    return Transaction::Deposit(*client_id, *tx_id, *amount);
  }
  return Transaction::Withdrawal(*client_id, *tx_id, *amount);
}

}  // namespace txproc
