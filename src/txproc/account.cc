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

#include "txproc/account.h"

#include "txproc/internal/logging.h"

namespace txproc {

std::string_view ToString(ApplyError error) {
  switch (error) {
    case ApplyError::kDuplicateTxId:
      return "duplicate tx id";
    case ApplyError::kInsufficientFunds:
      return "insufficient funds";
    case ApplyError::kUnknownTx:
      return "unknown tx";
    case ApplyError::kInvalidDisputeState:
      return "invalid dispute state";
    case ApplyError::kAccountLocked:
      return "account locked";
    case ApplyError::kAmountOverflow:
      return "amount overflow";
  }
  TXP_THROW << "Invalid apply error: " << static_cast<int>(error);
}

std::ostream& operator<<(std::ostream& os, ApplyError error) { return os << ToString(error); }

std::string_view ToString(DisputeStatus status) {
  switch (status) {
    case DisputeStatus::kNormal:
      return "normal";
    case DisputeStatus::kDisputed:
      return "disputed";
    case DisputeStatus::kResolved:
      return "resolved";
    case DisputeStatus::kChargedBack:
      return "charged back";
  }
  TXP_THROW << "Invalid dispute status: " << static_cast<int>(status);
}

std::ostream& operator<<(std::ostream& os, DisputeStatus status) { return os << ToString(status); }

ApplyResult Account::Apply(const Transaction& tx) {
  if (locked_) {
    return ApplyError::kAccountLocked;
  }
  switch (tx.GetKind()) {
    case TransactionKind::kDeposit:
      return ApplyDeposit(tx);
    case TransactionKind::kWithdrawal:
      return ApplyWithdrawal(tx);
    case TransactionKind::kDispute:
      return ApplyDispute(tx);
    case TransactionKind::kResolve:
      return ApplyResolve(tx);
    case TransactionKind::kChargeback:
      return ApplyChargeback(tx);
  }
  TXP_THROW << "Invalid transaction kind: " << static_cast<int>(tx.GetKind());
}

const LedgerEntry* Account::FindLedgerEntry(TxId tx_id) const {
  auto iter = ledger_.find(tx_id);
  return iter == ledger_.end() ? nullptr : &iter->second;
}

void Account::CheckInvariants() const {
  TXP_THROW_CHECK_GE(available_, Amount()) << "client=" << client_id_;
  TXP_THROW_CHECK_GE(held_, Amount()) << "client=" << client_id_;
  for (const auto& [tx_id, entry] : ledger_) {
    TXP_THROW_CHECK_GE(entry.amount, Amount()) << "client=" << client_id_ << ", tx=" << tx_id;
  }
}

ApplyResult Account::ApplyDeposit(const Transaction& tx) {
  if (ledger_.contains(tx.GetTxId())) {
    return ApplyError::kDuplicateTxId;
  }
  const Amount amount = tx.GetAmount().value();
  // held only moves funds out of available, so a representable total keeps both parts representable
  if (!GetTotal().CheckedAdd(amount).has_value()) {
    return ApplyError::kAmountOverflow;
  }
  available_ += amount;
  ledger_.emplace(tx.GetTxId(), LedgerEntry {.amount = amount, .origin = TransactionKind::kDeposit});
  return std::nullopt;
}

ApplyResult Account::ApplyWithdrawal(const Transaction& tx) {
  if (ledger_.contains(tx.GetTxId())) {
    return ApplyError::kDuplicateTxId;
  }
  const Amount amount = tx.GetAmount().value();
  if (available_ < amount) {
    return ApplyError::kInsufficientFunds;
  }
  available_ -= amount;
  ledger_.emplace(tx.GetTxId(), LedgerEntry {.amount = amount, .origin = TransactionKind::kWithdrawal});
  return std::nullopt;
}

ApplyResult Account::ApplyDispute(const Transaction& tx) {
  auto iter = ledger_.find(tx.GetTxId());
  if (iter == ledger_.end()) {
    return ApplyError::kUnknownTx;
  }
  LedgerEntry& entry = iter->second;
  if (entry.status != DisputeStatus::kNormal) {
    return ApplyError::kInvalidDisputeState;
  }
  if (entry.origin == TransactionKind::kWithdrawal && !policy_.allow_withdrawal_disputes) {
    return ApplyError::kInvalidDisputeState;
  }
  // the disputed funds may already be spent, holding them would drive available below zero
  if (available_ < entry.amount) {
    return ApplyError::kInsufficientFunds;
  }
  available_ -= entry.amount;
  held_ += entry.amount;
  entry.status = DisputeStatus::kDisputed;
  return std::nullopt;
}

ApplyResult Account::ApplyResolve(const Transaction& tx) {
  auto iter = ledger_.find(tx.GetTxId());
  if (iter == ledger_.end()) {
    return ApplyError::kUnknownTx;
  }
  LedgerEntry& entry = iter->second;
  if (entry.status != DisputeStatus::kDisputed) {
    return ApplyError::kInvalidDisputeState;
  }
  held_ -= entry.amount;
  available_ += entry.amount;
  entry.status = DisputeStatus::kResolved;
  return std::nullopt;
}

ApplyResult Account::ApplyChargeback(const Transaction& tx) {
  auto iter = ledger_.find(tx.GetTxId());
  if (iter == ledger_.end()) {
    return ApplyError::kUnknownTx;
  }
  LedgerEntry& entry = iter->second;
  if (entry.status != DisputeStatus::kDisputed) {
    return ApplyError::kInvalidDisputeState;
  }
  held_ -= entry.amount;
  entry.status = DisputeStatus::kChargedBack;
  locked_ = true;
  return std::nullopt;
}

}  // namespace txproc
