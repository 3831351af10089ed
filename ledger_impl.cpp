#include "ledger_impl.hpp"

#include <stdexcept>
#include <string>

namespace txledger {

namespace {

void requireNonNegative(const Decimal& amount, TransactionType type, TxId txid) {
  if (amount.isNegative()) {
    throw std::invalid_argument("negative amount " + amount.toString() + " for " +
                                toString(type) + " " + std::to_string(txid));
  }
}

}  // namespace

// Mutations are staged on a copy of the account and committed only once
// every check and every arithmetic step has succeeded.

Account& LedgerImpl::accountFor(ClientId client) {
  return accounts_.try_emplace(client, client).first->second;
}

Account LedgerImpl::peekAccount(ClientId client) const {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    return Account(client);
  }
  return it->second;
}

std::optional<LedgerError> LedgerImpl::findInState(TxId txid, TransactionType action,
                                                   DisputeState expected,
                                                   TransactionRecord** record) {
  auto it = history_.find(txid);
  if (it == history_.end()) {
    return LedgerError::txNotFound(txid);
  }
  if (it->second.dispute_state != expected) {
    return LedgerError::txInWrongState(txid, action, it->second.dispute_state);
  }
  *record = &it->second;
  return std::nullopt;
}

void LedgerImpl::recordTransaction(TxId txid, TransactionType type, ClientId client,
                                   const Decimal& amount) {
  TransactionRecord record;
  record.txid = txid;
  record.type = type;
  record.client = client;
  record.amount = amount;
  record.dispute_state = DisputeState::NORMAL;
  history_.insert_or_assign(txid, record);
}

OperationResult LedgerImpl::Deposit(TxId txid, ClientId client, const Decimal& amount) {
  requireNonNegative(amount, TransactionType::DEPOSIT, txid);

  Account staged = peekAccount(client);
  staged.credit(amount);

  recordTransaction(txid, TransactionType::DEPOSIT, client, amount);
  Account& account = accountFor(client);
  account = staged;
  return OperationResult::success(account.summary());
}

OperationResult LedgerImpl::Withdrawal(TxId txid, ClientId client, const Decimal& amount) {
  requireNonNegative(amount, TransactionType::WITHDRAWAL, txid);

  Account staged = peekAccount(client);
  if (auto error = staged.requireAvailable(amount)) {
    return OperationResult::failure(*error);
  }
  staged.debit(amount);

  recordTransaction(txid, TransactionType::WITHDRAWAL, client, amount);
  Account& account = accountFor(client);
  account = staged;
  return OperationResult::success(account.summary());
}

OperationResult LedgerImpl::Dispute(ClientId client, TxId txid) {
  TransactionRecord* record = nullptr;
  if (auto error = findInState(txid, TransactionType::DISPUTE, DisputeState::NORMAL, &record)) {
    return OperationResult::failure(*error);
  }

  // Withdrawals are held the same way as deposits: the disputed amount
  // moves from available to held on the disputing client.
  Account staged = peekAccount(client);
  if (auto error = staged.requireAvailable(record->amount)) {
    return OperationResult::failure(*error);
  }
  staged.hold(record->amount);

  record->dispute_state = DisputeState::DISPUTED;
  Account& account = accountFor(client);
  account = staged;
  return OperationResult::success(account.summary());
}

OperationResult LedgerImpl::Resolve(ClientId client, TxId txid) {
  TransactionRecord* record = nullptr;
  if (auto error = findInState(txid, TransactionType::RESOLVE, DisputeState::DISPUTED, &record)) {
    return OperationResult::failure(*error);
  }

  Account staged = peekAccount(client);
  staged.release(record->amount);

  record->dispute_state = DisputeState::RESOLVED;
  Account& account = accountFor(client);
  account = staged;
  return OperationResult::success(account.summary());
}

OperationResult LedgerImpl::Chargeback(ClientId client, TxId txid) {
  TransactionRecord* record = nullptr;
  if (auto error = findInState(txid, TransactionType::CHARGEBACK, DisputeState::DISPUTED, &record)) {
    return OperationResult::failure(*error);
  }

  Account staged = peekAccount(client);
  staged.chargeBack(record->amount);

  record->dispute_state = DisputeState::CHARGED_BACK;
  Account& account = accountFor(client);
  account = staged;
  return OperationResult::success(account.summary());
}

void LedgerImpl::ForEachAccount(const AccountVisitor& visitor) const {
  for (const auto& [client, account] : accounts_) {
    visitor(account.summary());
  }
}

std::optional<AccountSummary> LedgerImpl::GetAccount(ClientId client) const {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second.summary();
}

std::optional<TransactionRecord> LedgerImpl::FindTransaction(TxId txid) const {
  auto it = history_.find(txid);
  if (it == history_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace txledger
