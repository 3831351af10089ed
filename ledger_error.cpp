#include "ledger_error.hpp"

#include <stdexcept>
#include <utility>

namespace txledger {

LedgerError LedgerError::insufficientFunds(const Decimal& available, const Decimal& required) {
  LedgerError error;
  error.kind = Kind::INSUFFICIENT_FUNDS;
  error.available = available;
  error.required = required;
  return error;
}

LedgerError LedgerError::txNotFound(TxId txid) {
  LedgerError error;
  error.kind = Kind::TX_NOT_FOUND;
  error.txid = txid;
  return error;
}

LedgerError LedgerError::txInWrongState(TxId txid, TransactionType action, DisputeState state) {
  LedgerError error;
  error.kind = Kind::TX_IN_WRONG_STATE;
  error.txid = txid;
  error.action = action;
  error.state = state;
  return error;
}

std::string LedgerError::message() const {
  switch (kind) {
    case Kind::INSUFFICIENT_FUNDS:
      return "insufficient funds: available " + available.toString() +
             ", required " + required.toString();
    case Kind::TX_NOT_FOUND:
      return "transaction " + std::to_string(txid) + " not found";
    case Kind::TX_IN_WRONG_STATE:
      return "cannot " + toString(action) + " transaction " + std::to_string(txid) +
             " in state " + toString(state);
    default:
      return "unknown ledger error";
  }
}

bool LedgerError::operator==(const LedgerError& other) const {
  if (kind != other.kind) return false;
  switch (kind) {
    case Kind::INSUFFICIENT_FUNDS:
      return available == other.available && required == other.required;
    case Kind::TX_NOT_FOUND:
      return txid == other.txid;
    case Kind::TX_IN_WRONG_STATE:
      return txid == other.txid && action == other.action && state == other.state;
    default:
      return false;
  }
}

std::string toString(LedgerError::Kind kind) {
  switch (kind) {
    case LedgerError::Kind::INSUFFICIENT_FUNDS: return "insufficient_funds";
    case LedgerError::Kind::TX_NOT_FOUND: return "tx_not_found";
    case LedgerError::Kind::TX_IN_WRONG_STATE: return "tx_in_wrong_state";
    default: return "unknown";
  }
}

OperationResult::OperationResult(std::variant<AccountSummary, LedgerError> value)
    : value_(std::move(value)) {}

OperationResult OperationResult::success(const AccountSummary& summary) {
  return OperationResult(summary);
}

OperationResult OperationResult::failure(const LedgerError& error) {
  return OperationResult(error);
}

const AccountSummary& OperationResult::summary() const {
  if (const auto* summary = std::get_if<AccountSummary>(&value_)) {
    return *summary;
  }
  throw std::logic_error("summary() called on failed operation");
}

const LedgerError& OperationResult::error() const {
  if (const auto* error = std::get_if<LedgerError>(&value_)) {
    return *error;
  }
  throw std::logic_error("error() called on successful operation");
}

}  // namespace txledger
