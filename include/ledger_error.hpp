#ifndef LEDGER_ERROR_HPP_
#define LEDGER_ERROR_HPP_

#include "ledger_types.hpp"

#include <string>
#include <variant>

namespace txledger {

/**
 * Recoverable domain failure of a ledger operation.
 *
 * Only the fields relevant to `kind` are meaningful:
 * - INSUFFICIENT_FUNDS: available, required
 * - TX_NOT_FOUND: txid
 * - TX_IN_WRONG_STATE: txid, action, state
 *
 * Contract violations (negative amounts, held underflow) are not modelled
 * here; they are thrown as exceptions.
 */
struct LedgerError {
  enum class Kind {
    INSUFFICIENT_FUNDS,
    TX_NOT_FOUND,
    TX_IN_WRONG_STATE
  };

  Kind kind = Kind::TX_NOT_FOUND;
  Decimal available;
  Decimal required;
  TxId txid = 0;
  TransactionType action = TransactionType::DISPUTE;
  DisputeState state = DisputeState::NORMAL;

  static LedgerError insufficientFunds(const Decimal& available, const Decimal& required);
  static LedgerError txNotFound(TxId txid);
  static LedgerError txInWrongState(TxId txid, TransactionType action, DisputeState state);

  std::string message() const;

  bool operator==(const LedgerError& other) const;
  bool operator!=(const LedgerError& other) const { return !(*this == other); }
};

std::string toString(LedgerError::Kind kind);

/**
 * Either the post-operation summary of the affected account or the domain
 * failure that left the ledger untouched.
 */
class OperationResult {
 public:
  static OperationResult success(const AccountSummary& summary);
  static OperationResult failure(const LedgerError& error);

  bool ok() const { return std::holds_alternative<AccountSummary>(value_); }
  explicit operator bool() const { return ok(); }

  // Throws std::logic_error when called on the wrong alternative.
  const AccountSummary& summary() const;
  const LedgerError& error() const;

 private:
  explicit OperationResult(std::variant<AccountSummary, LedgerError> value);

  std::variant<AccountSummary, LedgerError> value_;
};

}  // namespace txledger

#endif  // LEDGER_ERROR_HPP_
