#ifndef LEDGER_TYPES_HPP_
#define LEDGER_TYPES_HPP_

#include "decimal.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace txledger {

using ClientId = std::uint16_t;
using TxId = std::uint32_t;

/**
 * The five transaction kinds a replay stream may carry.
 */
enum class TransactionType {
  DEPOSIT,
  WITHDRAWAL,
  DISPUTE,
  RESOLVE,
  CHARGEBACK
};

/**
 * Dispute status of a recorded deposit or withdrawal.
 * NORMAL -> DISPUTED -> {RESOLVED | CHARGED_BACK}; the last two are terminal.
 */
enum class DisputeState {
  NORMAL,
  DISPUTED,
  RESOLVED,
  CHARGED_BACK
};

std::string toString(TransactionType type);
std::string toString(DisputeState state);

// Accepts the lowercase tags used in transaction files ("withdraw" is an
// alias of "withdrawal").
std::optional<TransactionType> parseTransactionType(const std::string& tag);

/**
 * History entry for a deposit or withdrawal.
 */
struct TransactionRecord {
  TxId txid = 0;
  TransactionType type = TransactionType::DEPOSIT;
  ClientId client = 0;
  Decimal amount;
  DisputeState dispute_state = DisputeState::NORMAL;
};

/**
 * Read-only projection of an account. `total` is always available + held.
 */
struct AccountSummary {
  ClientId client = 0;
  Decimal available;
  Decimal held;
  Decimal total;
  bool locked = false;

  bool operator==(const AccountSummary& other) const {
    return client == other.client && available == other.available &&
           held == other.held && total == other.total && locked == other.locked;
  }
  bool operator!=(const AccountSummary& other) const { return !(*this == other); }
};

}  // namespace txledger

#endif  // LEDGER_TYPES_HPP_
