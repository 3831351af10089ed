#ifndef LEDGER_HPP_
#define LEDGER_HPP_

#include "decimal.hpp"
#include "ledger_error.hpp"
#include "ledger_types.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace txledger {

/**
 * Abstract base class for ledger operations.
 * Every mutating call either applies completely and returns the affected
 * account's summary, or fails with a LedgerError and changes nothing.
 */
class Ledger {
 public:
  using AccountVisitor = std::function<void(const AccountSummary&)>;

  virtual ~Ledger() = default;

  /**
   * Credits `amount` to `client` and records the deposit under `txid`.
   * Throws std::invalid_argument if `amount` is negative.
   */
  virtual OperationResult Deposit(TxId txid, ClientId client, const Decimal& amount) = 0;

  /**
   * Debits `amount` from `client` if enough funds are available.
   * Throws std::invalid_argument if `amount` is negative.
   */
  virtual OperationResult Withdrawal(TxId txid, ClientId client, const Decimal& amount) = 0;

  /** Moves the amount of `txid` from available to held on `client`. */
  virtual OperationResult Dispute(ClientId client, TxId txid) = 0;

  /** Releases the held amount of a disputed `txid` back to available. */
  virtual OperationResult Resolve(ClientId client, TxId txid) = 0;

  /** Drops the held amount of a disputed `txid` and locks `client`. */
  virtual OperationResult Chargeback(ClientId client, TxId txid) = 0;

  /**
   * Visits every known account. May be called any number of times.
   */
  virtual void ForEachAccount(const AccountVisitor& visitor) const = 0;

  /** Summary of a known account; never creates one. */
  virtual std::optional<AccountSummary> GetAccount(ClientId client) const = 0;

  /** Copy of the history entry recorded under `txid`. */
  virtual std::optional<TransactionRecord> FindTransaction(TxId txid) const = 0;

  /** Snapshot of ForEachAccount in visiting order. */
  std::vector<AccountSummary> ListAccounts() const {
    std::vector<AccountSummary> accounts;
    ForEachAccount([&accounts](const AccountSummary& summary) { accounts.push_back(summary); });
    return accounts;
  }
};

}  // namespace txledger

#endif  // LEDGER_HPP_
