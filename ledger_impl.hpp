#ifndef LEDGER_IMPL_HPP_
#define LEDGER_IMPL_HPP_

#include "account.hpp"
#include "ledger.hpp"

#include <map>
#include <unordered_map>

namespace txledger {

// Implementation notes:
// - Everything lives in memory for the lifetime of the object; nothing is
//   ever removed from either map.
// - Accounts are created on the first operation that succeeds against
//   them. A failed call never adds an account.
// - Re-using a txid for a deposit or withdrawal overwrites the previous
//   history entry.
// - Dispute, resolve and chargeback apply to the `client` argument; the
//   owner recorded in the history entry is not consulted.

/**
 * In-memory Ledger keyed by client id and transaction id.
 * Accounts are visited in ascending client id order.
 */
class LedgerImpl : public Ledger {
 public:
  LedgerImpl() = default;

  OperationResult Deposit(TxId txid, ClientId client, const Decimal& amount) override;
  OperationResult Withdrawal(TxId txid, ClientId client, const Decimal& amount) override;
  OperationResult Dispute(ClientId client, TxId txid) override;
  OperationResult Resolve(ClientId client, TxId txid) override;
  OperationResult Chargeback(ClientId client, TxId txid) override;

  void ForEachAccount(const AccountVisitor& visitor) const override;
  std::optional<AccountSummary> GetAccount(ClientId client) const override;
  std::optional<TransactionRecord> FindTransaction(TxId txid) const override;

 private:
  // Returns the account for `client`, creating an empty one if needed.
  Account& accountFor(ClientId client);
  // Existing account for `client`, or an empty one that is not stored.
  Account peekAccount(ClientId client) const;

  // Looks up `txid` and checks it is in `expected` state before `action`.
  // On success `*record` points at the history entry.
  std::optional<LedgerError> findInState(TxId txid, TransactionType action,
                                         DisputeState expected,
                                         TransactionRecord** record);

  void recordTransaction(TxId txid, TransactionType type, ClientId client,
                         const Decimal& amount);

  // Ordered so summaries come out sorted by client id.
  std::map<ClientId, Account> accounts_;
  // Deposits and withdrawals by txid; disputes only change their state.
  std::unordered_map<TxId, TransactionRecord> history_;
};

}  // namespace txledger

#endif  // LEDGER_IMPL_HPP_
