#ifndef ACCOUNT_HPP_
#define ACCOUNT_HPP_

#include "ledger_error.hpp"
#include "ledger_types.hpp"

#include <optional>

namespace txledger {

/**
 * Balance record of a single client.
 *
 * Mutators assume the caller already validated the operation; they never
 * fail with a domain error. `release` and `chargeBack` throw
 * std::logic_error if they would drive `held` below zero.
 */
class Account {
 public:
  explicit Account(ClientId id);

  ClientId id() const { return id_; }
  const Decimal& available() const { return available_; }
  const Decimal& held() const { return held_; }
  bool locked() const { return locked_; }

  AccountSummary summary() const;

  // Fails without mutating when available < amount.
  std::optional<LedgerError> requireAvailable(const Decimal& amount) const;

  void credit(const Decimal& amount);
  void debit(const Decimal& amount);

  // available -> held
  void hold(const Decimal& amount);
  // held -> available
  void release(const Decimal& amount);
  // held is removed from the account and the account is locked for good.
  void chargeBack(const Decimal& amount);

 private:
  void requireHeld(const Decimal& amount) const;

  ClientId id_;
  Decimal available_;
  Decimal held_;
  bool locked_ = false;
};

}  // namespace txledger

#endif  // ACCOUNT_HPP_
