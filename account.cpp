#include "account.hpp"

#include <stdexcept>
#include <string>

namespace txledger {

Account::Account(ClientId id) : id_(id) {}

AccountSummary Account::summary() const {
  AccountSummary summary;
  summary.client = id_;
  summary.available = available_;
  summary.held = held_;
  summary.total = available_ + held_;
  summary.locked = locked_;
  return summary;
}

std::optional<LedgerError> Account::requireAvailable(const Decimal& amount) const {
  if (available_ >= amount) {
    return std::nullopt;
  }
  return LedgerError::insufficientFunds(available_, amount);
}

void Account::credit(const Decimal& amount) {
  available_ += amount;
}

void Account::debit(const Decimal& amount) {
  available_ -= amount;
}

void Account::hold(const Decimal& amount) {
  // Compute both sides before assigning so an overflow leaves the account intact.
  Decimal available = available_ - amount;
  Decimal held = held_ + amount;
  available_ = available;
  held_ = held;
}

void Account::release(const Decimal& amount) {
  requireHeld(amount);
  Decimal available = available_ + amount;
  Decimal held = held_ - amount;
  available_ = available;
  held_ = held;
}

void Account::chargeBack(const Decimal& amount) {
  requireHeld(amount);
  held_ -= amount;
  locked_ = true;
}

void Account::requireHeld(const Decimal& amount) const {
  if (held_ < amount) {
    throw std::logic_error("held funds of client " + std::to_string(id_) + " (" +
                           held_.toString() + ") below released amount " +
                           amount.toString());
  }
}

}  // namespace txledger
