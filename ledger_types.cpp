#include "ledger_types.hpp"

namespace txledger {

std::string toString(TransactionType type) {
  switch (type) {
    case TransactionType::DEPOSIT: return "deposit";
    case TransactionType::WITHDRAWAL: return "withdrawal";
    case TransactionType::DISPUTE: return "dispute";
    case TransactionType::RESOLVE: return "resolve";
    case TransactionType::CHARGEBACK: return "chargeback";
    default: return "unknown";
  }
}

std::string toString(DisputeState state) {
  switch (state) {
    case DisputeState::NORMAL: return "normal";
    case DisputeState::DISPUTED: return "disputed";
    case DisputeState::RESOLVED: return "resolved";
    case DisputeState::CHARGED_BACK: return "charged_back";
    default: return "unknown";
  }
}

std::optional<TransactionType> parseTransactionType(const std::string& tag) {
  if (tag == "deposit") return TransactionType::DEPOSIT;
  if (tag == "withdrawal" || tag == "withdraw") return TransactionType::WITHDRAWAL;
  if (tag == "dispute") return TransactionType::DISPUTE;
  if (tag == "resolve") return TransactionType::RESOLVE;
  if (tag == "chargeback") return TransactionType::CHARGEBACK;
  return std::nullopt;
}

}  // namespace txledger
