#include "replay/transaction_replayer.hpp"
#include "observability/logger.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace txledger {
namespace replay {

namespace {

constexpr const char* kRecordsRead = "txledger_records_read_total";
constexpr const char* kApplied = "txledger_transactions_applied_total";
constexpr const char* kRejected = "txledger_transactions_rejected_total";
constexpr const char* kContractViolations = "txledger_contract_violations_total";
constexpr const char* kMalformedRows = "txledger_rows_malformed_total";
constexpr const char* kAccounts = "txledger_accounts";
constexpr const char* kReplayDuration = "txledger_replay_duration_seconds";

std::string rejectedCounter(LedgerError::Kind kind) {
  return "txledger_rejected_" + toString(kind) + "_total";
}

}  // namespace

TransactionReplayer::TransactionReplayer(Ledger* ledger,
                                         observability::MetricsCollector* metrics)
    : ledger_(ledger), metrics_(metrics) {
  if (ledger_ == nullptr) {
    throw std::invalid_argument("TransactionReplayer requires a ledger");
  }
  if (metrics_ != nullptr) {
    metrics_->describe(kRecordsRead, "Well-formed records read from the input");
    metrics_->describe(kApplied, "Transactions accepted by the ledger");
    metrics_->describe(kRejected, "Transactions refused with a domain error");
    metrics_->describe(kContractViolations, "Records dropped on a contract violation");
    metrics_->describe(kMalformedRows, "Input rows that could not be parsed");
    metrics_->describe(kAccounts, "Accounts known to the ledger");
    metrics_->describe(kReplayDuration, "Wall time of a full replay");
  }
}

void TransactionReplayer::setSummaryCallback(SummaryCallback callback) {
  callback_ = std::move(callback);
}

OperationResult TransactionReplayer::dispatch(const io::TransactionInput& input) {
  switch (input.type) {
    case TransactionType::DEPOSIT:
    case TransactionType::WITHDRAWAL: {
      if (!input.amount) {
        throw std::invalid_argument("missing amount for " + toString(input.type) + " " +
                                    std::to_string(input.txid));
      }
      if (input.type == TransactionType::DEPOSIT) {
        return ledger_->Deposit(input.txid, input.client, *input.amount);
      }
      return ledger_->Withdrawal(input.txid, input.client, *input.amount);
    }
    case TransactionType::DISPUTE:
      return ledger_->Dispute(input.client, input.txid);
    case TransactionType::RESOLVE:
      return ledger_->Resolve(input.client, input.txid);
    case TransactionType::CHARGEBACK:
      return ledger_->Chargeback(input.client, input.txid);
    default:
      throw std::invalid_argument("unsupported transaction type");
  }
}

bool TransactionReplayer::Apply(const io::TransactionInput& input) {
  ++stats_.records_read;
  if (metrics_) metrics_->incrementCounter(kRecordsRead);

  try {
    OperationResult result = dispatch(input);
    if (!result) {
      recordRejection(input, result.error());
      return false;
    }

    ++stats_.applied;
    if (metrics_) metrics_->incrementCounter(kApplied);
    if (callback_) {
      callback_(result.summary());
    }
    return true;

  } catch (const std::logic_error& e) {
    ++stats_.contract_violations;
    if (metrics_) metrics_->incrementCounter(kContractViolations);
    LOG_BUILDER(observability::LogLevel::ERROR, "Contract violation, record dropped")
        .field("line", static_cast<std::uint64_t>(input.line))
        .field("type", toString(input.type))
        .field("client", static_cast<unsigned int>(input.client))
        .field("tx", input.txid)
        .field("error", e.what());
  } catch (const std::overflow_error& e) {
    ++stats_.contract_violations;
    if (metrics_) metrics_->incrementCounter(kContractViolations);
    LOG_BUILDER(observability::LogLevel::ERROR, "Amount overflow, record dropped")
        .field("line", static_cast<std::uint64_t>(input.line))
        .field("type", toString(input.type))
        .field("client", static_cast<unsigned int>(input.client))
        .field("tx", input.txid)
        .field("error", e.what());
  }
  return false;
}

void TransactionReplayer::recordRejection(const io::TransactionInput& input,
                                          const LedgerError& error) {
  ++stats_.rejected;
  ++stats_.rejected_by_kind[error.kind];
  if (metrics_) {
    metrics_->incrementCounter(kRejected);
    metrics_->incrementCounter(rejectedCounter(error.kind));
  }

  auto& logger = observability::Logger::getInstance();
  if (!logger.isEnabled(observability::LogLevel::DEBUG)) return;

  LOG_BUILDER(observability::LogLevel::DEBUG, "Transaction rejected")
      .field("line", static_cast<std::uint64_t>(input.line))
      .field("type", toString(input.type))
      .field("client", static_cast<unsigned int>(input.client))
      .field("tx", input.txid)
      .field("error", toString(error.kind))
      .field("detail", error.message());
}

TransactionReplayer::Stats TransactionReplayer::Run(io::CsvTransactionReader& reader) {
  {
    std::optional<observability::MetricsCollector::Timer> timer;
    if (metrics_) timer.emplace(*metrics_, kReplayDuration);

    while (auto input = reader.ReadNext()) {
      Apply(*input);
    }
  }

  stats_.malformed_rows += reader.malformedRows();
  if (metrics_) {
    metrics_->incrementCounter(kMalformedRows, static_cast<double>(reader.malformedRows()));
    metrics_->setGauge(kAccounts, static_cast<double>(ledger_->ListAccounts().size()));
  }

  LOG_BUILDER(observability::LogLevel::INFO, "Replay finished")
      .field("records", static_cast<std::uint64_t>(stats_.records_read))
      .field("applied", static_cast<std::uint64_t>(stats_.applied))
      .field("rejected", static_cast<std::uint64_t>(stats_.rejected))
      .field("contract_violations", static_cast<std::uint64_t>(stats_.contract_violations))
      .field("malformed_rows", static_cast<std::uint64_t>(stats_.malformed_rows));
  return stats_;
}

}  // namespace replay
}  // namespace txledger
