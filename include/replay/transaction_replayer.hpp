#ifndef TRANSACTION_REPLAYER_HPP_
#define TRANSACTION_REPLAYER_HPP_

#include "io/csv_transaction_reader.hpp"
#include "ledger.hpp"
#include "observability/metrics.hpp"

#include <cstddef>
#include <functional>
#include <map>

namespace txledger {
namespace replay {

/**
 * Feeds transaction records into a Ledger strictly in input order.
 *
 * Domain failures are logged at DEBUG and dropped. Contract violations
 * thrown by the ledger (negative amounts, held underflow, decimal overflow)
 * are logged at ERROR and the record is dropped; the ledger is unchanged by
 * a call that throws, so the replay continues.
 */
class TransactionReplayer {
 public:
  using SummaryCallback = std::function<void(const AccountSummary&)>;

  struct Stats {
    std::size_t records_read = 0;
    std::size_t applied = 0;
    std::size_t rejected = 0;
    std::size_t contract_violations = 0;
    std::size_t malformed_rows = 0;
    std::map<LedgerError::Kind, std::size_t> rejected_by_kind;
  };

  explicit TransactionReplayer(Ledger* ledger,
                               observability::MetricsCollector* metrics =
                                   &observability::getGlobalMetrics());

  // Non-copyable
  TransactionReplayer(const TransactionReplayer&) = delete;
  TransactionReplayer& operator=(const TransactionReplayer&) = delete;

  /**
   * Set callback receiving the summary of every applied transaction.
   */
  void setSummaryCallback(SummaryCallback callback);

  /**
   * Applies one record. Returns true when the ledger accepted it.
   */
  bool Apply(const io::TransactionInput& input);

  /**
   * Applies every record of `reader` and returns the accumulated stats.
   */
  Stats Run(io::CsvTransactionReader& reader);

  const Stats& getStats() const { return stats_; }

 private:
  OperationResult dispatch(const io::TransactionInput& input);
  void recordRejection(const io::TransactionInput& input, const LedgerError& error);

  Ledger* ledger_;
  observability::MetricsCollector* metrics_;
  SummaryCallback callback_;
  Stats stats_;
};

}  // namespace replay
}  // namespace txledger

#endif  // TRANSACTION_REPLAYER_HPP_
