#ifndef CSV_TRANSACTION_READER_HPP_
#define CSV_TRANSACTION_READER_HPP_

#include "decimal.hpp"
#include "ledger_types.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace txledger {
namespace io {

/**
 * One parsed row of a transaction file.
 * `amount` is set for deposits and withdrawals only.
 */
struct TransactionInput {
  TransactionType type = TransactionType::DEPOSIT;
  ClientId client = 0;
  TxId txid = 0;
  std::optional<Decimal> amount;
  std::size_t line = 0;
};

/**
 * Streaming reader for "type,client,tx,amount" files.
 *
 * Columns are positional. If the first non-blank line (after an optional
 * UTF-8 byte order mark) has "type" in its first column it is treated as the
 * header and skipped. Whitespace around fields is ignored,
 * blank lines are skipped, and quoting is not supported. Rows that cannot be
 * turned into a TransactionInput are logged, counted and skipped.
 */
class CsvTransactionReader {
 public:
  explicit CsvTransactionReader(std::istream& input);

  // Non-copyable
  CsvTransactionReader(const CsvTransactionReader&) = delete;
  CsvTransactionReader& operator=(const CsvTransactionReader&) = delete;

  /**
   * Next well-formed record in file order, or nullopt at end of input.
   * Throws std::runtime_error if the underlying stream fails.
   */
  std::optional<TransactionInput> ReadNext();

  std::size_t linesRead() const { return line_number_; }
  std::size_t malformedRows() const { return malformed_rows_; }

  /**
   * Parses a single data row. Returns nullopt and sets `reason` when the row
   * is malformed.
   */
  static std::optional<TransactionInput> parseRow(const std::string& row, std::string& reason);

 private:
  std::istream& input_;
  std::size_t line_number_ = 0;
  std::size_t malformed_rows_ = 0;
  bool seen_content_ = false;
};

}  // namespace io
}  // namespace txledger

#endif  // CSV_TRANSACTION_READER_HPP_
