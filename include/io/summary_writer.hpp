#ifndef SUMMARY_WRITER_HPP_
#define SUMMARY_WRITER_HPP_

#include "ledger_types.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace txledger {
namespace io {

enum class OutputFormat {
  CSV,
  JSON
};

std::string toString(OutputFormat format);
std::optional<OutputFormat> parseOutputFormat(const std::string& name);

/**
 * Serializes account summaries to a stream, one line each.
 * Decimals are always written in their exact text form.
 */
class SummaryWriter {
 public:
  virtual ~SummaryWriter() = default;

  virtual void write(const AccountSummary& summary) = 0;

  // Flushes the stream; throws std::runtime_error if it went bad.
  void flush();

 protected:
  explicit SummaryWriter(std::ostream& out) : out_(out) {}

  std::ostream& out_;
};

/**
 * "client,available,held,total,locked" rows with a header written before
 * the first row.
 */
class CsvSummaryWriter : public SummaryWriter {
 public:
  explicit CsvSummaryWriter(std::ostream& out) : SummaryWriter(out) {}

  void write(const AccountSummary& summary) override;

 private:
  bool header_written_ = false;
};

/**
 * One JSON object per line. Amounts are JSON strings so no precision is
 * lost to a consumer's floating point parser.
 */
class JsonLinesSummaryWriter : public SummaryWriter {
 public:
  explicit JsonLinesSummaryWriter(std::ostream& out) : SummaryWriter(out) {}

  void write(const AccountSummary& summary) override;
};

nlohmann::ordered_json toJson(const AccountSummary& summary);

std::unique_ptr<SummaryWriter> makeSummaryWriter(OutputFormat format, std::ostream& out);

}  // namespace io
}  // namespace txledger

#endif  // SUMMARY_WRITER_HPP_
