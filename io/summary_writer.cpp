#include "io/summary_writer.hpp"

#include <stdexcept>

namespace txledger {
namespace io {

std::string toString(OutputFormat format) {
  switch (format) {
    case OutputFormat::CSV: return "csv";
    case OutputFormat::JSON: return "json";
    default: return "unknown";
  }
}

std::optional<OutputFormat> parseOutputFormat(const std::string& name) {
  if (name == "csv") return OutputFormat::CSV;
  if (name == "json" || name == "jsonl") return OutputFormat::JSON;
  return std::nullopt;
}

void SummaryWriter::flush() {
  out_.flush();
  if (!out_) {
    throw std::runtime_error("failed writing account summaries");
  }
}

void CsvSummaryWriter::write(const AccountSummary& summary) {
  if (!header_written_) {
    out_ << "client,available,held,total,locked\n";
    header_written_ = true;
  }
  out_ << summary.client << ','
       << summary.available << ','
       << summary.held << ','
       << summary.total << ','
       << (summary.locked ? "true" : "false") << '\n';
}

void JsonLinesSummaryWriter::write(const AccountSummary& summary) {
  out_ << toJson(summary).dump() << '\n';
}

nlohmann::ordered_json toJson(const AccountSummary& summary) {
  nlohmann::ordered_json j;
  j["client"] = summary.client;
  j["available"] = summary.available.toString();
  j["held"] = summary.held.toString();
  j["total"] = summary.total.toString();
  j["locked"] = summary.locked;
  return j;
}

std::unique_ptr<SummaryWriter> makeSummaryWriter(OutputFormat format, std::ostream& out) {
  switch (format) {
    case OutputFormat::CSV:
      return std::make_unique<CsvSummaryWriter>(out);
    case OutputFormat::JSON:
      return std::make_unique<JsonLinesSummaryWriter>(out);
    default:
      throw std::invalid_argument("unsupported output format");
  }
}

}  // namespace io
}  // namespace txledger
