#include "io/csv_transaction_reader.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <vector>

namespace txledger {
namespace io {

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

std::string trim(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(text.rbegin(), text.rend(),
                              [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::vector<std::string> splitFields(const std::string& row) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t comma = row.find(',', start);
    fields.push_back(trim(row.substr(start, comma - start)));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return fields;
}

template <typename T>
std::optional<T> parseUnsigned(const std::string& text) {
  unsigned long long value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last ||
      value > std::numeric_limits<T>::max()) {
    return std::nullopt;
  }
  return static_cast<T>(value);
}

bool isBlank(const std::string& line) {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

CsvTransactionReader::CsvTransactionReader(std::istream& input) : input_(input) {}

std::optional<TransactionInput> CsvTransactionReader::ReadNext() {
  std::string line;
  while (std::getline(input_, line)) {
    ++line_number_;
    if (isBlank(line)) continue;

    if (!seen_content_) {
      seen_content_ = true;
      if (line.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
        line.erase(0, kUtf8Bom.size());
      }
      const auto fields = splitFields(line);
      if (toLower(fields.front()) == "type") continue;
    }

    std::string reason;
    auto record = parseRow(line, reason);
    if (!record) {
      ++malformed_rows_;
      LOG_BUILDER(observability::LogLevel::WARN, "Skipping malformed transaction row")
          .field("line", static_cast<std::uint64_t>(line_number_))
          .field("reason", reason);
      continue;
    }
    record->line = line_number_;
    return record;
  }

  if (input_.bad()) {
    throw std::runtime_error("failed reading transaction input at line " +
                             std::to_string(line_number_));
  }
  return std::nullopt;
}

std::optional<TransactionInput> CsvTransactionReader::parseRow(const std::string& row,
                                                              std::string& reason) {
  const auto fields = splitFields(row);
  if (fields.size() < 3 || fields.size() > 4) {
    reason = "expected 3 or 4 columns, got " + std::to_string(fields.size());
    return std::nullopt;
  }

  auto type = parseTransactionType(toLower(fields[0]));
  if (!type) {
    reason = "unknown transaction type '" + fields[0] + "'";
    return std::nullopt;
  }

  auto client = parseUnsigned<ClientId>(fields[1]);
  if (!client) {
    reason = "invalid client id '" + fields[1] + "'";
    return std::nullopt;
  }

  auto txid = parseUnsigned<TxId>(fields[2]);
  if (!txid) {
    reason = "invalid transaction id '" + fields[2] + "'";
    return std::nullopt;
  }

  TransactionInput input;
  input.type = *type;
  input.client = *client;
  input.txid = *txid;

  // Dispute, resolve and chargeback reference an earlier amount; any value
  // in the column is ignored.
  if (*type != TransactionType::DEPOSIT && *type != TransactionType::WITHDRAWAL) {
    return input;
  }

  if (fields.size() < 4 || fields[3].empty()) {
    reason = "missing amount for " + toString(*type);
    return std::nullopt;
  }
  try {
    input.amount = Decimal::parse(fields[3]);
  } catch (const std::logic_error& e) {
    reason = e.what();
    return std::nullopt;
  }
  if (input.amount->isNegative()) {
    reason = "negative amount " + fields[3];
    return std::nullopt;
  }
  return input;
}

}  // namespace io
}  // namespace txledger
