#include "io/summary_writer.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <sstream>

using namespace txledger;

namespace {

AccountSummary sample(ClientId client, const char* available, const char* held, bool locked) {
  AccountSummary summary;
  summary.client = client;
  summary.available = Decimal::parse(available);
  summary.held = Decimal::parse(held);
  summary.total = summary.available + summary.held;
  summary.locked = locked;
  return summary;
}

}  // namespace

TEST(SummaryWriterTest, CsvWritesHeaderOnce) {
  std::ostringstream out;
  io::CsvSummaryWriter writer(out);
  writer.write(sample(1, "1.5", "0", false));
  writer.write(sample(2, "4.11345", "9", true));
  writer.flush();

  EXPECT_EQ(out.str(),
            "client,available,held,total,locked\n"
            "1,1.5,0,1.5,false\n"
            "2,4.11345,9,13.11345,true\n");
}

TEST(SummaryWriterTest, CsvWritesNothingWithoutRows) {
  std::ostringstream out;
  io::CsvSummaryWriter writer(out);
  writer.flush();
  EXPECT_TRUE(out.str().empty());
}

TEST(SummaryWriterTest, JsonKeepsAmountsAsStrings) {
  std::ostringstream out;
  auto writer = io::makeSummaryWriter(io::OutputFormat::JSON, out);
  writer->write(sample(100, "0.000000000000000001", "3", true));
  writer->flush();

  EXPECT_EQ(out.str(),
            "{\"client\":100,\"available\":\"0.000000000000000001\",\"held\":\"3\","
            "\"total\":\"3.000000000000000001\",\"locked\":true}\n");

  auto parsed = nlohmann::json::parse(out.str());
  EXPECT_TRUE(parsed["available"].is_string());
  EXPECT_EQ(parsed["client"].get<int>(), 100);
  EXPECT_TRUE(parsed["locked"].get<bool>());
}

TEST(SummaryWriterTest, ParsesFormatNames) {
  EXPECT_EQ(io::parseOutputFormat("csv"), io::OutputFormat::CSV);
  EXPECT_EQ(io::parseOutputFormat("json"), io::OutputFormat::JSON);
  EXPECT_EQ(io::parseOutputFormat("jsonl"), io::OutputFormat::JSON);
  EXPECT_FALSE(io::parseOutputFormat("xml").has_value());
  EXPECT_EQ(io::toString(io::OutputFormat::JSON), "json");
}
