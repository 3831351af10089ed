#include "io/csv_transaction_reader.hpp"
#include "observability/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace txledger;
using txledger::io::CsvTransactionReader;
using txledger::io::TransactionInput;

// Malformed rows are logged; keep the log out of the test output.
class CsvTransactionReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability::Logger::getInstance().setOutputStream(log_);
  }

  void TearDown() override {
    observability::Logger::getInstance().setOutputStream(std::cerr);
  }

  std::ostringstream log_;
};

TEST_F(CsvTransactionReaderTest, ReadsRecordsInFileOrder) {
  std::istringstream input(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 1.0\n"
      "withdrawal,2,5,3.5\n"
      "dispute, 1, 1,\n"
      "resolve, 1, 1\n"
      "chargeback, 1, 1, \n");
  CsvTransactionReader reader(input);

  auto first = reader.ReadNext();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->type, TransactionType::DEPOSIT);
  EXPECT_EQ(first->client, 1);
  EXPECT_EQ(first->txid, 1u);
  ASSERT_TRUE(first->amount.has_value());
  EXPECT_EQ(first->amount->toString(), "1.0");
  EXPECT_EQ(first->line, 2u);

  auto second = reader.ReadNext();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->type, TransactionType::WITHDRAWAL);
  EXPECT_EQ(second->client, 2);
  EXPECT_EQ(second->txid, 5u);
  EXPECT_EQ(*second->amount, Decimal::parse("3.5"));

  auto dispute = reader.ReadNext();
  ASSERT_TRUE(dispute.has_value());
  EXPECT_EQ(dispute->type, TransactionType::DISPUTE);
  EXPECT_FALSE(dispute->amount.has_value());

  auto resolve = reader.ReadNext();
  ASSERT_TRUE(resolve.has_value());
  EXPECT_EQ(resolve->type, TransactionType::RESOLVE);

  auto chargeback = reader.ReadNext();
  ASSERT_TRUE(chargeback.has_value());
  EXPECT_EQ(chargeback->type, TransactionType::CHARGEBACK);

  EXPECT_FALSE(reader.ReadNext().has_value());
  EXPECT_EQ(reader.malformedRows(), 0u);
  EXPECT_EQ(reader.linesRead(), 6u);
}

TEST_F(CsvTransactionReaderTest, HeaderIsOptional) {
  std::istringstream input("deposit,3,9,2\r\n\n   \nwithdraw,3,10,1\n");
  CsvTransactionReader reader(input);

  auto deposit = reader.ReadNext();
  ASSERT_TRUE(deposit.has_value());
  EXPECT_EQ(deposit->line, 1u);
  EXPECT_EQ(*deposit->amount, Decimal::parse("2"));

  auto withdrawal = reader.ReadNext();
  ASSERT_TRUE(withdrawal.has_value());
  EXPECT_EQ(withdrawal->type, TransactionType::WITHDRAWAL);
  EXPECT_EQ(withdrawal->line, 4u);

  EXPECT_FALSE(reader.ReadNext().has_value());
}

TEST_F(CsvTransactionReaderTest, SkipsMalformedRows) {
  std::istringstream input(
      "type,client,tx,amount\n"
      "transfer,1,1,5\n"        // unknown type
      "deposit,70000,2,5\n"     // client out of range
      "deposit,1,-3,5\n"        // negative txid
      "deposit,1,4\n"           // missing amount
      "withdrawal,1,5,abc\n"    // bad amount
      "deposit,1,6,-5\n"        // negative amount
      "deposit,1,7,5,extra\n"   // too many columns
      "deposit,1\n"             // too few columns
      "Deposit,1,8,2.5\n");
  CsvTransactionReader reader(input);

  auto record = reader.ReadNext();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->txid, 8u);
  EXPECT_EQ(record->line, 10u);
  EXPECT_FALSE(reader.ReadNext().has_value());
  EXPECT_EQ(reader.malformedRows(), 8u);

  EXPECT_NE(log_.str().find("Skipping malformed transaction row"), std::string::npos);
  EXPECT_NE(log_.str().find("unknown transaction type 'transfer'"), std::string::npos);
}

TEST_F(CsvTransactionReaderTest, InvalidUtf8RowIsSkipped) {
  observability::Logger::getInstance().setLogLevel(observability::LogLevel::INFO);
  std::istringstream input(
      "type,client,tx,amount\n"
      "d\xe9p\xf4t,1,1,1.0\n"
      "deposit,1,2,2.0\n");
  CsvTransactionReader reader(input);

  auto record = reader.ReadNext();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->txid, 2u);
  EXPECT_EQ(record->line, 3u);
  EXPECT_FALSE(reader.ReadNext().has_value());
  EXPECT_EQ(reader.malformedRows(), 1u);

  // The offending bytes are logged as U+FFFD replacement characters.
  EXPECT_NE(log_.str().find("Skipping malformed transaction row"), std::string::npos);
  EXPECT_NE(log_.str().find("d\xEF\xBF\xBDp\xEF\xBF\xBDt"), std::string::npos);
}

TEST_F(CsvTransactionReaderTest, HeaderAfterBlankLines) {
  std::istringstream input(
      "\n"
      "   \n"
      "type,client,tx,amount\n"
      "deposit,3,1,4\n");
  CsvTransactionReader reader(input);

  auto record = reader.ReadNext();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->client, 3);
  EXPECT_EQ(record->line, 4u);
  EXPECT_FALSE(reader.ReadNext().has_value());
  EXPECT_EQ(reader.malformedRows(), 0u);
}

TEST_F(CsvTransactionReaderTest, StripsByteOrderMark) {
  std::istringstream with_header(
      "\xEF\xBB\xBFtype,client,tx,amount\n"
      "deposit,3,1,4\n");
  CsvTransactionReader header_reader(with_header);
  auto first = header_reader.ReadNext();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->txid, 1u);
  EXPECT_EQ(header_reader.malformedRows(), 0u);

  std::istringstream without_header("\xEF\xBB\xBF" "deposit,3,7,4\n");
  CsvTransactionReader data_reader(without_header);
  auto second = data_reader.ReadNext();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->txid, 7u);
  EXPECT_EQ(data_reader.malformedRows(), 0u);
}

TEST(CsvTransactionReaderParseTest, AmountIgnoredForDisputes) {
  std::string reason;
  auto record = CsvTransactionReader::parseRow("dispute,4,11,not-a-number", reason);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->type, TransactionType::DISPUTE);
  EXPECT_EQ(record->client, 4);
  EXPECT_EQ(record->txid, 11u);
  EXPECT_FALSE(record->amount.has_value());
  EXPECT_TRUE(reason.empty());
}

TEST(CsvTransactionReaderParseTest, ReportsReason) {
  std::string reason;
  EXPECT_FALSE(CsvTransactionReader::parseRow("deposit,1,4294967296,1", reason).has_value());
  EXPECT_EQ(reason, "invalid transaction id '4294967296'");
}
