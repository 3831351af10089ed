#include "io/csv_transaction_reader.hpp"
#include "io/summary_writer.hpp"
#include "ledger_impl.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "replay/transaction_replayer.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace txledger;

// Test fixture wiring a replayer to a fresh ledger and private metrics
class TransactionReplayerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto& logger = observability::Logger::getInstance();
    saved_level_ = logger.getLogLevel();
    logger.setOutputStream(log_);
    logger.setLogLevel(observability::LogLevel::DEBUG);

    replayer_ = std::make_unique<replay::TransactionReplayer>(&ledger_, &metrics_);
    replayer_->setSummaryCallback(
        [this](const AccountSummary& summary) { emitted_.push_back(summary); });
  }

  void TearDown() override {
    auto& logger = observability::Logger::getInstance();
    logger.setLogLevel(saved_level_);
    logger.setOutputStream(std::cerr);
  }

  replay::TransactionReplayer::Stats replay(const std::string& csv) {
    std::istringstream input(csv);
    io::CsvTransactionReader reader(input);
    return replayer_->Run(reader);
  }

  LedgerImpl ledger_;
  observability::MetricsCollector metrics_;
  std::unique_ptr<replay::TransactionReplayer> replayer_;
  std::vector<AccountSummary> emitted_;
  std::ostringstream log_;
  observability::LogLevel saved_level_ = observability::LogLevel::INFO;
};

TEST_F(TransactionReplayerTest, EmitsSummaryPerAppliedTransaction) {
  auto stats = replay(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 1.0\n"
      "deposit, 2, 2, 2.0\n"
      "deposit, 1, 3, 2.0\n"
      "withdrawal, 1, 4, 1.5\n"
      "withdrawal, 2, 5, 3.0\n");

  EXPECT_EQ(stats.records_read, 5u);
  EXPECT_EQ(stats.applied, 4u);
  EXPECT_EQ(stats.rejected, 1u);
  EXPECT_EQ(stats.rejected_by_kind[LedgerError::Kind::INSUFFICIENT_FUNDS], 1u);

  ASSERT_EQ(emitted_.size(), 4u);
  EXPECT_EQ(emitted_[0].client, 1);
  EXPECT_EQ(emitted_[0].available.toString(), "1.0");
  EXPECT_EQ(emitted_[2].available.toString(), "3.0");
  EXPECT_EQ(emitted_[3].available.toString(), "1.5");

  auto accounts = ledger_.ListAccounts();
  ASSERT_EQ(accounts.size(), 2u);
  EXPECT_EQ(accounts[0].total.toString(), "1.5");
  EXPECT_EQ(accounts[1].total.toString(), "2.0");

  EXPECT_EQ(metrics_.counterValue("txledger_transactions_applied_total"), 4.0);
  EXPECT_EQ(metrics_.counterValue("txledger_rejected_insufficient_funds_total"), 1.0);
  EXPECT_EQ(metrics_.gaugeValue("txledger_accounts"), 2.0);
}

TEST_F(TransactionReplayerTest, DisputeFlowAndRejections) {
  auto stats = replay(
      "type,client,tx,amount\n"
      "deposit,1,1,10\n"
      "deposit,1,2,5\n"
      "dispute,1,2,\n"
      "dispute,1,2,\n"
      "resolve,1,99,\n"
      "chargeback,1,2,\n"
      "withdrawal,1,3,1\n"
      "bogus,1,4,1\n");

  EXPECT_EQ(stats.records_read, 7u);
  EXPECT_EQ(stats.applied, 5u);
  EXPECT_EQ(stats.rejected, 2u);
  EXPECT_EQ(stats.malformed_rows, 1u);
  EXPECT_EQ(stats.rejected_by_kind[LedgerError::Kind::TX_IN_WRONG_STATE], 1u);
  EXPECT_EQ(stats.rejected_by_kind[LedgerError::Kind::TX_NOT_FOUND], 1u);

  auto account = ledger_.GetAccount(1);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->available, Decimal::parse("9"));
  EXPECT_EQ(account->held, Decimal::zero());
  EXPECT_TRUE(account->locked);

  EXPECT_NE(log_.str().find("Transaction rejected"), std::string::npos);
  EXPECT_NE(log_.str().find("tx_not_found"), std::string::npos);
  EXPECT_NE(log_.str().find("Replay finished"), std::string::npos);
}

TEST_F(TransactionReplayerTest, ContractViolationIsDroppedAndReplayContinues) {
  ledger_.Deposit(1, 1, Decimal::parse("5"));
  ASSERT_TRUE(ledger_.Dispute(1, 1).ok());

  // Client 2 has nothing held, so releasing tx 1 against it cannot succeed.
  io::TransactionInput resolve;
  resolve.type = TransactionType::RESOLVE;
  resolve.client = 2;
  resolve.txid = 1;
  EXPECT_FALSE(replayer_->Apply(resolve));
  EXPECT_EQ(replayer_->getStats().contract_violations, 1u);
  EXPECT_NE(log_.str().find("Contract violation, record dropped"), std::string::npos);

  io::TransactionInput negative;
  negative.type = TransactionType::DEPOSIT;
  negative.client = 1;
  negative.txid = 2;
  negative.amount = Decimal::parse("-1");
  EXPECT_FALSE(replayer_->Apply(negative));
  EXPECT_EQ(replayer_->getStats().contract_violations, 2u);

  resolve.client = 1;
  EXPECT_TRUE(replayer_->Apply(resolve));
  ASSERT_EQ(emitted_.size(), 1u);
  EXPECT_EQ(emitted_[0].available, Decimal::parse("5"));
  EXPECT_EQ(metrics_.counterValue("txledger_contract_violations_total"), 2.0);
}

TEST_F(TransactionReplayerTest, WritesCsvOutput) {
  std::ostringstream out;
  io::CsvSummaryWriter writer(out);
  replayer_->setSummaryCallback(
      [&writer](const AccountSummary& summary) { writer.write(summary); });

  replay(
      "type, client, tx, amount\n"
      "deposit, 100, 1, 5.12345\n"
      "withdrawal, 100, 2, 6\n"
      "deposit, 100, 3, 3\n"
      "dispute, 100, 3,\n"
      "chargeback, 100, 3,\n");

  EXPECT_EQ(out.str(),
            "client,available,held,total,locked\n"
            "100,5.12345,0,5.12345,false\n"
            "100,8.12345,0,8.12345,false\n"
            "100,5.12345,3,8.12345,false\n"
            "100,5.12345,0,5.12345,true\n");
}
