#include "io/csv_transaction_reader.hpp"
#include "io/summary_writer.hpp"
#include "ledger_impl.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "replay/replay_config.hpp"
#include "replay/transaction_replayer.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

}  // namespace

int main(int argc, char* argv[]) {
  using namespace txledger;

  const std::string program = argc > 0 ? argv[0] : "txledger_replay";
  std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  replay::ReplayConfig config;
  try {
    config = replay::ReplayConfig::fromArgs(args, std::getenv("TXLEDGER_LOG_LEVEL"));
  } catch (const std::invalid_argument& e) {
    std::cerr << program << ": " << e.what() << "\n\n"
              << replay::ReplayConfig::usage(program);
    return kExitUsage;
  }

  if (config.show_help) {
    std::cout << replay::ReplayConfig::usage(program);
    return kExitOk;
  }

  auto& logger = observability::Logger::getInstance();
  logger.setLogLevel(config.log_level);

  LOG_BUILDER(observability::LogLevel::INFO, "Starting replay")
      .field("input", config.input_path)
      .field("format", io::toString(config.format))
      .field("output", replay::toString(config.mode));

  try {
    std::ifstream input(config.input_path);
    if (!input) {
      throw std::runtime_error("failed to open input file " + config.input_path);
    }

    LedgerImpl ledger;
    auto writer = io::makeSummaryWriter(config.format, std::cout);

    replay::TransactionReplayer replayer(&ledger);
    if (config.mode == replay::OutputMode::EVENTS) {
      replayer.setSummaryCallback(
          [&writer](const AccountSummary& summary) { writer->write(summary); });
    }

    io::CsvTransactionReader reader(input);
    replayer.Run(reader);

    if (config.mode == replay::OutputMode::FINAL) {
      ledger.ForEachAccount([&writer](const AccountSummary& summary) { writer->write(summary); });
    }
    writer->flush();

  } catch (const std::exception& e) {
    LOG_FATAL(std::string("Replay failed: ") + e.what());
    return kExitFailure;
  }

  if (config.print_metrics) {
    std::cerr << observability::getGlobalMetrics().exportMetrics();
  }
  return kExitOk;
}
