#ifndef REPLAY_CONFIG_HPP_
#define REPLAY_CONFIG_HPP_

#include "io/summary_writer.hpp"
#include "observability/logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace txledger {
namespace replay {

enum class OutputMode {
  EVENTS,  // one summary per applied transaction, in input order
  FINAL    // one summary per account once the input is exhausted
};

std::string toString(OutputMode mode);
std::optional<OutputMode> parseOutputMode(const std::string& name);

/**
 * Settings of the replay tool.
 *
 *   txledger_replay <input.csv> [--format csv|json] [--output events|final]
 *                   [--log-level LEVEL] [--metrics]
 *
 * TXLEDGER_LOG_LEVEL supplies the log level when --log-level is absent.
 */
struct ReplayConfig {
  std::string input_path;
  io::OutputFormat format = io::OutputFormat::CSV;
  OutputMode mode = OutputMode::EVENTS;
  observability::LogLevel log_level = observability::LogLevel::WARN;
  bool print_metrics = false;
  bool show_help = false;

  /**
   * Parses command line arguments (without the program name).
   * `env_log_level` may be null. Throws std::invalid_argument on unknown
   * options, bad values or a missing input path.
   */
  static ReplayConfig fromArgs(const std::vector<std::string>& args,
                               const char* env_log_level = nullptr);

  static std::string usage(const std::string& program);
};

}  // namespace replay
}  // namespace txledger

#endif  // REPLAY_CONFIG_HPP_
