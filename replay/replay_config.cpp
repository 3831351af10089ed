#include "replay/replay_config.hpp"

#include <stdexcept>

namespace txledger {
namespace replay {

std::string toString(OutputMode mode) {
  switch (mode) {
    case OutputMode::EVENTS: return "events";
    case OutputMode::FINAL: return "final";
    default: return "unknown";
  }
}

std::optional<OutputMode> parseOutputMode(const std::string& name) {
  if (name == "events") return OutputMode::EVENTS;
  if (name == "final") return OutputMode::FINAL;
  return std::nullopt;
}

namespace {

observability::LogLevel requireLogLevel(const std::string& value) {
  auto level = observability::parseLogLevel(value);
  if (!level) {
    throw std::invalid_argument("invalid log level: " + value);
  }
  return *level;
}

}  // namespace

ReplayConfig ReplayConfig::fromArgs(const std::vector<std::string>& args,
                                    const char* env_log_level) {
  ReplayConfig config;
  if (env_log_level != nullptr && *env_log_level != '\0') {
    config.log_level = requireLogLevel(env_log_level);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    auto nextValue = [&]() -> const std::string& {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("missing value for " + arg);
      }
      return args[++i];
    };

    if (arg == "-h" || arg == "--help") {
      config.show_help = true;
    } else if (arg == "--format") {
      const std::string& value = nextValue();
      auto format = io::parseOutputFormat(value);
      if (!format) {
        throw std::invalid_argument("invalid output format: " + value);
      }
      config.format = *format;
    } else if (arg == "--output") {
      const std::string& value = nextValue();
      auto mode = parseOutputMode(value);
      if (!mode) {
        throw std::invalid_argument("invalid output mode: " + value);
      }
      config.mode = *mode;
    } else if (arg == "--log-level") {
      config.log_level = requireLogLevel(nextValue());
    } else if (arg == "--metrics") {
      config.print_metrics = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::invalid_argument("unknown option: " + arg);
    } else if (config.input_path.empty()) {
      config.input_path = arg;
    } else {
      throw std::invalid_argument("unexpected argument: " + arg);
    }
  }

  if (config.input_path.empty() && !config.show_help) {
    throw std::invalid_argument("no input file provided");
  }
  return config;
}

std::string ReplayConfig::usage(const std::string& program) {
  return "Usage: " + program + " <input.csv> [options]\n"
         "\n"
         "Replays deposits, withdrawals, disputes, resolves and chargebacks\n"
         "and writes account summaries to stdout.\n"
         "\n"
         "Options:\n"
         "  --format csv|json       output encoding (default: csv)\n"
         "  --output events|final   a summary per applied transaction, or\n"
         "                          every account once at the end (default: events)\n"
         "  --log-level LEVEL       debug, info, warn, error or fatal (default: warn,\n"
         "                          or $TXLEDGER_LOG_LEVEL)\n"
         "  --metrics               print replay metrics to stderr on exit\n"
         "  -h, --help              show this message\n";
}

}  // namespace replay
}  // namespace txledger
