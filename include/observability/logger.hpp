#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace txledger {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

std::string logLevelToString(LogLevel level);
// Case-insensitive; nullopt for unknown names.
std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe. Defaults to std::cerr so that stdout stays free for replay
 * output.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Set minimum log level
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool isEnabled(LogLevel level) const;

  // Set output stream (default: std::cerr)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "");
  void info(const std::string& message, const std::string& component = "");
  void warn(const std::string& message, const std::string& component = "");
  void error(const std::string& message, const std::string& component = "");
  void fatal(const std::string& message, const std::string& component = "");

  // Structured logging with key-value pairs, emitted on destruction.
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "");

    ~LogBuilder();

    LogBuilder(const LogBuilder&) = delete;
    LogBuilder& operator=(const LogBuilder&) = delete;

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, std::int64_t value);
    LogBuilder& field(const std::string& key, std::uint64_t value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, unsigned int value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    nlohmann::ordered_json fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const nlohmann::ordered_json& fields = nlohmann::ordered_json::object());

  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) txledger::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) txledger::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) txledger::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) txledger::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) txledger::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  txledger::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace txledger

#endif  // LOGGER_HPP_
