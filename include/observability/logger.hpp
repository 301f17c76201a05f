#ifndef CASHFLOW_OBSERVABILITY_LOGGER_HPP_
#define CASHFLOW_OBSERVABILITY_LOGGER_HPP_

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

namespace cashflow {
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

// "debug", "INFO", ... (case-insensitive). nullopt for anything else.
std::optional<LogLevel> parseLogLevel(const std::string& text);

/**
 * Structured logger with JSON-lines output and configurable log levels.
 * Thread-safe; one process-wide instance.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Set minimum log level
  void setLogLevel(LogLevel level);

  // Set output stream (default: std::cerr)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "");
  void info(const std::string& message, const std::string& component = "");
  void warn(const std::string& message, const std::string& component = "");
  void error(const std::string& message, const std::string& component = "");
  void fatal(const std::string& message, const std::string& component = "");

  // Structured logging with key-value pairs; the entry is written when the
  // builder goes out of scope.
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message, const std::string& component = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::unordered_map<std::string, std::string> fields_;
  };

  static std::string escapeJson(const std::string& text);

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message, const std::string& component,
           const std::unordered_map<std::string, std::string>& fields = {});

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) cashflow::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) cashflow::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) cashflow::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) cashflow::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) cashflow::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  cashflow::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace cashflow

#endif  // CASHFLOW_OBSERVABILITY_LOGGER_HPP_
