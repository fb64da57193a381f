// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_UTILS_LOGGER_H_
#define TRACECOV_UTILS_LOGGER_H_

#include <iostream>
#include <optional>
#include <string>

namespace tracecov {
namespace utils {

// Log levels
enum class LogLevel {
  DEBUG,
  INFO,
  WARNING,
  ERROR,
};

// "debug", "info", "warning"/"warn", "error" (case-sensitive)
std::optional<LogLevel> ParseLogLevel(const std::string& name);

// Process-wide logger. ERROR goes to the error stream, everything else to
// the output stream (stderr and stdout unless redirected).
class Logger {
 public:
  static Logger& Instance();

  void SetLevel(LogLevel level) { level_ = level; }
  LogLevel GetLevel() const { return level_; }

  // Redirect output; nullptr restores the standard stream
  void SetStreams(std::ostream* out, std::ostream* err);

  void Debug(const std::string& message);
  void Info(const std::string& message);
  void Warning(const std::string& message);
  void Error(const std::string& message);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

 private:
  Logger() : level_(LogLevel::INFO), out_(&std::cout), err_(&std::cerr) {}

  void Log(LogLevel level, const char* prefix, const std::string& message);

  LogLevel level_;
  std::ostream* out_;
  std::ostream* err_;
};

#define LOG_DEBUG(msg) tracecov::utils::Logger::Instance().Debug(msg)
#define LOG_INFO(msg) tracecov::utils::Logger::Instance().Info(msg)
#define LOG_WARNING(msg) tracecov::utils::Logger::Instance().Warning(msg)
#define LOG_ERROR(msg) tracecov::utils::Logger::Instance().Error(msg)

}  // namespace utils
}  // namespace tracecov

#endif  // TRACECOV_UTILS_LOGGER_H_
