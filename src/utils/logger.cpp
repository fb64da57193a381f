// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "utils/logger.h"

namespace tracecov {
namespace utils {

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
  if (name == "debug") return LogLevel::DEBUG;
  if (name == "info") return LogLevel::INFO;
  if (name == "warning" || name == "warn") return LogLevel::WARNING;
  if (name == "error") return LogLevel::ERROR;
  return std::nullopt;
}

Logger& Logger::Instance() {
  static Logger instance;
  return instance;
}

void Logger::SetStreams(std::ostream* out, std::ostream* err) {
  out_ = out ? out : &std::cout;
  err_ = err ? err : &std::cerr;
}

void Logger::Debug(const std::string& message) {
  Log(LogLevel::DEBUG, "[DEBUG] ", message);
}

void Logger::Info(const std::string& message) {
  Log(LogLevel::INFO, "[INFO] ", message);
}

void Logger::Warning(const std::string& message) {
  Log(LogLevel::WARNING, "[WARNING] ", message);
}

void Logger::Error(const std::string& message) {
  Log(LogLevel::ERROR, "[ERROR] ", message);
}

void Logger::Log(LogLevel level, const char* prefix,
                 const std::string& message) {
  if (level < level_) {
    return;
  }
  std::ostream& stream = (level == LogLevel::ERROR) ? *err_ : *out_;
  stream << prefix << message << std::endl;
}

}  // namespace utils
}  // namespace tracecov
