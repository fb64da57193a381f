// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_CORE_EXCEPTIONS_H_
#define TRACECOV_CORE_EXCEPTIONS_H_

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tracecov {

// Base exception for all tracecov errors
class TracecovException : public std::runtime_error {
 public:
  explicit TracecovException(const std::string& message)
      : std::runtime_error(message) {}
};

// Analysis errors - a branch target that the script cannot resolve
class AnalysisException : public TracecovException {
 public:
  AnalysisException(const std::string& message,
                    const std::string& script_name,
                    int64_t address)
      : TracecovException(FormatMessage(message, script_name, address)),
        script_name_(script_name),
        address_(address) {}

  const std::string& script_name() const { return script_name_; }
  int64_t address() const { return address_; }

 private:
  std::string script_name_;
  int64_t address_;

  static std::string FormatMessage(const std::string& msg,
                                   const std::string& script,
                                   int64_t addr) {
    std::ostringstream oss;
    oss << "Analysis error in " << script << " at pc " << addr << ": " << msg;
    return oss.str();
  }
};

// Count merge between scripts that are not the same function body
class ScriptMismatchException : public TracecovException {
 public:
  explicit ScriptMismatchException(const std::string& message)
      : TracecovException("Script mismatch: " + message) {}
};

// Engine misuse, e.g. ParseData called from inside an observer
class EngineStateException : public TracecovException {
 public:
  explicit EngineStateException(const std::string& message)
      : TracecovException("Engine state error: " + message) {}
};

// Configuration errors - invalid settings or remap tables
class ConfigException : public TracecovException {
 public:
  explicit ConfigException(const std::string& message)
      : TracecovException("Configuration error: " + message) {}
};

}  // namespace tracecov

#endif  // TRACECOV_CORE_EXCEPTIONS_H_
