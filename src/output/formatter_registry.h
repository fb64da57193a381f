// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_OUTPUT_FORMATTER_REGISTRY_H_
#define TRACECOV_OUTPUT_FORMATTER_REGISTRY_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "output/formatter.h"

namespace tracecov {
namespace output {

// Registry for report formatters
class FormatterRegistry {
 public:
  static FormatterRegistry& Instance();

  void Register(const std::string& name, FormatterFactory factory);

  // nullptr for an unknown name
  std::unique_ptr<Formatter> Create(const std::string& name) const;

  bool IsRegistered(const std::string& name) const;

  std::vector<std::string> GetRegisteredNames() const;

  FormatterRegistry(const FormatterRegistry&) = delete;
  FormatterRegistry& operator=(const FormatterRegistry&) = delete;

 private:
  FormatterRegistry();

  std::map<std::string, FormatterFactory> factories_;
};

}  // namespace output
}  // namespace tracecov

#endif  // TRACECOV_OUTPUT_FORMATTER_REGISTRY_H_
