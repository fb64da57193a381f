// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/formatter_registry.h"

#include "output/json_formatter.h"
#include "output/text_formatter.h"
#include "utils/logger.h"

namespace tracecov {
namespace output {

FormatterRegistry& FormatterRegistry::Instance() {
  static FormatterRegistry instance;
  return instance;
}

FormatterRegistry::FormatterRegistry() {
  Register("json", &CreateJsonFormatter);
  Register("text", &CreateTextFormatter);
}

void FormatterRegistry::Register(const std::string& name,
                                 FormatterFactory factory) {
  factories_[name] = factory;
  LOG_DEBUG("Registered report formatter: " + name);
}

std::unique_ptr<Formatter> FormatterRegistry::Create(
    const std::string& name) const {
  auto it = factories_.find(name);
  if (it != factories_.end()) {
    return it->second();
  }
  LOG_ERROR("Report formatter not found: " + name);
  return nullptr;
}

bool FormatterRegistry::IsRegistered(const std::string& name) const {
  return factories_.find(name) != factories_.end();
}

std::vector<std::string> FormatterRegistry::GetRegisteredNames() const {
  std::vector<std::string> names;
  for (const auto& pair : factories_) {
    names.push_back(pair.first);
  }
  return names;
}

}  // namespace output
}  // namespace tracecov
