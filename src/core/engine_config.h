// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_CORE_ENGINE_CONFIG_H_
#define TRACECOV_CORE_ENGINE_CONFIG_H_

#include <cstddef>
#include <string>
#include <vector>

namespace tracecov {
namespace core {

// Tunables for the trace grammar. The defaults match the interpreter's
// debug dump format; override only for a producer that differs.
struct EngineConfig {
  // Blocks whose header line equals one of these are dropped
  std::vector<std::string> ignored_headers;

  // Mnemonic that is insignificant when it is a line's lone dead instruction
  std::string halt_mnemonic;

  // Mnemonics whose assembly text is replaced by the bare mnemonic
  std::vector<std::string> collapsed_mnemonics;

  // Number of leading slash-separated sub-counts that are summed
  size_t summed_count_fields;

  EngineConfig();

  // Load overrides from a JSON file; keys that are absent keep defaults
  bool LoadFromFile(const std::string& path, std::string* error);

  // Load overrides from a JSON string
  bool LoadFromJson(const std::string& json_content, std::string* error);

  bool IsIgnoredHeader(const std::string& line) const;
};

}  // namespace core
}  // namespace tracecov

#endif  // TRACECOV_CORE_ENGINE_CONFIG_H_
