// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/instruction.h"

#include <cctype>

namespace tracecov {
namespace core {

Instruction::Instruction()
    : address(0),
      source_line(0),
      count(0),
      reachable(false),
      falls_through(false),
      is_entry_target(false) {}

std::string Instruction::Mnemonic() const {
  // Skip leading non-word characters, then take the first run of [A-Za-z0-9_]
  size_t start = 0;
  while (start < assembly.size() &&
         !(std::isalnum(static_cast<unsigned char>(assembly[start])) ||
           assembly[start] == '_')) {
    ++start;
  }
  size_t end = start;
  while (end < assembly.size() &&
         (std::isalnum(static_cast<unsigned char>(assembly[end])) ||
          assembly[end] == '_')) {
    ++end;
  }
  return assembly.substr(start, end - start);
}

std::string Instruction::ToString() const {
  return std::to_string(address) + ":" + std::to_string(source_line) + ":" +
         assembly;
}

}  // namespace core
}  // namespace tracecov
