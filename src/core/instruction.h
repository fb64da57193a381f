// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_CORE_INSTRUCTION_H_
#define TRACECOV_CORE_INSTRUCTION_H_

#include <cstdint>
#include <string>

namespace tracecov {
namespace core {

// One decoded bytecode operation from a trace dump
struct Instruction {
  uint32_t address;        // pc, unique within its script
  int source_line;         // Source line after remapping
  std::string assembly;    // e.g. "ifeq 27 (+9)"; continuation lines appended
  int64_t count;           // Sum of the leading sub-counts
  bool reachable;          // Set by reachability analysis
  bool falls_through;      // Only successor is the next instruction
  bool is_entry_target;    // Control can transfer here from elsewhere

  Instruction();

  // Leading word of the assembly text ("" if there is none)
  std::string Mnemonic() const;

  // Signature fragment: "pc:line:assembly"
  std::string ToString() const;
};

}  // namespace core
}  // namespace tracecov

#endif  // TRACECOV_CORE_INSTRUCTION_H_
