// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "analysis/opcode_classifier.h"

#include <map>

namespace tracecov {
namespace analysis {

namespace {

// Every opcode that does not simply continue with the next one.
// Opcodes missing here are LINEAR.
const std::map<std::string, FlowKind>& NonLinearOpcodes() {
  static const std::map<std::string, FlowKind> table = {
      // Terminators
      {"stop", FlowKind::TERMINATOR},
      {"return", FlowKind::TERMINATOR},
      {"throw", FlowKind::TERMINATOR},
      {"retrval", FlowKind::TERMINATOR},
      // gosub is conditional, so its matching retsub ends the path
      {"retsub", FlowKind::TERMINATOR},

      // Unconditional jumps
      {"goto", FlowKind::UNCONDITIONAL},
      {"gotox", FlowKind::UNCONDITIONAL},
      {"default", FlowKind::UNCONDITIONAL},
      {"defaultx", FlowKind::UNCONDITIONAL},
      {"filter", FlowKind::UNCONDITIONAL},  // E4X

      // Conditional jumps
      {"ifeq", FlowKind::CONDITIONAL},
      {"ifeqx", FlowKind::CONDITIONAL},
      {"ifne", FlowKind::CONDITIONAL},
      {"ifnex", FlowKind::CONDITIONAL},
      {"or", FlowKind::CONDITIONAL},
      {"orx", FlowKind::CONDITIONAL},
      {"and", FlowKind::CONDITIONAL},
      {"andx", FlowKind::CONDITIONAL},
      // The op after a gosub runs when the subroutine returns
      {"gosub", FlowKind::CONDITIONAL},
      {"gosubx", FlowKind::CONDITIONAL},
      {"case", FlowKind::CONDITIONAL},
      {"casex", FlowKind::CONDITIONAL},
      {"ifcantcalltop", FlowKind::CONDITIONAL},
      {"endfilter", FlowKind::CONDITIONAL},  // E4X
      // try carries the catch block offset when there is one; try/finally
      // has none and only falls through
      {"try", FlowKind::CONDITIONAL},

      // Multi-way branches with relative offsets
      {"tableswitch", FlowKind::SWITCH},
      {"lookupswitch", FlowKind::SWITCH},
      {"tableswitchx", FlowKind::SWITCH},
      {"lookupswitchx", FlowKind::SWITCH},
  };
  return table;
}

}  // namespace

FlowKind OpcodeClassifier::Classify(const std::string& mnemonic) {
  const auto& table = NonLinearOpcodes();
  auto it = table.find(mnemonic);
  if (it != table.end()) {
    return it->second;
  }
  return FlowKind::LINEAR;
}

const char* OpcodeClassifier::FlowKindName(FlowKind kind) {
  switch (kind) {
    case FlowKind::LINEAR:
      return "linear";
    case FlowKind::TERMINATOR:
      return "terminator";
    case FlowKind::UNCONDITIONAL:
      return "unconditional";
    case FlowKind::CONDITIONAL:
      return "conditional";
    case FlowKind::SWITCH:
      return "switch";
  }
  return "unknown";
}

}  // namespace analysis
}  // namespace tracecov
