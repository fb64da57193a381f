// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_ANALYSIS_OPCODE_CLASSIFIER_H_
#define TRACECOV_ANALYSIS_OPCODE_CLASSIFIER_H_

#include <string>

namespace tracecov {
namespace analysis {

// How control leaves an instruction
enum class FlowKind {
  LINEAR,         // Next instruction only
  TERMINATOR,     // stop, return, throw, retrval, retsub
  UNCONDITIONAL,  // goto family, default, filter
  CONDITIONAL,    // Next instruction plus branch target (if one is decoded)
  SWITCH,         // Default plus one relative target per case
};

class OpcodeClassifier {
 public:
  static FlowKind Classify(const std::string& mnemonic);

  static bool IsLinear(const std::string& mnemonic) {
    return Classify(mnemonic) == FlowKind::LINEAR;
  }

  static const char* FlowKindName(FlowKind kind);
};

}  // namespace analysis
}  // namespace tracecov

#endif  // TRACECOV_ANALYSIS_OPCODE_CLASSIFIER_H_
