// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_ANALYSIS_REACHABILITY_ANALYZER_H_
#define TRACECOV_ANALYSIS_REACHABILITY_ANALYZER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/instruction.h"
#include "core/script.h"

namespace tracecov {
namespace analysis {

// Marks every instruction of a script that control flow can reach from
// position 0, and which of those simply fall through to the next one.
//
// Analysis always starts at position 0, not at the script's entry index:
// the ops before "main:" (defvar and friends) fall through into the real
// entry and must not come out unreachable.
//
// Uses an explicit work list, so deep or pathological generated code cannot
// exhaust the native stack.
class ReachabilityAnalyzer {
 public:
  explicit ReachabilityAnalyzer(core::Script* script);

  // Run the analysis. Throws AnalysisException if a decoded branch or
  // switch target is not an instruction of the script.
  void Analyze();

  size_t reachable_count() const { return reachable_count_; }

  // Absolute target of a jump ("goto 42 (+7)" -> 42); nullopt if the
  // assembly carries no target (e.g. try without a catch offset)
  [[nodiscard]] static std::optional<uint32_t> DecodeBranchTarget(
      const std::string& assembly);

  // Absolute default and case targets of a switch, default first.
  // Offsets in switch disassembly are relative to the switch's own pc.
  static std::vector<uint32_t> DecodeSwitchTargets(
      const core::Instruction& inst, const std::string& script_name);

 private:
  // Follow the straight-line run starting at index; returns the index of
  // the non-linear instruction that ended it, or nullopt if the run hit the
  // end of the script or already-analyzed code
  std::optional<size_t> WalkLinearRun(size_t index);

  // Queue the successors of the non-linear instruction at index
  void PushSuccessors(size_t index);

  size_t ResolveTarget(uint32_t address, const core::Instruction& from) const;

  core::Script* script_;
  std::vector<bool> visited_;
  std::vector<size_t> work_list_;
  size_t reachable_count_;
};

}  // namespace analysis
}  // namespace tracecov

#endif  // TRACECOV_ANALYSIS_REACHABILITY_ANALYZER_H_
