// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_COVERAGE_LINE_H_
#define TRACECOV_COVERAGE_LINE_H_

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/constants.h"
#include "core/instruction.h"
#include "coverage/coverage_class.h"

namespace tracecov {
namespace coverage {

// All instructions attributed to one source line, across every script of
// a file, in program (registration) order.
//
// Counts() is computed on first use and cached for the life of the Line.
// A Line is filled completely before anything reads it and is never added
// to afterwards, which is what makes the cache safe without invalidation.
class Line {
 public:
  explicit Line(int number,
                std::string halt_mnemonic = constants::kHaltMnemonic);

  int number() const { return number_; }

  // Register an instruction under a key unique to its script and pc.
  // The first registration of a key wins; returns false for duplicates.
  bool AddInstruction(const std::string& key, const core::Instruction& inst);

  const std::vector<core::Instruction>& instructions() const {
    return instructions_;
  }

  // Distinct execution counts on this line, ascending; -1 marks
  // unreachable code. A single element when every branch agrees, empty for
  // a line that is only an unreachable halt.
  const std::vector<int64_t>& Counts() const;

  CoverageClass Coverage() const;

  bool start_func;  // First instruction of some script is here
  bool end_func;    // Last instruction of some script is here

 private:
  std::vector<int64_t> ComputeCounts() const;

  int number_;
  std::string halt_mnemonic_;
  std::vector<core::Instruction> instructions_;
  std::set<std::string> keys_;
  mutable std::optional<std::vector<int64_t>> cached_counts_;
};

}  // namespace coverage
}  // namespace tracecov

#endif  // TRACECOV_COVERAGE_LINE_H_
