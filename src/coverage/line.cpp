// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "coverage/line.h"

#include <algorithm>
#include <limits>
#include <utility>

#include "core/constants.h"

namespace tracecov {
namespace coverage {

Line::Line(int number, std::string halt_mnemonic)
    : start_func(false),
      end_func(false),
      number_(number),
      halt_mnemonic_(std::move(halt_mnemonic)) {}

bool Line::AddInstruction(const std::string& key,
                          const core::Instruction& inst) {
  if (!keys_.insert(key).second) {
    return false;
  }
  instructions_.push_back(inst);
  return true;
}

const std::vector<int64_t>& Line::Counts() const {
  if (!cached_counts_) {
    cached_counts_ = ComputeCounts();
  }
  return *cached_counts_;
}

std::vector<int64_t> Line::ComputeCounts() const {
  std::vector<int64_t> raw;
  int64_t min = std::numeric_limits<int64_t>::max();
  int64_t max = std::numeric_limits<int64_t>::min();
  const core::Instruction* last = nullptr;

  for (const auto& inst : instructions_) {
    int64_t count = inst.count;
    if (!inst.reachable) {
      count = constants::kUnreachableCount;
      raw.push_back(count);
      min = std::min(min, count);
      max = std::max(max, count);
    } else if (last && last->falls_through &&
               (count == last->count || (count == 0 && last->count != 0))) {
      // Straight-line continuation of the previous op. An equal count adds
      // nothing; a zero after a non-zero is an interpreter fast path that
      // skipped the counter, not an untaken branch.
    } else {
      raw.push_back(count);
      min = std::min(min, count);
      max = std::max(max, count);
    }
    last = &inst;
  }

  if (raw.empty()) {
    return raw;
  }

  if (min == max && min >= 0) {
    return {min};
  }

  if (raw.size() == 1 && raw[0] == constants::kUnreachableCount) {
    // A lone unreachable halt is the closing brace of a function
    if (instructions_.front().assembly == halt_mnemonic_) {
      return {};
    }
    return raw;
  }

  std::sort(raw.begin(), raw.end());
  raw.erase(std::unique(raw.begin(), raw.end()), raw.end());
  return raw;
}

CoverageClass Line::Coverage() const {
  const std::vector<int64_t>& counts = Counts();
  if (counts.empty()) {
    return CoverageClass::INSIGNIFICANT;
  }
  if (counts[0] > 0) {
    return CoverageClass::FULL;
  }
  if (counts.size() == 1) {
    return counts[0] == 0 ? CoverageClass::NONE : CoverageClass::DEAD;
  }
  // Unreachable code sharing a line with executed code is a compiler
  // artifact, not an untaken branch
  if (counts[0] == constants::kUnreachableCount && counts[1] > 0) {
    return CoverageClass::FULL;
  }
  return CoverageClass::SOME;
}

}  // namespace coverage
}  // namespace tracecov
