// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "coverage/file.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tracecov {
namespace coverage {

File::File(std::string filename, std::string halt_mnemonic)
    : filename_(std::move(filename)),
      halt_mnemonic_(std::move(halt_mnemonic)) {}

Line& File::GetLine(int number) {
  auto it = lines_.find(number);
  if (it == lines_.end()) {
    it = lines_.emplace(number, Line(number, halt_mnemonic_)).first;
  }
  return it->second;
}

const Line* File::FindLine(int number) const {
  auto it = lines_.find(number);
  if (it != lines_.end()) {
    return &it->second;
  }
  return nullptr;
}

void File::AddScript(const core::Script& script) {
  const auto& instructions = script.instructions();
  if (instructions.empty()) {
    return;
  }

  for (const auto& inst : instructions) {
    GetLine(inst.source_line)
        .AddInstruction(script.name() + ":" + std::to_string(inst.address),
                        inst);
  }

  // Roughly the first and last lines of the function
  GetLine(instructions.front().source_line).start_func = true;
  GetLine(instructions.back().source_line).end_func = true;
}

CoverageTally File::Coverage() const {
  CoverageTally tally;
  for (const auto& [number, line] : lines_) {
    tally.Add(line.Coverage());
  }
  return tally;
}

std::string File::CoverageClassName(int n) const {
  const Line* line = FindLine(n);
  if (!line) {
    return "";
  }
  return coverage::CoverageClassName(line->Coverage());
}

int File::ProfileClass(int n) const {
  const Line* line = FindLine(n);
  if (!line) {
    return -1;
  }
  const auto& counts = line->Counts();
  if (counts.empty() || counts.back() <= 0) {
    return 0;
  }
  int bucket = static_cast<int>(
      std::floor(std::log10(static_cast<double>(counts.back()))));
  return std::min(bucket, constants::kMaxProfileBucket);
}

}  // namespace coverage
}  // namespace tracecov
