// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_COVERAGE_SNAPSHOT_H_
#define TRACECOV_COVERAGE_SNAPSHOT_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "coverage/coverage_class.h"
#include "coverage/file.h"

namespace tracecov {
namespace coverage {

// Reported state of one source line
struct LineSnapshot {
  CoverageClass coverage = CoverageClass::INSIGNIFICANT;
  std::vector<int64_t> counts;
  bool start_func = false;
  bool end_func = false;

  // Same coverage and counts; function markers are not compared
  bool SameCoverage(const LineSnapshot& other) const {
    return coverage == other.coverage && counts == other.counts;
  }
};

// Reported state of one file. lines[i] is source line i + 1; lines with no
// code, or not seen yet, are empty.
struct FileSnapshot {
  std::string filename;
  int covered = 0;
  int partial = 0;
  int uncovered = 0;
  int dead = 0;
  std::vector<std::optional<LineSnapshot>> lines;

  CoverageTally tally() const;
  void set_tally(const CoverageTally& tally);

  // Tally recomputed from the stored line classes
  CoverageTally Recount() const;

  // Snapshot of a freshly built file. Lines outside
  // [1, constants::kMaxSourceLine] are left out of both lines and totals.
  static FileSnapshot FromFile(const File& file);
};

}  // namespace coverage
}  // namespace tracecov

#endif  // TRACECOV_COVERAGE_SNAPSHOT_H_
