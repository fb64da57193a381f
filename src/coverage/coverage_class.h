// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_COVERAGE_COVERAGE_CLASS_H_
#define TRACECOV_COVERAGE_COVERAGE_CLASS_H_

#include <string>

namespace tracecov {
namespace coverage {

// Per-line classification
enum class CoverageClass {
  FULL,           // Every branch on the line executed
  SOME,           // Branches on the line ran different numbers of times
  NONE,           // Executable but never executed
  DEAD,           // Only unreachable code
  INSIGNIFICANT,  // Nothing executable (e.g. a lone closing brace)
};

// "full", "some", "none", "dead", or "" for INSIGNIFICANT
const char* CoverageClassName(CoverageClass coverage);

// Per-file tally of line classes; INSIGNIFICANT lines are not counted
struct CoverageTally {
  int full = 0;
  int some = 0;
  int none = 0;
  int dead = 0;

  void Add(CoverageClass coverage);

  // Lines with any executable code
  int Executable() const { return full + some + none + dead; }

  bool operator==(const CoverageTally& other) const {
    return full == other.full && some == other.some && none == other.none &&
           dead == other.dead;
  }
  bool operator!=(const CoverageTally& other) const { return !(*this == other); }
};

}  // namespace coverage
}  // namespace tracecov

#endif  // TRACECOV_COVERAGE_COVERAGE_CLASS_H_
