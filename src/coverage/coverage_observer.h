// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_COVERAGE_COVERAGE_OBSERVER_H_
#define TRACECOV_COVERAGE_COVERAGE_OBSERVER_H_

#include <string>

#include "coverage/snapshot.h"

namespace tracecov {
namespace coverage {

class CoverageEngine;

// Receives change notifications from CoverageEngine::ParseData.
// Every handler defaults to a no-op; override the ones you need.
// Handlers run synchronously, in registration order, and must not call
// ParseData on the engine that invoked them.
class CoverageObserver {
 public:
  virtual ~CoverageObserver() = default;

  // First data for a file; `snapshot` is the stored copy
  virtual void OnNewScript(const CoverageEngine& /*engine*/,
                           const std::string& /*filename*/,
                           const FileSnapshot& /*snapshot*/) {}

  // The file's covered/partial/uncovered/dead totals changed
  virtual void OnScriptUpdate(const CoverageEngine& /*engine*/,
                              const std::string& /*filename*/,
                              const FileSnapshot& /*snapshot*/) {}

  // A line was added or its coverage changed. `line` is the 1-based line
  // number for a line seen for the first time, and the 0-based index into
  // FileSnapshot::lines for a line whose data changed.
  virtual void OnLineUpdate(const CoverageEngine& /*engine*/,
                            const std::string& /*filename*/,
                            int /*line*/,
                            const LineSnapshot& /*line_data*/) {}
};

}  // namespace coverage
}  // namespace tracecov

#endif  // TRACECOV_COVERAGE_COVERAGE_OBSERVER_H_
