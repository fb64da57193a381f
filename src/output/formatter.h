// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_OUTPUT_FORMATTER_H_
#define TRACECOV_OUTPUT_FORMATTER_H_

#include <memory>
#include <string>
#include <vector>

#include "coverage/snapshot.h"

namespace tracecov {
namespace output {

// Abstract coverage report formatter
class Formatter {
 public:
  virtual ~Formatter() = default;

  // Formatter identification
  virtual std::string Name() const = 0;

  // Format snapshots (in filename order) to a complete report
  virtual std::string Format(
      const std::vector<const coverage::FileSnapshot*>& snapshots) = 0;
};

// Factory function type for creating formatters
using FormatterFactory = std::unique_ptr<Formatter> (*)();

}  // namespace output
}  // namespace tracecov

#endif  // TRACECOV_OUTPUT_FORMATTER_H_
