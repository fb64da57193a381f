// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_OUTPUT_TEXT_FORMATTER_H_
#define TRACECOV_OUTPUT_TEXT_FORMATTER_H_

#include <memory>
#include <string>
#include <vector>

#include "output/formatter.h"

namespace tracecov {
namespace output {

// Plain-text summary table, one row per file plus a total row
class TextFormatter : public Formatter {
 public:
  TextFormatter() = default;

  std::string Name() const override { return "Text summary"; }

  std::string Format(
      const std::vector<const coverage::FileSnapshot*>& snapshots) override;

  // Share of executable lines that ran, "n/a" when there are none
  static std::string FormatPercent(int executed, int executable);
};

std::unique_ptr<Formatter> CreateTextFormatter();

}  // namespace output
}  // namespace tracecov

#endif  // TRACECOV_OUTPUT_TEXT_FORMATTER_H_
