// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/text_formatter.h"

#include <iomanip>
#include <sstream>

namespace tracecov {
namespace output {

namespace {

void FormatRow(std::ostringstream& out, const std::string& name,
               const coverage::CoverageTally& tally) {
  out << std::left << std::setw(40) << name << std::right
      << std::setw(8) << tally.full
      << std::setw(8) << tally.some
      << std::setw(8) << tally.none
      << std::setw(8) << tally.dead
      << std::setw(9)
      << TextFormatter::FormatPercent(tally.full + tally.some,
                                      tally.Executable())
      << "\n";
}

}  // namespace

std::string TextFormatter::Format(
    const std::vector<const coverage::FileSnapshot*>& snapshots) {
  std::ostringstream out;
  out << std::left << std::setw(40) << "File" << std::right
      << std::setw(8) << "Full"
      << std::setw(8) << "Some"
      << std::setw(8) << "None"
      << std::setw(8) << "Dead"
      << std::setw(9) << "Exec%"
      << "\n";
  out << std::string(81, '-') << "\n";

  coverage::CoverageTally total;
  for (const auto* snapshot : snapshots) {
    coverage::CoverageTally tally = snapshot->tally();
    FormatRow(out, snapshot->filename, tally);
    total.full += tally.full;
    total.some += tally.some;
    total.none += tally.none;
    total.dead += tally.dead;
  }

  out << std::string(81, '-') << "\n";
  FormatRow(out, "TOTAL", total);
  return out.str();
}

std::string TextFormatter::FormatPercent(int executed, int executable) {
  if (executable <= 0) {
    return "n/a";
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(1)
      << (100.0 * executed / executable) << "%";
  return out.str();
}

std::unique_ptr<Formatter> CreateTextFormatter() {
  return std::make_unique<TextFormatter>();
}

}  // namespace output
}  // namespace tracecov
