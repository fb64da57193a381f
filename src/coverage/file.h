// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_COVERAGE_FILE_H_
#define TRACECOV_COVERAGE_FILE_H_

#include <map>
#include <string>

#include "core/constants.h"
#include "core/script.h"
#include "coverage/coverage_class.h"
#include "coverage/line.h"

namespace tracecov {
namespace coverage {

// Source lines of one file, built from every script dumped for it
class File {
 public:
  explicit File(std::string filename,
                std::string halt_mnemonic = constants::kHaltMnemonic);

  const std::string& filename() const { return filename_; }

  // Line `number`, created on first use
  Line& GetLine(int number);
  const Line* FindLine(int number) const;

  const std::map<int, Line>& lines() const { return lines_; }

  // Attribute every instruction of the script to its source line and mark
  // the lines of its first and last instruction
  void AddScript(const core::Script& script);

  CoverageTally Coverage() const;

  // Coverage class name for line n ("" when the line has no data)
  std::string CoverageClassName(int n) const;

  // floor(log10) of the line's largest count, clamped to 0..9;
  // -1 when the line has no data
  int ProfileClass(int n) const;

 private:
  std::string filename_;
  std::string halt_mnemonic_;
  std::map<int, Line> lines_;
};

}  // namespace coverage
}  // namespace tracecov

#endif  // TRACECOV_COVERAGE_FILE_H_
