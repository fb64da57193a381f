// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_ANALYSIS_TRACE_PARSER_H_
#define TRACECOV_ANALYSIS_TRACE_PARSER_H_

#include <string>
#include <unordered_map>
#include <vector>

#include "core/engine_config.h"
#include "core/remap_table.h"
#include "core/script.h"

namespace tracecov {
namespace analysis {

// Splits a trace dump into record blocks ("--- SCRIPT f:n ---" through
// "--- END SCRIPT ...") and turns each block into an analyzed Script.
//
// A block that repeats a script already seen by this parser (same
// signature) has its counts added to the first copy instead of producing a
// second script. One parser covers one dump; use a fresh parser per dump.
class TraceParser {
 public:
  explicit TraceParser(const core::EngineConfig& config,
                       core::RemapFunction remap = nullptr);

  // Feed one line (without the newline). Returns true if the line was
  // consumed as part of a record block, false if it was ignored.
  bool ProcessLine(const std::string& line);

  // Feed a whole dump, split on newlines
  void ProcessText(const std::string& text);

  // Unique scripts in first-seen order
  const std::vector<core::Script>& scripts() const { return scripts_; }

  bool in_script() const { return in_script_; }
  size_t merged_count() const { return merged_count_; }
  size_t discarded_count() const { return discarded_count_; }

 private:
  void FinishBlock();

  const core::EngineConfig& config_;
  core::RemapFunction remap_;

  bool in_script_;
  std::vector<std::string> block_;

  std::vector<core::Script> scripts_;
  std::unordered_map<std::string, size_t> signatures_;

  size_t merged_count_;
  size_t discarded_count_;
};

}  // namespace analysis
}  // namespace tracecov

#endif  // TRACECOV_ANALYSIS_TRACE_PARSER_H_
