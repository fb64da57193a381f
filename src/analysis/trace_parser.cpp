// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "analysis/trace_parser.h"

#include <regex>
#include <utility>

#include "analysis/reachability_analyzer.h"
#include "core/constants.h"
#include "utils/logger.h"

namespace tracecov {
namespace analysis {

namespace {

const std::regex& StartRegex() {
  static const std::regex re(constants::kScriptStartPattern);
  return re;
}

const std::regex& EndRegex() {
  static const std::regex re(constants::kScriptEndPattern);
  return re;
}

}  // namespace

TraceParser::TraceParser(const core::EngineConfig& config,
                         core::RemapFunction remap)
    : config_(config),
      remap_(std::move(remap)),
      in_script_(false),
      merged_count_(0),
      discarded_count_(0) {}

bool TraceParser::ProcessLine(const std::string& line) {
  if (in_script_) {
    block_.push_back(line);
    if (std::regex_search(line, EndRegex())) {
      FinishBlock();
    }
    return true;
  }

  if (std::regex_match(line, StartRegex())) {
    in_script_ = true;
    block_.clear();
    block_.push_back(line);
    return true;
  }

  // Outside a record; the dump may contain anything here
  return false;
}

void TraceParser::ProcessText(const std::string& text) {
  size_t start = 0;
  while (start <= text.size()) {
    size_t newline = text.find('\n', start);
    size_t end = (newline == std::string::npos) ? text.size() : newline;
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    ProcessLine(line);
    if (newline == std::string::npos) {
      break;
    }
    start = newline + 1;
  }
}

void TraceParser::FinishBlock() {
  in_script_ = false;
  std::vector<std::string> block = std::move(block_);
  block_.clear();

  if (config_.IsIgnoredHeader(block.front())) {
    LOG_DEBUG("Discarding placeholder script: " + block.front());
    discarded_count_++;
    return;
  }

  core::Script script = core::Script::FromRecord(block, config_, remap_);
  if (script.empty()) {
    LOG_DEBUG("Discarding script without instructions: " + script.name());
    discarded_count_++;
    return;
  }

  std::string signature = script.Signature();
  auto it = signatures_.find(signature);
  if (it != signatures_.end()) {
    // Same body dumped again; identical structure needs no new analysis
    scripts_[it->second].AddCounts(script);
    merged_count_++;
    LOG_DEBUG("Merged repeated script: " + script.name());
    return;
  }

  ReachabilityAnalyzer analyzer(&script);
  analyzer.Analyze();

  signatures_.emplace(std::move(signature), scripts_.size());
  scripts_.push_back(std::move(script));
}

}  // namespace analysis
}  // namespace tracecov
