// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "analysis/reachability_analyzer.h"

#include <limits>
#include <regex>

#include "analysis/opcode_classifier.h"
#include "core/exceptions.h"
#include "utils/logger.h"

namespace tracecov {
namespace analysis {

namespace {

// "goto 42 (+7)": mnemonic, whitespace, absolute pc
const std::regex& BranchTargetRegex() {
  static const std::regex re(R"(^\w+\s+(\d+))");
  return re;
}

// First switch line: "tableswitch ... default offset 30"
const std::regex& SwitchDefaultRegex() {
  static const std::regex re(R"(ffset (-?\d+))");
  return re;
}

// Case lines: "\t1: 12"
const std::regex& SwitchCaseRegex() {
  static const std::regex re(R"(: (-?\d+)$)");
  return re;
}

uint32_t RelativeTarget(uint32_t base, const std::string& offset_text,
                        const std::string& script_name) {
  int64_t offset = 0;
  try {
    offset = std::stoll(offset_text);
  } catch (const std::out_of_range&) {
    throw AnalysisException("switch offset " + offset_text + " out of range",
                            script_name, base);
  }
  int64_t target = static_cast<int64_t>(base) + offset;
  if (target < 0 || target > std::numeric_limits<uint32_t>::max()) {
    throw AnalysisException("switch offset " + offset_text + " out of range",
                            script_name, base);
  }
  return static_cast<uint32_t>(target);
}

}  // namespace

ReachabilityAnalyzer::ReachabilityAnalyzer(core::Script* script)
    : script_(script), reachable_count_(0) {}

void ReachabilityAnalyzer::Analyze() {
  auto& instructions = script_->mutable_instructions();
  visited_.assign(instructions.size(), false);
  work_list_.clear();
  reachable_count_ = 0;

  if (instructions.empty()) {
    return;
  }

  work_list_.push_back(0);
  while (!work_list_.empty()) {
    size_t index = work_list_.back();
    work_list_.pop_back();

    std::optional<size_t> branch = WalkLinearRun(index);
    if (branch) {
      PushSuccessors(*branch);
    }
  }

  LOG_DEBUG("Reachability for " + script_->name() + ": " +
            std::to_string(reachable_count_) + " of " +
            std::to_string(instructions.size()) + " instructions reachable");
}

std::optional<size_t> ReachabilityAnalyzer::WalkLinearRun(size_t index) {
  auto& instructions = script_->mutable_instructions();
  if (index >= instructions.size()) {
    return std::nullopt;
  }

  // Execution can jump to here
  instructions[index].is_entry_target = true;

  while (index < instructions.size()) {
    core::Instruction& inst = instructions[index];
    if (visited_[index]) {
      return std::nullopt;
    }
    visited_[index] = true;
    inst.reachable = true;
    reachable_count_++;

    if (!OpcodeClassifier::IsLinear(inst.Mnemonic())) {
      return index;
    }
    inst.falls_through = true;
    ++index;
  }
  return std::nullopt;
}

void ReachabilityAnalyzer::PushSuccessors(size_t index) {
  const core::Instruction& inst = script_->instructions()[index];

  switch (OpcodeClassifier::Classify(inst.Mnemonic())) {
    case FlowKind::LINEAR:
    case FlowKind::TERMINATOR:
      break;

    case FlowKind::UNCONDITIONAL: {
      std::optional<uint32_t> target = DecodeBranchTarget(inst.assembly);
      if (target) {
        work_list_.push_back(ResolveTarget(*target, inst));
      } else {
        LOG_DEBUG("Jump without target in " + script_->name() + ": " +
                  inst.assembly);
      }
      break;
    }

    case FlowKind::CONDITIONAL: {
      std::optional<uint32_t> target = DecodeBranchTarget(inst.assembly);
      if (target) {
        work_list_.push_back(ResolveTarget(*target, inst));
      }
      // Popped first, like the not-taken path
      work_list_.push_back(index + 1);
      break;
    }

    case FlowKind::SWITCH: {
      std::vector<uint32_t> targets =
          DecodeSwitchTargets(inst, script_->name());
      for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
        work_list_.push_back(ResolveTarget(*it, inst));
      }
      break;
    }
  }
}

size_t ReachabilityAnalyzer::ResolveTarget(uint32_t address,
                                           const core::Instruction& from) const {
  std::optional<size_t> index = script_->FindIndex(address);
  if (!index) {
    throw AnalysisException(
        "branch target " + std::to_string(address) + " is not an instruction",
        script_->name(), from.address);
  }
  return *index;
}

std::optional<uint32_t> ReachabilityAnalyzer::DecodeBranchTarget(
    const std::string& assembly) {
  std::smatch match;
  if (!std::regex_search(assembly, match, BranchTargetRegex())) {
    return std::nullopt;
  }
  try {
    unsigned long long pc = std::stoull(match[1].str());
    if (pc > std::numeric_limits<uint32_t>::max()) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(pc);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::vector<uint32_t> ReachabilityAnalyzer::DecodeSwitchTargets(
    const core::Instruction& inst, const std::string& script_name) {
  std::vector<uint32_t> targets;

  // Cases follow the first line, one per tab-prefixed continuation
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t tab = inst.assembly.find('\t', start);
    parts.push_back(inst.assembly.substr(start, tab - start));
    if (tab == std::string::npos) {
      break;
    }
    start = tab + 1;
  }

  std::smatch match;
  if (!std::regex_search(parts[0], match, SwitchDefaultRegex())) {
    throw AnalysisException("switch without default offset: " + parts[0],
                            script_name, inst.address);
  }
  targets.push_back(RelativeTarget(inst.address, match[1].str(), script_name));

  for (size_t i = 1; i < parts.size(); ++i) {
    if (std::regex_search(parts[i], match, SwitchCaseRegex())) {
      targets.push_back(
          RelativeTarget(inst.address, match[1].str(), script_name));
    } else {
      LOG_DEBUG("Ignoring unrecognized switch line in " + script_name + ": " +
                parts[i]);
    }
  }

  return targets;
}

}  // namespace analysis
}  // namespace tracecov
