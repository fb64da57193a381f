// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/script.h"

#include <limits>
#include <regex>
#include <sstream>

#include "core/constants.h"
#include "core/exceptions.h"
#include "utils/logger.h"

namespace tracecov {
namespace core {

namespace {

const std::regex& ScriptStartRegex() {
  static const std::regex re(constants::kScriptStartPattern);
  return re;
}

const std::regex& ScriptEndRegex() {
  static const std::regex re(constants::kScriptEndPattern);
  return re;
}

const std::regex& ScriptDataRegex() {
  static const std::regex re(constants::kScriptDataPattern);
  return re;
}

// Sum the leading `fields` entries of a "1/2/3/0/0/0" count group
bool SumCounts(const std::string& group, size_t fields, int64_t* total) {
  std::istringstream stream(group);
  std::string field;
  int64_t sum = 0;
  for (size_t i = 0; i < fields && std::getline(stream, field, '/'); ++i) {
    int64_t value = std::stoll(field);
    if (value > std::numeric_limits<int64_t>::max() - sum) {
      return false;
    }
    sum += value;
  }
  *total = sum;
  return true;
}

}  // namespace

Script::Script() : start_line_(0), entry_index_(-1) {}

Script Script::FromRecord(const std::vector<std::string>& lines,
                          const EngineConfig& config,
                          const RemapFunction& remap) {
  Script script;

  for (const auto& line : lines) {
    std::smatch match;

    if (std::regex_match(line, match, ScriptStartRegex())) {
      std::string file = match[1].str();
      int start = 0;
      try {
        start = std::stoi(match[2].str());
      } catch (const std::exception&) {
        LOG_DEBUG("Ignoring script header with bad line number: " + line);
        continue;
      }
      script.raw_filename_ = file;
      if (remap) {
        auto mapped = remap(file, start);
        file = mapped.first;
        start = mapped.second;
      }
      script.filename_ = file;
      script.start_line_ = start;
      script.name_ = file + ":" + std::to_string(start);

    } else if (std::regex_search(line, ScriptEndRegex())) {
      continue;

    } else if (line == constants::kEntryMarker) {
      script.entry_index_ = static_cast<int>(script.instructions_.size());

    } else if (std::regex_match(line, match, ScriptDataRegex())) {
      Instruction inst;
      try {
        unsigned long long pc = std::stoull(match[1].str());
        if (pc > std::numeric_limits<uint32_t>::max()) {
          LOG_DEBUG("Ignoring instruction with out-of-range pc: " + line);
          continue;
        }
        inst.address = static_cast<uint32_t>(pc);
        inst.source_line = std::stoi(match[3].str());
        if (!SumCounts(match[2].str(), config.summed_count_fields,
                       &inst.count)) {
          LOG_DEBUG("Ignoring instruction with overflowing count: " + line);
          continue;
        }
      } catch (const std::exception&) {
        LOG_DEBUG("Ignoring instruction with unparseable fields: " + line);
        continue;
      }

      if (remap) {
        inst.source_line = remap(script.raw_filename_, inst.source_line).second;
      }

      inst.assembly = match[4].str();
      for (const auto& mnemonic : config.collapsed_mnemonics) {
        if (inst.assembly.compare(0, mnemonic.size() + 1, mnemonic + " ") == 0) {
          inst.assembly = mnemonic;
          break;
        }
      }

      script.AddInstruction(inst);

    } else if (!line.empty() && line[0] == constants::kContinuationPrefix) {
      // Extra disassembly lines (switch tables) belong to the previous op
      if (script.instructions_.empty()) {
        LOG_DEBUG("Ignoring continuation line before any instruction");
        continue;
      }
      script.instructions_.back().assembly += line;
    }
    // Anything else (nested function source from lambda ops) is ignored
  }

  return script;
}

std::optional<size_t> Script::FindIndex(uint32_t address) const {
  auto it = address_index_.find(address);
  if (it != address_index_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void Script::AddInstruction(const Instruction& instruction) {
  address_index_[instruction.address] = instructions_.size();
  instructions_.push_back(instruction);
}

std::string Script::Signature() const {
  std::string signature = name_ + ":" + std::to_string(entry_index_) + "\n";
  for (size_t i = 0; i < instructions_.size(); ++i) {
    if (i > 0) {
      signature += "\n";
    }
    signature += instructions_[i].ToString();
  }
  return signature;
}

void Script::AddCounts(const Script& other) {
  if (name_ != other.name_ || entry_index_ != other.entry_index_ ||
      instructions_.size() != other.instructions_.size()) {
    throw ScriptMismatchException("cannot merge " + other.name_ + " into " +
                                  name_);
  }
  for (size_t i = 0; i < instructions_.size(); ++i) {
    const Instruction& theirs = other.instructions_[i];
    const Instruction& ours = instructions_[i];
    if (ours.address != theirs.address ||
        ours.source_line != theirs.source_line ||
        ours.assembly != theirs.assembly) {
      throw ScriptMismatchException("instruction " + std::to_string(i) +
                                    " differs in " + name_);
    }
  }

  for (size_t i = 0; i < instructions_.size(); ++i) {
    instructions_[i].count += other.instructions_[i].count;
  }
}

}  // namespace core
}  // namespace tracecov
