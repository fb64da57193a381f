// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_CORE_SCRIPT_H_
#define TRACECOV_CORE_SCRIPT_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/engine_config.h"
#include "core/instruction.h"
#include "core/remap_table.h"

namespace tracecov {
namespace core {

// One function body, top-level unit or eval string from a trace dump.
//
// The name (filename:startline) is not unique on its own: nested functions
// declared on the same line share it. Signature() adds the entry index and
// the full instruction listing, which tells re-dumps of the same body apart
// from distinct bodies.
class Script {
 public:
  Script();

  // Build a script from the lines of one record block, header line first.
  // Lines matching no known pattern are ignored.
  static Script FromRecord(const std::vector<std::string>& lines,
                           const EngineConfig& config,
                           const RemapFunction& remap = nullptr);

  const std::string& name() const { return name_; }
  const std::string& filename() const { return filename_; }
  const std::string& raw_filename() const { return raw_filename_; }
  int start_line() const { return start_line_; }

  // Index of the first instruction after the "main:" marker, -1 if absent
  int entry_index() const { return entry_index_; }

  const std::vector<Instruction>& instructions() const { return instructions_; }
  std::vector<Instruction>& mutable_instructions() { return instructions_; }
  size_t size() const { return instructions_.size(); }
  bool empty() const { return instructions_.empty(); }

  // Position of the instruction at the given pc
  [[nodiscard]] std::optional<size_t> FindIndex(uint32_t address) const;

  // Append an instruction and index it by address
  void AddInstruction(const Instruction& instruction);

  // Structural identity key: name, entry index and every pc:line:assembly
  std::string Signature() const;

  // Add the other script's counts element-wise.
  // Throws ScriptMismatchException unless both have the same structure.
  void AddCounts(const Script& other);

 private:
  std::string name_;
  std::string filename_;
  std::string raw_filename_;
  int start_line_;
  int entry_index_;
  std::vector<Instruction> instructions_;
  std::map<uint32_t, size_t> address_index_;
};

}  // namespace core
}  // namespace tracecov

#endif  // TRACECOV_CORE_SCRIPT_H_
