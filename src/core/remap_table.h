// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_CORE_REMAP_TABLE_H_
#define TRACECOV_CORE_REMAP_TABLE_H_

#include <functional>
#include <map>
#include <string>
#include <utility>

namespace tracecov {
namespace core {

// Translates raw trace coordinates (filename, line) into the logical source
// coordinates reported to callers. Must be deterministic.
using RemapFunction =
    std::function<std::pair<std::string, int>(const std::string&, int)>;

// One translated file
struct RemapEntry {
  std::string filename;  // Logical filename
  int line_offset;       // Added to every raw line number
};

// Remap driven by a JSON table, for generated or concatenated sources:
//
//   { "remap": [ { "from": "bundle.js", "to": "app.js", "line_offset": -12 } ] }
//
// Files not listed keep their raw coordinates.
class RemapTable {
 public:
  RemapTable() = default;

  bool LoadFromFile(const std::string& path, std::string* error);
  bool LoadFromJson(const std::string& json_content, std::string* error);

  void AddEntry(const std::string& raw_filename, const RemapEntry& entry);

  std::pair<std::string, int> Apply(const std::string& raw_filename,
                                    int raw_line) const;

  // Remap function bound to this table; the table must outlive it
  RemapFunction AsFunction() const;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

 private:
  std::map<std::string, RemapEntry> entries_;
};

}  // namespace core
}  // namespace tracecov

#endif  // TRACECOV_CORE_REMAP_TABLE_H_
