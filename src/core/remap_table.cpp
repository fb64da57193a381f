// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/remap_table.h"

#include <fstream>
#include <nlohmann/json.hpp>

#include "utils/logger.h"

namespace tracecov {
namespace core {

using json = nlohmann::json;

bool RemapTable::LoadFromFile(const std::string& path, std::string* error) {
  LOG_INFO("Loading remap table: " + path);

  std::ifstream file(path);
  if (!file.is_open()) {
    *error = "Failed to open remap file: " + path;
    return false;
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  file.close();

  return LoadFromJson(content, error);
}

bool RemapTable::LoadFromJson(const std::string& json_content,
                              std::string* error) {
  try {
    json j = json::parse(json_content);

    if (!j.contains("remap") || !j["remap"].is_array()) {
      *error = "Remap table missing 'remap' array";
      return false;
    }

    std::map<std::string, RemapEntry> parsed;
    for (const auto& item : j["remap"]) {
      if (!item.contains("from") || !item["from"].is_string()) {
        *error = "Remap entry missing 'from' field";
        return false;
      }

      std::string from = item["from"].get<std::string>();
      RemapEntry entry;
      entry.filename = item.value("to", from);
      entry.line_offset = item.value("line_offset", 0);
      parsed[from] = entry;
    }

    entries_ = std::move(parsed);
    LOG_DEBUG("Loaded " + std::to_string(entries_.size()) + " remap entries");
    return true;

  } catch (const json::exception& e) {
    *error = std::string("JSON parse error: ") + e.what();
    return false;
  }
}

void RemapTable::AddEntry(const std::string& raw_filename,
                          const RemapEntry& entry) {
  entries_[raw_filename] = entry;
}

std::pair<std::string, int> RemapTable::Apply(const std::string& raw_filename,
                                              int raw_line) const {
  auto it = entries_.find(raw_filename);
  if (it == entries_.end()) {
    return {raw_filename, raw_line};
  }
  return {it->second.filename, raw_line + it->second.line_offset};
}

RemapFunction RemapTable::AsFunction() const {
  return [this](const std::string& raw_filename, int raw_line) {
    return Apply(raw_filename, raw_line);
  };
}

}  // namespace core
}  // namespace tracecov
