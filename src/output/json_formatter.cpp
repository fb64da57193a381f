// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "output/json_formatter.h"

#include "coverage/coverage_class.h"

namespace tracecov {
namespace output {

using json = nlohmann::json;

std::string JsonFormatter::Format(
    const std::vector<const coverage::FileSnapshot*>& snapshots) {
  json report = json::array();
  for (const auto* snapshot : snapshots) {
    report.push_back(FileToJson(*snapshot));
  }
  return report.dump(2) + "\n";
}

json JsonFormatter::FileToJson(const coverage::FileSnapshot& snapshot) {
  json file;
  file["filename"] = snapshot.filename;
  file["covered"] = snapshot.covered;
  file["partial"] = snapshot.partial;
  file["uncovered"] = snapshot.uncovered;
  file["dead"] = snapshot.dead;

  json lines = json::array();
  for (size_t i = 0; i < snapshot.lines.size(); ++i) {
    if (snapshot.lines[i]) {
      lines.push_back(LineToJson(*snapshot.lines[i], static_cast<int>(i) + 1));
    } else {
      lines.push_back(nullptr);
    }
  }
  file["lines"] = std::move(lines);
  return file;
}

json JsonFormatter::LineToJson(const coverage::LineSnapshot& line,
                               int linenum) {
  json entry;
  entry["linenum"] = linenum;
  entry["coverage"] = coverage::CoverageClassName(line.coverage);
  entry["counts"] = line.counts;
  // Only present when set
  if (line.start_func) {
    entry["startFunc"] = true;
  }
  if (line.end_func) {
    entry["endFunc"] = true;
  }
  return entry;
}

std::unique_ptr<Formatter> CreateJsonFormatter() {
  return std::make_unique<JsonFormatter>();
}

}  // namespace output
}  // namespace tracecov
