// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_OUTPUT_JSON_FORMATTER_H_
#define TRACECOV_OUTPUT_JSON_FORMATTER_H_

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "output/formatter.h"

namespace tracecov {
namespace output {

// JSON report: an array of per-file objects
//
//   [{ "filename": "foo.js", "covered": 10, "partial": 1, "uncovered": 2,
//      "dead": 0,
//      "lines": [null, {"linenum": 2, "coverage": "full", "counts": [3],
//                       "startFunc": true}, ...] }]
//
// lines[i] describes source line i + 1; null marks lines without code.
class JsonFormatter : public Formatter {
 public:
  JsonFormatter() = default;

  std::string Name() const override { return "JSON"; }

  std::string Format(
      const std::vector<const coverage::FileSnapshot*>& snapshots) override;

  static nlohmann::json FileToJson(const coverage::FileSnapshot& snapshot);
  static nlohmann::json LineToJson(const coverage::LineSnapshot& line,
                                   int linenum);
};

std::unique_ptr<Formatter> CreateJsonFormatter();

}  // namespace output
}  // namespace tracecov

#endif  // TRACECOV_OUTPUT_JSON_FORMATTER_H_
