// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_UTILS_CLI_PARSER_H_
#define TRACECOV_UTILS_CLI_PARSER_H_

#include <string>
#include <vector>

namespace tracecov {
namespace utils {

// Command-line options parsed from arguments
struct CliOptions {
  // Trace dumps, parsed in order as successive dumps of one process
  std::vector<std::string> input_files;
  std::string output_file;  // Empty writes the report to stdout

  // Engine options
  std::string config_file;
  std::string remap_file;

  // Output options
  std::string output_format = "json";
  bool log_events = false;
  bool verbose = false;
  bool quiet = false;
};

// CLI parser
class CliParser {
 public:
  CliParser();

  // Parse command-line arguments
  bool Parse(int argc, char** argv, CliOptions* options, std::string* error);

  // Get help text
  std::string GetHelp() const;

 private:
  std::string help_text_;
};

}  // namespace utils
}  // namespace tracecov

#endif  // TRACECOV_UTILS_CLI_PARSER_H_
