// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "utils/cli_parser.h"

#include <CLI/CLI.hpp>

namespace tracecov {
namespace utils {

CliParser::CliParser() {}

bool CliParser::Parse(int argc, char** argv, CliOptions* options,
                      std::string* error) {
  CLI::App app{"tracecov - line coverage from interpreter bytecode traces"};

  // Input/output options
  app.add_option("-i,--input", options->input_files,
                 "Trace dump file(s), parsed in order")
      ->required()
      ->check(CLI::ExistingFile);
  app.add_option("-o,--output", options->output_file,
                 "Report file (default: stdout)");

  // Engine options
  app.add_option("--config", options->config_file, "Engine config (JSON)")
      ->check(CLI::ExistingFile);
  app.add_option("--remap", options->remap_file,
                 "Filename/line remap table (JSON)")
      ->check(CLI::ExistingFile);

  // Output options
  app.add_option("-f,--format", options->output_format,
                 "Report format (json, text)")
      ->default_val("json");
  app.add_flag("--events", options->log_events,
               "Log every coverage change event");
  auto verbose = app.add_flag("-v,--verbose", options->verbose,
                              "Verbose output");
  app.add_flag("-q,--quiet", options->quiet, "Only log errors")
      ->excludes(verbose);

  // Parse
  try {
    app.parse(argc, argv);
    help_text_ = app.help();
    return true;
  } catch (const CLI::ParseError& e) {
    *error = "Command-line parse error: ";
    *error += e.what();
    help_text_ = app.help();
    return false;
  }
}

std::string CliParser::GetHelp() const {
  return help_text_;
}

}  // namespace utils
}  // namespace tracecov
