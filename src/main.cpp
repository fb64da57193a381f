// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include <fstream>
#include <iostream>
#include <sstream>

#include "core/engine_config.h"
#include "core/exceptions.h"
#include "core/remap_table.h"
#include "coverage/coverage_engine.h"
#include "output/formatter_registry.h"
#include "utils/cli_parser.h"
#include "utils/logger.h"

using namespace tracecov;

namespace {

// Logs every change event the engine reports
class EventLogger : public coverage::CoverageObserver {
 public:
  void OnNewScript(const coverage::CoverageEngine& /*engine*/,
                   const std::string& filename,
                   const coverage::FileSnapshot& snapshot) override {
    LOG_INFO("new file " + filename + ": " + Totals(snapshot));
  }

  void OnScriptUpdate(const coverage::CoverageEngine& /*engine*/,
                      const std::string& filename,
                      const coverage::FileSnapshot& snapshot) override {
    LOG_INFO("totals changed " + filename + ": " + Totals(snapshot));
  }

  void OnLineUpdate(const coverage::CoverageEngine& /*engine*/,
                    const std::string& filename, int line,
                    const coverage::LineSnapshot& line_data) override {
    std::string counts;
    for (int64_t count : line_data.counts) {
      if (!counts.empty()) counts += ",";
      counts += std::to_string(count);
    }
    LOG_INFO("line " + filename + ":" + std::to_string(line) + " " +
             coverage::CoverageClassName(line_data.coverage) + " [" + counts +
             "]");
  }

 private:
  static std::string Totals(const coverage::FileSnapshot& snapshot) {
    return std::to_string(snapshot.covered) + " full, " +
           std::to_string(snapshot.partial) + " some, " +
           std::to_string(snapshot.uncovered) + " none, " +
           std::to_string(snapshot.dead) + " dead";
  }
};

std::string ReadTrace(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw TracecovException("Failed to open trace file: " + path);
  }
  std::ostringstream content;
  content << file.rdbuf();
  return content.str();
}

}  // namespace

int main(int argc, char** argv) {
  // Parse command-line arguments
  utils::CliParser parser;
  utils::CliOptions options;
  std::string error;

  if (!parser.Parse(argc, argv, &options, &error)) {
    LOG_ERROR(error);
    std::cout << parser.GetHelp() << std::endl;
    return 1;
  }

  // Keep stdout clean for the report
  if (options.output_file.empty()) {
    utils::Logger::Instance().SetStreams(&std::cerr, &std::cerr);
  }

  if (options.verbose) {
    utils::Logger::Instance().SetLevel(utils::LogLevel::DEBUG);
  } else if (options.quiet) {
    utils::Logger::Instance().SetLevel(utils::LogLevel::ERROR);
  }

  try {
    core::EngineConfig config;
    if (!options.config_file.empty() &&
        !config.LoadFromFile(options.config_file, &error)) {
      throw ConfigException(error);
    }

    core::RemapTable remap_table;
    core::RemapFunction remap;
    if (!options.remap_file.empty()) {
      if (!remap_table.LoadFromFile(options.remap_file, &error)) {
        throw ConfigException(error);
      }
      remap = remap_table.AsFunction();
    }

    auto formatter =
        output::FormatterRegistry::Instance().Create(options.output_format);
    if (!formatter) {
      LOG_ERROR("Unknown report format: " + options.output_format);
      return 1;
    }

    coverage::CoverageEngine engine(config, remap);
    EventLogger event_logger;
    if (options.log_events) {
      engine.AddObserver(&event_logger);
    }

    for (const auto& input : options.input_files) {
      LOG_INFO("Parsing trace: " + input);
      coverage::ParseStats stats = engine.ParseData(ReadTrace(input));
      LOG_DEBUG("  merged " + std::to_string(stats.merged_scripts) +
                ", discarded " + std::to_string(stats.discarded_scripts) +
                " scripts");
    }

    std::string report = formatter->Format(engine.Snapshots());

    if (options.output_file.empty()) {
      std::cout << report;
    } else {
      std::ofstream out_file(options.output_file);
      if (!out_file) {
        LOG_ERROR("Failed to open output file: " + options.output_file);
        return 1;
      }
      out_file << report;
      LOG_INFO("Report written to: " + options.output_file);
    }
    return 0;

  } catch (const std::exception& e) {
    LOG_ERROR("Fatal error: " + std::string(e.what()));
    return 1;
  }
}
