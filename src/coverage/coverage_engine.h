// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_COVERAGE_COVERAGE_ENGINE_H_
#define TRACECOV_COVERAGE_COVERAGE_ENGINE_H_

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "core/engine_config.h"
#include "core/remap_table.h"
#include "coverage/coverage_observer.h"
#include "coverage/file.h"
#include "coverage/snapshot.h"

namespace tracecov {
namespace coverage {

// Summary of one ParseData call
struct ParseStats {
  size_t scripts = 0;          // Unique scripts in the dump
  size_t merged_scripts = 0;   // Repeats folded into an earlier copy
  size_t discarded_scripts = 0;
  size_t files = 0;
  size_t new_files = 0;
  size_t line_updates = 0;
  size_t script_updates = 0;
};

// Turns successive trace dumps of a running process into per-file line
// coverage, keeping the last reported state and notifying observers of
// what changed.
//
// Not thread-safe; calls must be serialized by the caller.
class CoverageEngine {
 public:
  explicit CoverageEngine(core::EngineConfig config = core::EngineConfig(),
                          core::RemapFunction remap = nullptr);

  CoverageEngine(const CoverageEngine&) = delete;
  CoverageEngine& operator=(const CoverageEngine&) = delete;

  // Observers are not owned and are compared by identity
  void AddObserver(CoverageObserver* observer);
  void RemoveObserver(CoverageObserver* observer);
  size_t observer_count() const { return observers_.size(); }

  // Parse a complete dump, update the stored snapshots and notify
  // observers before returning. Every file is reconciled before the first
  // observer runs, so observers always see the complete new state.
  //
  // Throws AnalysisException for a script whose branches point outside
  // itself; stored state is then left unchanged. A call made from an
  // observer throws EngineStateException and changes nothing; if the
  // observer lets it escape, the outer call rethrows it with all files
  // already stored and the remaining events undelivered.
  ParseStats ParseData(const std::string& raw_data);

  // Stored snapshots keyed (and so ordered) by filename
  const std::map<std::string, FileSnapshot>& snapshots() const {
    return snapshots_;
  }

  // Stored snapshots in filename order
  std::vector<const FileSnapshot*> Snapshots() const;

  const FileSnapshot* FindSnapshot(const std::string& filename) const;

  const core::EngineConfig& config() const { return config_; }

 private:
  // One change found while reconciling, delivered once all files are
  // stored
  struct PendingEvent {
    enum Kind { NEW_SCRIPT, SCRIPT_UPDATE, LINE_UPDATE };

    Kind kind;
    std::string filename;
    int line;
    LineSnapshot line_data;
  };

  // Merge a freshly built snapshot into the stored state
  void Reconcile(FileSnapshot snapshot, ParseStats* stats,
                 std::vector<PendingEvent>* events);

  void Dispatch(const PendingEvent& event);

  bool IsObserver(const CoverageObserver* observer) const;

  core::EngineConfig config_;
  core::RemapFunction remap_;
  std::map<std::string, FileSnapshot> snapshots_;
  std::vector<CoverageObserver*> observers_;
  bool parsing_;
};

}  // namespace coverage
}  // namespace tracecov

#endif  // TRACECOV_COVERAGE_COVERAGE_ENGINE_H_
