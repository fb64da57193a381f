// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "coverage/coverage_engine.h"

#include <algorithm>
#include <utility>

#include "analysis/trace_parser.h"
#include "core/exceptions.h"
#include "utils/logger.h"

namespace tracecov {
namespace coverage {

namespace {

// Marks the engine busy for the duration of one ParseData call
class ParseGuard {
 public:
  explicit ParseGuard(bool* flag) : flag_(flag) {
    if (*flag_) {
      throw EngineStateException("ParseData called from an observer");
    }
    *flag_ = true;
  }
  ~ParseGuard() { *flag_ = false; }

  ParseGuard(const ParseGuard&) = delete;
  ParseGuard& operator=(const ParseGuard&) = delete;

 private:
  bool* flag_;
};

}  // namespace

CoverageEngine::CoverageEngine(core::EngineConfig config,
                               core::RemapFunction remap)
    : config_(std::move(config)), remap_(std::move(remap)), parsing_(false) {}

void CoverageEngine::AddObserver(CoverageObserver* observer) {
  if (observer) {
    observers_.push_back(observer);
  }
}

void CoverageEngine::RemoveObserver(CoverageObserver* observer) {
  auto it = std::find(observers_.begin(), observers_.end(), observer);
  if (it != observers_.end()) {
    observers_.erase(it);
  }
}

ParseStats CoverageEngine::ParseData(const std::string& raw_data) {
  ParseGuard guard(&parsing_);
  ParseStats stats;

  analysis::TraceParser parser(config_, remap_);
  parser.ProcessText(raw_data);

  stats.scripts = parser.scripts().size();
  stats.merged_scripts = parser.merged_count();
  stats.discarded_scripts = parser.discarded_count();

  // Files are rebuilt from each dump: dumps carry cumulative counts, and
  // only the stored snapshots persist between calls
  std::map<std::string, File> files;
  for (const auto& script : parser.scripts()) {
    auto it = files.find(script.filename());
    if (it == files.end()) {
      it = files.emplace(script.filename(),
                         File(script.filename(), config_.halt_mnemonic))
               .first;
    }
    it->second.AddScript(script);
  }
  stats.files = files.size();

  std::vector<PendingEvent> events;
  for (const auto& [filename, file] : files) {
    Reconcile(FileSnapshot::FromFile(file), &stats, &events);
  }

  LOG_INFO("Parsed " + std::to_string(stats.scripts) + " scripts in " +
           std::to_string(stats.files) + " files (" +
           std::to_string(stats.new_files) + " new, " +
           std::to_string(stats.line_updates) + " line updates)");

  for (const auto& event : events) {
    Dispatch(event);
  }
  return stats;
}

void CoverageEngine::Reconcile(FileSnapshot snapshot, ParseStats* stats,
                               std::vector<PendingEvent>* events) {
  const std::string filename = snapshot.filename;

  auto it = snapshots_.find(filename);
  if (it == snapshots_.end()) {
    snapshots_.emplace(filename, std::move(snapshot));
    stats->new_files++;
    events->push_back({PendingEvent::NEW_SCRIPT, filename, 0, {}});
    return;
  }

  FileSnapshot& stored = it->second;
  for (size_t i = 0; i < snapshot.lines.size(); ++i) {
    if (!snapshot.lines[i]) {
      continue;
    }
    const LineSnapshot& fresh = *snapshot.lines[i];

    if (i >= stored.lines.size()) {
      stored.lines.resize(i + 1);
    }
    std::optional<LineSnapshot>& old = stored.lines[i];

    if (!old) {
      // Scripts of one file can be compiled (and dumped) at different times
      old = fresh;
      stats->line_updates++;
      events->push_back({PendingEvent::LINE_UPDATE, filename,
                         static_cast<int>(i) + 1, *old});
    } else if (!old->SameCoverage(fresh)) {
      old->coverage = fresh.coverage;
      old->counts = fresh.counts;
      stats->line_updates++;
      events->push_back(
          {PendingEvent::LINE_UPDATE, filename, static_cast<int>(i), *old});
    }
  }

  // Totals come from the accumulated lines, not from this dump: collected
  // scripts drop out of later dumps
  CoverageTally tally = stored.Recount();
  if (tally != stored.tally()) {
    stored.set_tally(tally);
    stats->script_updates++;
    events->push_back({PendingEvent::SCRIPT_UPDATE, filename, 0, {}});
  }
}

std::vector<const FileSnapshot*> CoverageEngine::Snapshots() const {
  std::vector<const FileSnapshot*> result;
  result.reserve(snapshots_.size());
  for (const auto& [filename, snapshot] : snapshots_) {
    result.push_back(&snapshot);
  }
  return result;
}

const FileSnapshot* CoverageEngine::FindSnapshot(
    const std::string& filename) const {
  auto it = snapshots_.find(filename);
  if (it != snapshots_.end()) {
    return &it->second;
  }
  return nullptr;
}

void CoverageEngine::Dispatch(const PendingEvent& event) {
  switch (event.kind) {
    case PendingEvent::NEW_SCRIPT:
      LOG_DEBUG("New file: " + event.filename);
      break;
    case PendingEvent::SCRIPT_UPDATE:
      LOG_DEBUG("File totals changed: " + event.filename);
      break;
    case PendingEvent::LINE_UPDATE:
      break;
  }
  const FileSnapshot& snapshot = snapshots_.at(event.filename);

  // Copy so an observer may remove itself while being notified; observers
  // removed by an earlier handler are skipped
  std::vector<CoverageObserver*> observers = observers_;
  for (CoverageObserver* observer : observers) {
    if (!IsObserver(observer)) {
      continue;
    }
    switch (event.kind) {
      case PendingEvent::NEW_SCRIPT:
        observer->OnNewScript(*this, event.filename, snapshot);
        break;
      case PendingEvent::SCRIPT_UPDATE:
        observer->OnScriptUpdate(*this, event.filename, snapshot);
        break;
      case PendingEvent::LINE_UPDATE:
        observer->OnLineUpdate(*this, event.filename, event.line,
                               event.line_data);
        break;
    }
  }
}

bool CoverageEngine::IsObserver(const CoverageObserver* observer) const {
  return std::find(observers_.begin(), observers_.end(), observer) !=
         observers_.end();
}

}  // namespace coverage
}  // namespace tracecov
