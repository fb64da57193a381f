// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "coverage/snapshot.h"

#include <utility>

#include "core/constants.h"
#include "utils/logger.h"

namespace tracecov {
namespace coverage {

CoverageTally FileSnapshot::tally() const {
  CoverageTally result;
  result.full = covered;
  result.some = partial;
  result.none = uncovered;
  result.dead = dead;
  return result;
}

void FileSnapshot::set_tally(const CoverageTally& tally) {
  covered = tally.full;
  partial = tally.some;
  uncovered = tally.none;
  dead = tally.dead;
}

CoverageTally FileSnapshot::Recount() const {
  CoverageTally result;
  for (const auto& line : lines) {
    if (line) {
      result.Add(line->coverage);
    }
  }
  return result;
}

FileSnapshot FileSnapshot::FromFile(const File& file) {
  FileSnapshot snapshot;
  snapshot.filename = file.filename();

  for (const auto& [number, line] : file.lines()) {
    if (number < 1 || number > constants::kMaxSourceLine) {
      // No slot for it in the dense array
      LOG_DEBUG("Skipping line " + std::to_string(number) + " of " +
                file.filename());
      continue;
    }
    size_t index = static_cast<size_t>(number) - 1;
    if (index >= snapshot.lines.size()) {
      snapshot.lines.resize(index + 1);
    }

    LineSnapshot entry;
    entry.coverage = line.Coverage();
    entry.counts = line.Counts();
    entry.start_func = line.start_func;
    entry.end_func = line.end_func;
    snapshot.lines[index] = std::move(entry);
  }

  // Totals cover exactly the lines that were given a slot
  snapshot.set_tally(snapshot.Recount());
  return snapshot;
}

}  // namespace coverage
}  // namespace tracecov
