// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "coverage/coverage_engine.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "core/exceptions.h"

namespace tracecov {
namespace coverage {
namespace {

// Records every event as a readable string
class RecordingObserver : public CoverageObserver {
 public:
  explicit RecordingObserver(std::vector<std::string>* log,
                             const std::string& tag = "")
      : log_(log), tag_(tag) {}

  void OnNewScript(const CoverageEngine& /*engine*/,
                   const std::string& filename,
                   const FileSnapshot& snapshot) override {
    log_->push_back(tag_ + "new " + filename + " " +
                    std::to_string(snapshot.covered));
  }

  void OnScriptUpdate(const CoverageEngine& /*engine*/,
                      const std::string& filename,
                      const FileSnapshot& snapshot) override {
    log_->push_back(tag_ + "script " + filename + " " +
                    std::to_string(snapshot.covered) + "/" +
                    std::to_string(snapshot.partial) + "/" +
                    std::to_string(snapshot.uncovered) + "/" +
                    std::to_string(snapshot.dead));
  }

  void OnLineUpdate(const CoverageEngine& /*engine*/,
                    const std::string& filename, int line,
                    const LineSnapshot& line_data) override {
    log_->push_back(tag_ + "line " + filename + " " + std::to_string(line) +
                    " " + CoverageClassName(line_data.coverage));
  }

 private:
  std::vector<std::string>* log_;
  std::string tag_;
};

// Only cares about new files
class NewFileObserver : public CoverageObserver {
 public:
  void OnNewScript(const CoverageEngine& /*engine*/,
                   const std::string& filename,
                   const FileSnapshot& /*snapshot*/) override {
    files.push_back(filename);
  }

  std::vector<std::string> files;
};

// Calls back into the engine from a handler
class ReentrantObserver : public CoverageObserver {
 public:
  explicit ReentrantObserver(CoverageEngine* engine) : engine_(engine) {}

  void OnNewScript(const CoverageEngine& /*engine*/,
                   const std::string& /*filename*/,
                   const FileSnapshot& /*snapshot*/) override {
    engine_->ParseData("");
  }

 private:
  CoverageEngine* engine_;
};

// Unregisters another observer the first time it hears of a new file
class RemovingObserver : public CoverageObserver {
 public:
  RemovingObserver(CoverageEngine* engine, CoverageObserver* target)
      : engine_(engine), target_(target) {}

  void OnNewScript(const CoverageEngine& /*engine*/,
                   const std::string& /*filename*/,
                   const FileSnapshot& /*snapshot*/) override {
    engine_->RemoveObserver(target_);
  }

 private:
  CoverageEngine* engine_;
  CoverageObserver* target_;
};

// Trace with one function whose branch on line 2 is taken `taken` times
// out of `calls`
std::string BranchTrace(int calls, int taken) {
  std::string c = std::to_string(calls);
  std::string t = std::to_string(taken);
  std::string n = std::to_string(calls - taken);
  return "--- SCRIPT a.js:1 ---\n"
         "00000:" + c + "/0/0  x     1  getlocal 0\n"
         "00003:" + c + "/0/0  x     1  ifeq 12 (+9)\n"
         "00006:" + n + "/0/0  x     2  getlocal 1\n"
         "00009:" + n + "/0/0  x     2  return\n"
         "00012:" + t + "/0/0  x     3  getlocal 2\n"
         "00015:" + t + "/0/0  x     3  return\n"
         "00016:0/0/0  x     4  stop\n"
         "--- END SCRIPT a.js:1 ---\n";
}

// Test fixture for CoverageEngine tests
class CoverageEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observer_ = std::make_unique<RecordingObserver>(&events_);
    engine_.AddObserver(observer_.get());
  }

  CoverageEngine engine_;
  std::vector<std::string> events_;
  std::unique_ptr<RecordingObserver> observer_;
};

TEST_F(CoverageEngineTest, FirstParseReportsNewFile) {
  ParseStats stats = engine_.ParseData(BranchTrace(2, 1));

  EXPECT_EQ(stats.scripts, 1u);
  EXPECT_EQ(stats.new_files, 1u);
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0], "new a.js 3");

  const FileSnapshot* snapshot = engine_.FindSnapshot("a.js");
  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->covered, 3);
  EXPECT_EQ(snapshot->uncovered, 0);
  ASSERT_EQ(snapshot->lines.size(), 4u);
  EXPECT_EQ(snapshot->lines[0]->counts, (std::vector<int64_t>{2}));
  EXPECT_TRUE(snapshot->lines[0]->start_func);
  EXPECT_TRUE(snapshot->lines[3]->end_func);
  EXPECT_EQ(snapshot->lines[3]->coverage, CoverageClass::INSIGNIFICANT);
}

TEST_F(CoverageEngineTest, UnchangedDumpEmitsNothing) {
  engine_.ParseData(BranchTrace(2, 1));
  events_.clear();

  ParseStats stats = engine_.ParseData(BranchTrace(2, 1));

  EXPECT_TRUE(events_.empty());
  EXPECT_EQ(stats.line_updates, 0u);
  EXPECT_EQ(stats.script_updates, 0u);
}

TEST_F(CoverageEngineTest, ChangedLineUsesZeroBasedIndex) {
  engine_.ParseData(BranchTrace(1, 1));  // line 2 never runs
  EXPECT_EQ(engine_.FindSnapshot("a.js")->uncovered, 1);
  events_.clear();

  engine_.ParseData(BranchTrace(2, 1));

  // Line 1 changed count, line 2 changed class, line 3 is unchanged
  ASSERT_EQ(events_.size(), 3u);
  EXPECT_EQ(events_[0], "line a.js 0 full");
  EXPECT_EQ(events_[1], "line a.js 1 full");
  EXPECT_EQ(events_[2], "script a.js 3/0/0/0");

  const FileSnapshot* snapshot = engine_.FindSnapshot("a.js");
  EXPECT_EQ(snapshot->lines[1]->counts, (std::vector<int64_t>{1}));
}

TEST_F(CoverageEngineTest, CountChangeWithoutClassChange) {
  engine_.ParseData(BranchTrace(2, 1));
  events_.clear();

  engine_.ParseData(BranchTrace(4, 2));

  // Lines 1, 2 and 3 changed counts; totals did not move
  ASSERT_EQ(events_.size(), 3u);
  EXPECT_EQ(events_[0], "line a.js 0 full");
  EXPECT_EQ(events_[1], "line a.js 1 full");
  EXPECT_EQ(events_[2], "line a.js 2 full");
  EXPECT_EQ(engine_.FindSnapshot("a.js")->lines[0]->counts,
            (std::vector<int64_t>{4}));
}

TEST_F(CoverageEngineTest, NewLineInKnownFileUsesLineNumber) {
  engine_.ParseData(BranchTrace(2, 1));
  events_.clear();

  // A function compiled later in the same file
  engine_.ParseData(BranchTrace(2, 1) +
                    "--- SCRIPT a.js:10 ---\n"
                    "00000:0/0/0  x     10  getlocal 0\n"
                    "00003:0/0/0  x     11  return\n"
                    "--- END SCRIPT\n");

  ASSERT_EQ(events_.size(), 3u);
  EXPECT_EQ(events_[0], "line a.js 10 none");
  EXPECT_EQ(events_[1], "line a.js 11 none");
  EXPECT_EQ(events_[2], "script a.js 3/0/2/0");

  const FileSnapshot* snapshot = engine_.FindSnapshot("a.js");
  ASSERT_EQ(snapshot->lines.size(), 11u);
  EXPECT_FALSE(snapshot->lines[5].has_value());
  EXPECT_TRUE(snapshot->lines[9].has_value());
}

TEST_F(CoverageEngineTest, VanishedScriptsKeepTheirLines) {
  engine_.ParseData(BranchTrace(2, 1) +
                    "--- SCRIPT a.js:10 ---\n"
                    "00000:0/0/0  x     10  return\n"
                    "--- END SCRIPT\n");
  EXPECT_EQ(engine_.FindSnapshot("a.js")->uncovered, 1);
  events_.clear();

  // The second function was collected and is missing from this dump
  engine_.ParseData(BranchTrace(2, 1));

  EXPECT_TRUE(events_.empty());
  const FileSnapshot* snapshot = engine_.FindSnapshot("a.js");
  EXPECT_EQ(snapshot->uncovered, 1);
  EXPECT_TRUE(snapshot->lines[9].has_value());
}

TEST_F(CoverageEngineTest, RepeatedScriptCountsAreMerged) {
  std::string once =
      "--- SCRIPT m.js:1 ---\n"
      "00000:3/0/0  x     1  getlocal 0\n"
      "00003:3/0/0  x     2  return\n"
      "--- END SCRIPT\n";
  std::string again =
      "--- SCRIPT m.js:1 ---\n"
      "00000:2/0/0  x     1  getlocal 0\n"
      "00003:2/0/0  x     2  return\n"
      "--- END SCRIPT\n";

  ParseStats stats = engine_.ParseData(once + again);

  EXPECT_EQ(stats.scripts, 1u);
  EXPECT_EQ(stats.merged_scripts, 1u);
  const FileSnapshot* snapshot = engine_.FindSnapshot("m.js");
  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->lines[0]->counts, (std::vector<int64_t>{5}));
  EXPECT_EQ(snapshot->lines[1]->counts, (std::vector<int64_t>{5}));
}

TEST_F(CoverageEngineTest, FilesAreProcessedInNameOrder) {
  engine_.ParseData(
      "--- SCRIPT z.js:1 ---\n"
      "00000:1/0/0  x     1  return\n"
      "--- END SCRIPT\n"
      "--- SCRIPT b.js:1 ---\n"
      "00000:1/0/0  x     1  return\n"
      "--- END SCRIPT\n"
      "--- SCRIPT m.js:1 ---\n"
      "00000:1/0/0  x     1  return\n"
      "--- END SCRIPT\n");

  ASSERT_EQ(events_.size(), 3u);
  EXPECT_EQ(events_[0], "new b.js 1");
  EXPECT_EQ(events_[1], "new m.js 1");
  EXPECT_EQ(events_[2], "new z.js 1");

  std::vector<const FileSnapshot*> snapshots = engine_.Snapshots();
  ASSERT_EQ(snapshots.size(), 3u);
  EXPECT_EQ(snapshots[0]->filename, "b.js");
  EXPECT_EQ(snapshots[2]->filename, "z.js");
}

TEST_F(CoverageEngineTest, ObserversRunInRegistrationOrder) {
  RecordingObserver second(&events_, "2:");
  NewFileObserver partial;
  engine_.AddObserver(&partial);
  engine_.AddObserver(&second);

  engine_.ParseData(BranchTrace(1, 1));

  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[0], "new a.js 2");
  EXPECT_EQ(events_[1], "2:new a.js 2");
  EXPECT_EQ(partial.files, (std::vector<std::string>{"a.js"}));

  // Handlers it does not override are no-ops
  engine_.ParseData(BranchTrace(2, 1));
  EXPECT_EQ(partial.files.size(), 1u);
}

TEST_F(CoverageEngineTest, RemovedObserverIsNotNotified) {
  engine_.RemoveObserver(observer_.get());
  EXPECT_EQ(engine_.observer_count(), 0u);

  engine_.ParseData(BranchTrace(1, 1));

  EXPECT_TRUE(events_.empty());
  EXPECT_NE(engine_.FindSnapshot("a.js"), nullptr);
}

TEST_F(CoverageEngineTest, ReentrantParseIsRejected) {
  ReentrantObserver reentrant(&engine_);
  engine_.AddObserver(&reentrant);

  EXPECT_THROW(engine_.ParseData(
                   "--- SCRIPT a.js:1 ---\n"
                   "00000:1/0/0  x     1  return\n"
                   "--- END SCRIPT\n"
                   "--- SCRIPT b.js:1 ---\n"
                   "00000:1/0/0  x     1  return\n"
                   "--- END SCRIPT\n"),
               EngineStateException);

  // Both files were stored before any observer ran
  ASSERT_EQ(engine_.snapshots().size(), 2u);
  EXPECT_EQ(engine_.FindSnapshot("a.js")->covered, 1);
  EXPECT_EQ(engine_.FindSnapshot("b.js")->covered, 1);
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0], "new a.js 1");

  // The engine is usable again afterwards
  engine_.RemoveObserver(&reentrant);
  events_.clear();
  EXPECT_NO_THROW(engine_.ParseData(
      "--- SCRIPT c.js:1 ---\n"
      "00000:1/0/0  x     1  return\n"
      "--- END SCRIPT\n"));
  EXPECT_EQ(events_, (std::vector<std::string>{"new c.js 1"}));
}

TEST_F(CoverageEngineTest, ObserversSeeTheWholeDump) {
  // Checks from inside a handler that later files are already stored
  class StateChecker : public CoverageObserver {
   public:
    void OnNewScript(const CoverageEngine& engine,
                     const std::string& /*filename*/,
                     const FileSnapshot& /*snapshot*/) override {
      stored.push_back(engine.snapshots().size());
    }
    std::vector<size_t> stored;
  };
  StateChecker checker;
  engine_.AddObserver(&checker);

  engine_.ParseData(
      "--- SCRIPT a.js:1 ---\n"
      "00000:1/0/0  x     1  return\n"
      "--- END SCRIPT\n"
      "--- SCRIPT b.js:1 ---\n"
      "00000:1/0/0  x     1  return\n"
      "--- END SCRIPT\n");

  EXPECT_EQ(checker.stored, (std::vector<size_t>{2, 2}));
}

TEST_F(CoverageEngineTest, ObserverRemovedByAnotherIsSkipped) {
  std::vector<std::string> later_events;
  RecordingObserver later(&later_events);
  RemovingObserver remover(&engine_, &later);
  engine_.AddObserver(&remover);
  engine_.AddObserver(&later);

  engine_.ParseData(BranchTrace(1, 1));

  EXPECT_TRUE(later_events.empty());
  EXPECT_EQ(engine_.observer_count(), 2u);
  EXPECT_EQ(events_.size(), 1u);
}

TEST_F(CoverageEngineTest, LinesWithoutSlotDoNotCauseUpdates) {
  // Line 0 and an absurd line number are left out of the snapshot
  std::string trace =
      "--- SCRIPT a.js:0 ---\n"
      "00000:1/0/0  x     0  getlocal 0\n"
      "00003:1/0/0  x     1  getlocal 1\n"
      "00006:1/0/0  x     2000000000  return\n"
      "--- END SCRIPT\n";

  ParseStats stats;
  ASSERT_NO_THROW(stats = engine_.ParseData(trace));
  EXPECT_EQ(stats.new_files, 1u);
  const FileSnapshot* snapshot = engine_.FindSnapshot("a.js");
  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->covered, 1);
  EXPECT_EQ(snapshot->lines.size(), 1u);
  events_.clear();

  stats = engine_.ParseData(trace);

  EXPECT_TRUE(events_.empty());
  EXPECT_EQ(stats.line_updates, 0u);
  EXPECT_EQ(stats.script_updates, 0u);
}

TEST_F(CoverageEngineTest, BrokenBranchLeavesStateUntouched) {
  EXPECT_THROW(engine_.ParseData(
                   "--- SCRIPT bad.js:1 ---\n"
                   "00000:1/0/0  x     1  goto 99\n"
                   "--- END SCRIPT\n"),
               AnalysisException);

  EXPECT_TRUE(engine_.snapshots().empty());
  EXPECT_TRUE(events_.empty());
}

TEST_F(CoverageEngineTest, RemapMovesCoverage) {
  core::RemapTable table;
  table.AddEntry("out.js", core::RemapEntry{"in.js", -1});
  CoverageEngine engine(core::EngineConfig(), table.AsFunction());

  engine.ParseData(
      "--- SCRIPT out.js:2 ---\n"
      "00000:1/0/0  x     2  return\n"
      "--- END SCRIPT\n");

  EXPECT_EQ(engine.FindSnapshot("out.js"), nullptr);
  const FileSnapshot* snapshot = engine.FindSnapshot("in.js");
  ASSERT_NE(snapshot, nullptr);
  ASSERT_EQ(snapshot->lines.size(), 1u);
  EXPECT_EQ(snapshot->lines[0]->coverage, CoverageClass::FULL);
}

}  // namespace
}  // namespace coverage
}  // namespace tracecov
