// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/script.h"

#include <gtest/gtest.h>

#include "core/exceptions.h"

namespace tracecov {
namespace core {
namespace {

// Test fixture for Script parsing
class ScriptTest : public ::testing::Test {
 protected:
  Script Build(const std::vector<std::string>& lines,
               const RemapFunction& remap = nullptr) {
    return Script::FromRecord(lines, config_, remap);
  }

  EngineConfig config_;
};

TEST_F(ScriptTest, ParsesHeaderAndInstructions) {
  Script script = Build({
      "--- SCRIPT foo.js:3 ---",
      "00000:3/0/0/0/0/0  x     3  getlocal 0",
      "00003:1/1/1/0/0/0  x     4  stop",
      "--- END SCRIPT foo.js:3 ---",
  });

  EXPECT_EQ(script.name(), "foo.js:3");
  EXPECT_EQ(script.filename(), "foo.js");
  EXPECT_EQ(script.start_line(), 3);
  EXPECT_EQ(script.entry_index(), -1);
  ASSERT_EQ(script.size(), 2u);

  const Instruction& first = script.instructions()[0];
  EXPECT_EQ(first.address, 0u);
  EXPECT_EQ(first.source_line, 3);
  EXPECT_EQ(first.count, 3);
  EXPECT_EQ(first.assembly, "getlocal 0");

  // Only the first three sub-counts are summed
  EXPECT_EQ(script.instructions()[1].count, 3);
}

TEST_F(ScriptTest, AuxiliaryCountsAreIgnored) {
  Script script = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:1/2/3/400/500/600  x     1  stop",
  });

  ASSERT_EQ(script.size(), 1u);
  EXPECT_EQ(script.instructions()[0].count, 6);
}

TEST_F(ScriptTest, ConfiguredSummedFields) {
  config_.summed_count_fields = 1;
  Script script = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:1/2/3  x     1  stop",
  });

  ASSERT_EQ(script.size(), 1u);
  EXPECT_EQ(script.instructions()[0].count, 1);
}

TEST_F(ScriptTest, EntryMarkerRecordsIndex) {
  Script script = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:1/0/0  x     1  defvar \"x\"",
      "00003:1/0/0  x     1  defvar \"y\"",
      "main:",
      "00006:1/0/0  x     2  stop",
  });

  EXPECT_EQ(script.entry_index(), 2);
}

TEST_F(ScriptTest, ContinuationLinesAppendToPreviousInstruction) {
  Script script = Build({
      "--- SCRIPT foo.js:1 ---",
      "00010:1/0/0  x     2  tableswitch default offset 30 low 0 high 1",
      "\t0: 12",
      "\t1: 20",
      "00013:0/0/0  x     3  stop",
  });

  ASSERT_EQ(script.size(), 2u);
  EXPECT_EQ(script.instructions()[0].assembly,
            "tableswitch default offset 30 low 0 high 1\t0: 12\t1: 20");
}

TEST_F(ScriptTest, LambdaBodiesAreCollapsed) {
  Script script = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:1/0/0  x     1  lambda function () { return 1; }",
      "    return 1;",
      "00005:1/0/0  x     2  deflocalfun 0 function g() {}",
      "00010:1/0/0  x     3  lambdax",
  });

  ASSERT_EQ(script.size(), 3u);
  EXPECT_EQ(script.instructions()[0].assembly, "lambda");
  EXPECT_EQ(script.instructions()[1].assembly, "deflocalfun");
  // Only the mnemonic followed by a space is collapsed
  EXPECT_EQ(script.instructions()[2].assembly, "lambdax");
}

TEST_F(ScriptTest, UnrecognizedLinesAreIgnored) {
  Script script = Build({
      "--- SCRIPT foo.js:1 ---",
      "loc   op",
      "----- --",
      "00000:1/0/0  x     1  stop",
      "Source notes:",
      "--- END SCRIPT",
  });

  EXPECT_EQ(script.size(), 1u);
}

TEST_F(ScriptTest, ContinuationBeforeAnyInstructionIsIgnored) {
  Script script = Build({
      "--- SCRIPT foo.js:1 ---",
      "\tstray",
      "00000:1/0/0  x     1  stop",
  });

  ASSERT_EQ(script.size(), 1u);
  EXPECT_EQ(script.instructions()[0].assembly, "stop");
}

TEST_F(ScriptTest, OverflowingFieldsDropTheLine) {
  Script script = Build({
      "--- SCRIPT foo.js:1 ---",
      "99999999999999:1/0/0  x     1  getlocal 0",
      "00000:99999999999999999999/0/0  x     1  getlocal 0",
      "00003:1/0/0  x     1  stop",
  });

  ASSERT_EQ(script.size(), 1u);
  EXPECT_EQ(script.instructions()[0].address, 3u);
}

TEST_F(ScriptTest, RemapTranslatesHeaderAndLines) {
  RemapFunction remap = [](const std::string& file, int line) {
    EXPECT_EQ(file, "bundle.js");
    return std::make_pair(std::string("app.js"), line - 10);
  };

  Script script = Build({
      "--- SCRIPT bundle.js:15 ---",
      "00000:1/0/0  x     16  stop",
  }, remap);

  EXPECT_EQ(script.name(), "app.js:5");
  EXPECT_EQ(script.filename(), "app.js");
  EXPECT_EQ(script.raw_filename(), "bundle.js");
  ASSERT_EQ(script.size(), 1u);
  EXPECT_EQ(script.instructions()[0].source_line, 6);
}

TEST_F(ScriptTest, FindIndex) {
  Script script = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:1/0/0  x     1  getlocal 0",
      "00003:1/0/0  x     1  stop",
  });

  EXPECT_EQ(script.FindIndex(3), 1u);
  EXPECT_FALSE(script.FindIndex(1).has_value());
}

TEST_F(ScriptTest, SignatureIgnoresCounts) {
  Script a = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:3/0/0  x     1  getlocal 0",
      "00003:3/0/0  x     1  stop",
  });
  Script b = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:2/0/0  x     1  getlocal 0",
      "00003:2/0/0  x     1  stop",
  });

  EXPECT_EQ(a.Signature(), b.Signature());
  EXPECT_EQ(a.Signature(), "foo.js:1:-1\n0:1:getlocal 0\n3:1:stop");
}

TEST_F(ScriptTest, SignatureDistinguishesBodies) {
  Script a = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:1/0/0  x     1  getlocal 0",
  });
  Script b = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:1/0/0  x     1  getlocal 1",
  });

  EXPECT_NE(a.Signature(), b.Signature());
}

TEST_F(ScriptTest, AddCountsMergesElementWise) {
  Script a = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:3/0/0  x     1  getlocal 0",
      "00003:3/0/0  x     1  stop",
  });
  Script b = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:2/0/0  x     1  getlocal 0",
      "00003:2/0/0  x     1  stop",
  });

  a.AddCounts(b);

  EXPECT_EQ(a.instructions()[0].count, 5);
  EXPECT_EQ(a.instructions()[1].count, 5);
}

TEST_F(ScriptTest, AddCountsRejectsDifferentStructure) {
  Script a = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:3/0/0  x     1  getlocal 0",
  });
  Script b = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:3/0/0  x     1  getlocal 0",
      "00003:3/0/0  x     1  stop",
  });
  Script c = Build({
      "--- SCRIPT foo.js:1 ---",
      "00000:3/0/0  x     2  getlocal 0",
  });

  EXPECT_THROW(a.AddCounts(b), ScriptMismatchException);
  EXPECT_THROW(a.AddCounts(c), ScriptMismatchException);
  EXPECT_EQ(a.instructions()[0].count, 3);
}

}  // namespace
}  // namespace core
}  // namespace tracecov
