// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/remap_table.h"

#include <gtest/gtest.h>

#include <string>

namespace tracecov {
namespace core {
namespace {

TEST(RemapTableTest, UnknownFilesPassThrough) {
  RemapTable table;
  EXPECT_TRUE(table.empty());
  auto mapped = table.Apply("app.js", 42);
  EXPECT_EQ(mapped.first, "app.js");
  EXPECT_EQ(mapped.second, 42);
}

TEST(RemapTableTest, EntryRenamesAndShifts) {
  RemapTable table;
  table.AddEntry("build/app.js", RemapEntry{"src/app.js", -12});

  auto mapped = table.Apply("build/app.js", 20);
  EXPECT_EQ(mapped.first, "src/app.js");
  EXPECT_EQ(mapped.second, 8);
  EXPECT_EQ(table.Apply("other.js", 20).first, "other.js");
}

TEST(RemapTableTest, LoadFromJson) {
  RemapTable table;
  std::string error;
  ASSERT_TRUE(table.LoadFromJson(R"({"remap": [
      {"from": "gen/a.js", "to": "a.js", "line_offset": 5},
      {"from": "gen/b.js", "line_offset": -1},
      {"from": "gen/c.js", "to": "c.js"}
  ]})",
                                 &error))
      << error;

  EXPECT_EQ(table.size(), 3u);
  EXPECT_EQ(table.Apply("gen/a.js", 1), (std::pair<std::string, int>{"a.js", 6}));
  EXPECT_EQ(table.Apply("gen/b.js", 3),
            (std::pair<std::string, int>{"gen/b.js", 2}));
  EXPECT_EQ(table.Apply("gen/c.js", 3), (std::pair<std::string, int>{"c.js", 3}));
}

TEST(RemapTableTest, LoadRejectsBadInput) {
  RemapTable table;
  table.AddEntry("keep.js", RemapEntry{"kept.js", 0});
  std::string error;

  EXPECT_FALSE(table.LoadFromJson(R"({"entries": []})", &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(table.LoadFromJson(R"({"remap": [{"to": "x.js"}]})", &error));
  EXPECT_FALSE(table.LoadFromJson("not json", &error));

  // A failed load keeps the previous entries
  EXPECT_EQ(table.size(), 1u);
  EXPECT_EQ(table.Apply("keep.js", 1).first, "kept.js");
}

TEST(RemapTableTest, AsFunctionUsesTable) {
  RemapTable table;
  table.AddEntry("x.js", RemapEntry{"y.js", 100});
  RemapFunction remap = table.AsFunction();

  auto mapped = remap("x.js", 1);
  EXPECT_EQ(mapped.first, "y.js");
  EXPECT_EQ(mapped.second, 101);

  // Entries added later are seen through the same function
  table.AddEntry("p.js", RemapEntry{"q.js", 0});
  EXPECT_EQ(remap("p.js", 1).first, "q.js");
}

TEST(RemapTableTest, MissingFileIsReported) {
  RemapTable table;
  std::string error;
  EXPECT_FALSE(table.LoadFromFile("/nonexistent/remap.json", &error));
  EXPECT_FALSE(error.empty());
}

}  // namespace
}  // namespace core
}  // namespace tracecov
