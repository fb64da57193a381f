// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef TRACECOV_CORE_CONSTANTS_H_
#define TRACECOV_CORE_CONSTANTS_H_

#include <cstddef>
#include <cstdint>

namespace tracecov {
namespace constants {

// Trace grammar
constexpr const char* kScriptStartPattern = R"(^--- SCRIPT (.*):(\d+) ---$)";
constexpr const char* kScriptEndPattern = R"(^--- END SCRIPT)";
constexpr const char* kScriptDataPattern =
    R"(^(\d+):(\d+(?:/\d+)+)\s+x\s+(\d+)\s+(.*)$)";
constexpr const char* kEntryMarker = "main:";
constexpr char kContinuationPrefix = '\t';

// Header lines of blocks that are dropped on sight (bootstrap script,
// anonymous top-level script, inline -e script)
constexpr const char* kNullScriptHeader = "--- SCRIPT (null):0 ---";
constexpr const char* kEmptyScriptHeader = "--- SCRIPT :0 ---";
constexpr const char* kInlineEvalHeader = "--- SCRIPT -e:1 ---";

// Only the leading sub-counts are execution counts; the rest are auxiliary
constexpr size_t kSummedCountFields = 3;

// Instruction emitted for a closing brace; alone and unreachable it is noise
constexpr const char* kHaltMnemonic = "stop";

// Mnemonics whose disassembly embeds a whole nested function
constexpr const char* kLambdaMnemonic = "lambda";
constexpr const char* kDefLocalFunMnemonic = "deflocalfun";

// Count recorded for an instruction that can never execute
constexpr int64_t kUnreachableCount = -1;

// Highest source line given a slot in a file snapshot
constexpr int kMaxSourceLine = 1000000;

// Profile buckets are floor(log10(count)) clamped to this
constexpr int kMaxProfileBucket = 9;

}  // namespace constants
}  // namespace tracecov

#endif  // TRACECOV_CORE_CONSTANTS_H_
