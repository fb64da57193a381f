// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/engine_config.h"

#include <algorithm>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

#include "core/constants.h"
#include "utils/logger.h"

namespace tracecov {
namespace core {

using json = nlohmann::json;

namespace {

bool ReadStringList(const json& j, const char* key,
                    std::vector<std::string>* out, std::string* error) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j[key];
  if (!value.is_array()) {
    *error = std::string("'") + key + "' must be an array of strings";
    return false;
  }
  std::vector<std::string> result;
  for (const auto& item : value) {
    if (!item.is_string()) {
      *error = std::string("'") + key + "' must contain only strings";
      return false;
    }
    result.push_back(item.get<std::string>());
  }
  *out = std::move(result);
  return true;
}

}  // namespace

EngineConfig::EngineConfig()
    : ignored_headers{constants::kNullScriptHeader,
                      constants::kEmptyScriptHeader,
                      constants::kInlineEvalHeader},
      halt_mnemonic(constants::kHaltMnemonic),
      collapsed_mnemonics{constants::kLambdaMnemonic,
                          constants::kDefLocalFunMnemonic},
      summed_count_fields(constants::kSummedCountFields) {}

bool EngineConfig::LoadFromFile(const std::string& path, std::string* error) {
  LOG_INFO("Loading engine config: " + path);

  std::ifstream file(path);
  if (!file.is_open()) {
    *error = "Failed to open config file: " + path;
    return false;
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  file.close();

  return LoadFromJson(content, error);
}

bool EngineConfig::LoadFromJson(const std::string& json_content,
                                std::string* error) {
  try {
    json j = json::parse(json_content);
    if (!j.is_object()) {
      *error = "Config root must be an object";
      return false;
    }

    // Parse into a copy so a failed load leaves this config untouched
    EngineConfig parsed = *this;

    if (!ReadStringList(j, "ignored_headers", &parsed.ignored_headers, error) ||
        !ReadStringList(j, "collapsed_mnemonics", &parsed.collapsed_mnemonics,
                        error)) {
      return false;
    }

    if (j.contains("halt_mnemonic")) {
      if (!j["halt_mnemonic"].is_string()) {
        *error = "'halt_mnemonic' must be a string";
        return false;
      }
      parsed.halt_mnemonic = j["halt_mnemonic"].get<std::string>();
    }

    if (j.contains("summed_count_fields")) {
      if (!j["summed_count_fields"].is_number_unsigned() ||
          j["summed_count_fields"].get<size_t>() == 0) {
        *error = "'summed_count_fields' must be a positive integer";
        return false;
      }
      parsed.summed_count_fields = j["summed_count_fields"].get<size_t>();
    }

    *this = std::move(parsed);
    LOG_DEBUG("Engine config: " + std::to_string(ignored_headers.size()) +
              " ignored headers, halt mnemonic '" + halt_mnemonic + "'");
    return true;

  } catch (const json::exception& e) {
    *error = std::string("JSON parse error: ") + e.what();
    return false;
  }
}

bool EngineConfig::IsIgnoredHeader(const std::string& line) const {
  return std::find(ignored_headers.begin(), ignored_headers.end(), line) !=
         ignored_headers.end();
}

}  // namespace core
}  // namespace tracecov
