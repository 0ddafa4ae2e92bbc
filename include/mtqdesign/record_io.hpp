#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "mtqdesign/result.hpp"

namespace mtqdesign {

nlohmann::json designRecordToJson(const DesignRecord& record);

// Throws ConfigError when a required group or field is missing.
DesignRecord designRecordFromJson(const nlohmann::json& json);

void writeDesignRecord(const std::string& path, const DesignRecord& record);

DesignRecord readDesignRecord(const std::string& path);

/// Human-readable multi-line summary of the record.
std::string formatDesignSummary(const DesignRecord& record);

}  // namespace mtqdesign
