#pragma once

#include "uhi/Config.hpp"
#include "uhi/Json.hpp"

#include <iosfwd>
#include <string>

namespace uhi {

// JSON helpers for PipelineConfig.
//
// Keys are snake_case and grouped like the struct ("region", "window",
// "land_cover", "thermal", "statistic", "classify", "export"). Loading uses
// merge semantics: missing keys leave the existing value unchanged.

bool WritePipelineConfigJson(std::ostream& os, const PipelineConfig& cfg, std::string& outError);
// Empty string when the config holds non-finite numbers.
std::string PipelineConfigToJson(const PipelineConfig& cfg);

// Write the config as the value at the writer's current position.
void WritePipelineConfig(JsonWriter& w, const PipelineConfig& cfg);

bool ApplyPipelineConfigJson(const JsonValue& root, PipelineConfig& ioCfg, std::string& outError);

bool LoadPipelineConfigJsonFile(const std::string& path, PipelineConfig& ioCfg, std::string& outError);
bool WritePipelineConfigJsonFile(const std::string& path, const PipelineConfig& cfg, std::string& outError);

} // namespace uhi
