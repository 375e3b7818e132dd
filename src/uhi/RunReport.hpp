#pragma once

#include "uhi/Pipeline.hpp"

#include <string>

namespace uhi {

class JsonWriter;

// Summary of a materialized run: version, config, region, acquisitions used per
// collection, the mean statistic, class counts and warnings.
void WriteRunReportJson(JsonWriter& w, const PipelineResult& r);

bool WriteRunReportJsonFile(const std::string& path, const PipelineResult& r, std::string& outError);

} // namespace uhi
