#include "uhi/RunReport.hpp"

#include "uhi/ConfigIO.hpp"
#include "uhi/Json.hpp"
#include "uhi/Version.hpp"

#include <fstream>

namespace uhi {

namespace {

void WriteStringArray(JsonWriter& w, const std::vector<std::string>& v)
{
  w.beginArray();
  for (const std::string& s : v) w.stringValue(s);
  w.endArray();
}

void WriteBounds(JsonWriter& w, const GeoBounds& b)
{
  w.beginArray();
  w.numberValue(b.minLon);
  w.numberValue(b.minLat);
  w.numberValue(b.maxLon);
  w.numberValue(b.maxLat);
  w.endArray();
}

} // namespace

void WriteRunReportJson(JsonWriter& w, const PipelineResult& r)
{
  w.beginObject();
  w.key("version");
  w.stringValue(UhiVersionString());

  w.key("config");
  WritePipelineConfig(w, r.config);

  w.key("region");
  w.beginObject();
  w.key("feature_indices");
  w.beginArray();
  for (std::size_t i : r.region.featureIndices) w.intValue(static_cast<std::int64_t>(i));
  w.endArray();
  w.key("polygons");
  w.intValue(static_cast<std::int64_t>(r.region.geometry.polygons.size()));
  w.key("bounds");
  WriteBounds(w, r.region.bounds);
  w.endObject();

  w.key("grid");
  WriteGridJson(w, r.grid);

  w.key("acquisitions");
  w.beginObject();
  w.key(r.config.landCover.collection);
  WriteStringArray(w, r.urban.acquisitionIds);
  w.key(r.config.thermal.collection);
  WriteStringArray(w, r.thermal.usedIds);
  w.key("dropped");
  WriteStringArray(w, r.thermal.droppedIds);
  w.endObject();

  w.key("urban_mask");
  w.beginObject();
  w.key("urban");
  w.intValue(static_cast<std::int64_t>(r.urban.urbanPixels));
  w.key("other");
  w.intValue(static_cast<std::int64_t>(r.urban.otherPixels));
  w.key("no_data");
  w.intValue(static_cast<std::int64_t>(r.urban.noDataPixels));
  w.endObject();

  const ScalarStatistic& m = r.heat.mean;
  w.key("mean_temperature");
  w.beginObject();
  w.key("value");
  if (m.value) {
    w.numberValue(*m.value);
  } else {
    w.nullValue();
  }
  w.key("reducer");
  w.stringValue(m.reducer);
  w.key("scale_m");
  w.numberValue(m.scaleMeters);
  w.key("max_pixels");
  w.numberValue(m.maxPixels);
  w.key("estimated_pixels");
  w.numberValue(m.estimatedPixels);
  w.key("sampled_pixels");
  w.intValue(static_cast<std::int64_t>(m.sampledPixels));
  w.endObject();

  w.key("classes");
  w.beginObject();
  for (int k = 0; k < kUhiClassCount; ++k) {
    w.key(UhiClassName(static_cast<UhiClass>(k)));
    w.intValue(static_cast<std::int64_t>(r.heat.classCounts[static_cast<std::size_t>(k)]));
  }
  w.endObject();

  w.key("export");
  WriteExportRequestJson(w, r.exportRequest, false);

  w.key("warnings");
  WriteStringArray(w, r.warnings);

  w.endObject();
}

bool WriteRunReportJsonFile(const std::string& path, const PipelineResult& r, std::string& outError)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path + " for writing";
    return false;
  }
  JsonWriter w(f, JsonWriteOptions{true, 2});
  WriteRunReportJson(w, r);
  f << '\n';
  if (!w.ok()) {
    outError = w.error();
    return false;
  }
  if (!f) {
    outError = "failed to write " + path;
    return false;
  }
  return true;
}

} // namespace uhi
