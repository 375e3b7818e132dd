#include "uhi/ConfigIO.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace uhi {

namespace {

bool Section(const JsonValue& root, const char* key, const JsonValue** out, std::string& err)
{
  *out = FindJsonMember(root, key);
  if (!*out) return true;
  if (!(*out)->isObject()) {
    err = std::string("expected object for key '") + key + "'";
    return false;
  }
  return true;
}

bool ApplyF64(const JsonValue& obj, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!std::isfinite(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

bool ApplyI32(const JsonValue& obj, const char* key, int& io, std::string& err)
{
  double d = static_cast<double>(io);
  if (!ApplyF64(obj, key, d, err)) return false;
  if (d != std::floor(d) || d < -2147483648.0 || d > 2147483647.0) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(d);
  return true;
}

bool ApplyString(const JsonValue& obj, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool ApplyDate(const JsonValue& obj, const char* key, CivilDate& io, std::string& err)
{
  std::string s;
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!ApplyString(obj, key, s, err)) return false;
  if (!ParseIsoDate(s, io)) {
    err = std::string("invalid date for key '") + key + "': " + s;
    return false;
  }
  return true;
}

bool ApplyRegion(const JsonValue& s, RegionConfig& r, std::string& err)
{
  if (const JsonValue* c = FindJsonMember(s, "center")) {
    if (!c->isArray() || c->arrayValue.size() != 2 || !c->arrayValue[0].isNumber() || !c->arrayValue[1].isNumber()) {
      err = "expected [lon, lat] for key 'center'";
      return false;
    }
    r.center = GeoPoint{c->arrayValue[0].numberValue, c->arrayValue[1].numberValue};
  }
  return ApplyF64(s, "simplify_tolerance_m", r.simplifyToleranceMeters, err);
}

bool ApplyWindow(const JsonValue& s, WindowConfig& w, std::string& err)
{
  return ApplyDate(s, "start", w.dates.start, err) && ApplyDate(s, "end", w.dates.end, err) &&
         ApplyI32(s, "month_start", w.months.startMonth, err) && ApplyI32(s, "month_end", w.months.endMonth, err);
}

bool ApplyThermal(const JsonValue& s, ThermalConfig& t, std::string& err)
{
  if (!ApplyString(s, "collection", t.collection, err) || !ApplyString(s, "band", t.band, err) ||
      !ApplyString(s, "cloud_property", t.cloudProperty, err) || !ApplyF64(s, "max_cloud_cover", t.maxCloudCover, err) ||
      !ApplyString(s, "scale_property", t.scaleProperty, err) ||
      !ApplyString(s, "offset_property", t.offsetProperty, err)) {
    return false;
  }

  std::string policy = MissingCalibrationPolicyName(t.missingCalibration);
  if (!ApplyString(s, "missing_calibration", policy, err)) return false;
  if (!ParseMissingCalibrationPolicy(policy, t.missingCalibration)) {
    err = "missing_calibration must be 'fail' or 'drop'";
    return false;
  }

  std::string tie = MedianTiePolicyName(t.medianTie);
  if (!ApplyString(s, "median_tie", tie, err)) return false;
  if (!ParseMedianTiePolicy(tie, t.medianTie)) {
    err = "median_tie must be 'mean_of_middle' or 'lower_middle'";
    return false;
  }
  return true;
}

bool ApplyClassify(const JsonValue& s, ClassifyConfig& c, std::string& err)
{
  const JsonValue* cuts = FindJsonMember(s, "cut_points");
  if (!cuts) return true;
  if (!cuts->isArray() || cuts->arrayValue.size() != c.cutPoints.size()) {
    err = "cut_points must be an array of 5 numbers";
    return false;
  }
  for (std::size_t i = 0; i < c.cutPoints.size(); ++i) {
    const JsonValue& v = cuts->arrayValue[i];
    if (!v.isNumber() || !std::isfinite(v.numberValue)) {
      err = "cut_points must be finite numbers";
      return false;
    }
    c.cutPoints[i] = v.numberValue;
  }
  return true;
}

} // namespace

bool ApplyPipelineConfigJson(const JsonValue& root, PipelineConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "config root must be an object";
    return false;
  }

  // Work on a copy so a failed load leaves the caller's config untouched.
  PipelineConfig cfg = ioCfg;
  const JsonValue* s = nullptr;
  std::string err;

  if (!Section(root, "region", &s, err) || (s && !ApplyRegion(*s, cfg.region, err))) {
    outError = "region: " + err;
    return false;
  }
  if (!Section(root, "window", &s, err) || (s && !ApplyWindow(*s, cfg.window, err))) {
    outError = "window: " + err;
    return false;
  }
  if (!Section(root, "land_cover", &s, err) ||
      (s && !(ApplyString(*s, "collection", cfg.landCover.collection, err) &&
              ApplyString(*s, "band", cfg.landCover.band, err) &&
              ApplyI32(*s, "urban_class", cfg.landCover.urbanClass, err)))) {
    outError = "land_cover: " + err;
    return false;
  }
  if (!Section(root, "thermal", &s, err) || (s && !ApplyThermal(*s, cfg.thermal, err))) {
    outError = "thermal: " + err;
    return false;
  }
  if (!Section(root, "statistic", &s, err) ||
      (s && !(ApplyF64(*s, "scale_m", cfg.statistic.scaleMeters, err) &&
              ApplyF64(*s, "max_pixels", cfg.statistic.maxPixels, err)))) {
    outError = "statistic: " + err;
    return false;
  }
  if (!Section(root, "classify", &s, err) || (s && !ApplyClassify(*s, cfg.classify, err))) {
    outError = "classify: " + err;
    return false;
  }
  if (!Section(root, "export", &s, err) ||
      (s && !(ApplyF64(*s, "scale_m", cfg.exportCfg.scaleMeters, err) &&
              ApplyString(*s, "crs", cfg.exportCfg.crs, err) &&
              ApplyF64(*s, "max_pixels", cfg.exportCfg.maxPixels, err) &&
              ApplyString(*s, "description", cfg.exportCfg.description, err) &&
              ApplyString(*s, "folder", cfg.exportCfg.folder, err)))) {
    outError = "export: " + err;
    return false;
  }

  ioCfg = cfg;
  outError.clear();
  return true;
}

void WritePipelineConfig(JsonWriter& w, const PipelineConfig& cfg)
{
  w.beginObject();

  w.key("region");
  w.beginObject();
  w.key("center");
  w.beginArray();
  w.numberValue(cfg.region.center.lon);
  w.numberValue(cfg.region.center.lat);
  w.endArray();
  w.key("simplify_tolerance_m");
  w.numberValue(cfg.region.simplifyToleranceMeters);
  w.endObject();

  w.key("window");
  w.beginObject();
  w.key("start");
  w.stringValue(FormatIsoDate(cfg.window.dates.start));
  w.key("end");
  w.stringValue(FormatIsoDate(cfg.window.dates.end));
  w.key("month_start");
  w.intValue(cfg.window.months.startMonth);
  w.key("month_end");
  w.intValue(cfg.window.months.endMonth);
  w.endObject();

  w.key("land_cover");
  w.beginObject();
  w.key("collection");
  w.stringValue(cfg.landCover.collection);
  w.key("band");
  w.stringValue(cfg.landCover.band);
  w.key("urban_class");
  w.intValue(cfg.landCover.urbanClass);
  w.endObject();

  const ThermalConfig& t = cfg.thermal;
  w.key("thermal");
  w.beginObject();
  w.key("collection");
  w.stringValue(t.collection);
  w.key("band");
  w.stringValue(t.band);
  w.key("cloud_property");
  w.stringValue(t.cloudProperty);
  w.key("max_cloud_cover");
  w.numberValue(t.maxCloudCover);
  w.key("scale_property");
  w.stringValue(t.scaleProperty);
  w.key("offset_property");
  w.stringValue(t.offsetProperty);
  w.key("missing_calibration");
  w.stringValue(MissingCalibrationPolicyName(t.missingCalibration));
  w.key("median_tie");
  w.stringValue(MedianTiePolicyName(t.medianTie));
  w.endObject();

  w.key("statistic");
  w.beginObject();
  w.key("scale_m");
  w.numberValue(cfg.statistic.scaleMeters);
  w.key("max_pixels");
  w.numberValue(cfg.statistic.maxPixels);
  w.endObject();

  w.key("classify");
  w.beginObject();
  w.key("cut_points");
  w.beginArray();
  for (double c : cfg.classify.cutPoints) w.numberValue(c);
  w.endArray();
  w.endObject();

  const ExportConfig& e = cfg.exportCfg;
  w.key("export");
  w.beginObject();
  w.key("scale_m");
  w.numberValue(e.scaleMeters);
  w.key("crs");
  w.stringValue(e.crs);
  w.key("max_pixels");
  w.numberValue(e.maxPixels);
  w.key("description");
  w.stringValue(e.description);
  w.key("folder");
  w.stringValue(e.folder);
  w.endObject();

  w.endObject();
}

bool WritePipelineConfigJson(std::ostream& os, const PipelineConfig& cfg, std::string& outError)
{
  JsonWriter w(os);
  WritePipelineConfig(w, cfg);
  if (!w.ok()) {
    outError = w.error();
    return false;
  }
  return true;
}

std::string PipelineConfigToJson(const PipelineConfig& cfg)
{
  std::ostringstream oss;
  std::string err;
  if (!WritePipelineConfigJson(oss, cfg, err)) return std::string();
  return oss.str();
}

bool LoadPipelineConfigJsonFile(const std::string& path, PipelineConfig& ioCfg, std::string& outError)
{
  JsonValue root;
  if (!ReadJsonFile(path, root, outError)) return false;
  if (!ApplyPipelineConfigJson(root, ioCfg, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool WritePipelineConfigJsonFile(const std::string& path, const PipelineConfig& cfg, std::string& outError)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path + " for writing";
    return false;
  }
  if (!WritePipelineConfigJson(f, cfg, outError)) return false;
  if (!f) {
    outError = "write failed: " + path;
    return false;
  }
  return true;
}

} // namespace uhi
