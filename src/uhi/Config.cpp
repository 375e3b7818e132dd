#include "uhi/Config.hpp"

#include <cmath>

namespace uhi {

const char* MissingCalibrationPolicyName(MissingCalibrationPolicy p)
{
  return p == MissingCalibrationPolicy::Drop ? "drop" : "fail";
}

bool ParseMissingCalibrationPolicy(const std::string& s, MissingCalibrationPolicy& out)
{
  if (s == "fail") {
    out = MissingCalibrationPolicy::Fail;
    return true;
  }
  if (s == "drop") {
    out = MissingCalibrationPolicy::Drop;
    return true;
  }
  return false;
}

const char* MedianTiePolicyName(MedianTiePolicy p)
{
  return p == MedianTiePolicy::LowerMiddle ? "lower_middle" : "mean_of_middle";
}

bool ParseMedianTiePolicy(const std::string& s, MedianTiePolicy& out)
{
  if (s == "mean_of_middle") {
    out = MedianTiePolicy::MeanOfMiddle;
    return true;
  }
  if (s == "lower_middle") {
    out = MedianTiePolicy::LowerMiddle;
    return true;
  }
  return false;
}

namespace {

bool Invalid(PipelineError& err, const std::string& key, const std::string& msg, double value)
{
  err.set(PipelineErrorKind::InvalidConfig, "config", msg);
  err.with(key, value);
  return false;
}

} // namespace

bool ValidatePipelineConfig(const PipelineConfig& cfg, PipelineError& err)
{
  const RegionConfig& r = cfg.region;
  if (!std::isfinite(r.center.lon) || r.center.lon < -180.0 || r.center.lon > 180.0)
    return Invalid(err, "region.center.lon", "longitude out of range", r.center.lon);
  if (!std::isfinite(r.center.lat) || r.center.lat < -90.0 || r.center.lat > 90.0)
    return Invalid(err, "region.center.lat", "latitude out of range", r.center.lat);
  if (!(r.simplifyToleranceMeters >= 0.0))
    return Invalid(err, "region.simplify_tolerance_m", "tolerance must be >= 0", r.simplifyToleranceMeters);

  if (!cfg.window.dates.valid()) {
    err.set(PipelineErrorKind::InvalidConfig, "config", "end date must be after start date");
    err.with("window.start", FormatIsoDate(cfg.window.dates.start)).with("window.end", FormatIsoDate(cfg.window.dates.end));
    return false;
  }
  if (!cfg.window.months.valid()) {
    err.set(PipelineErrorKind::InvalidConfig, "config", "month bounds must be within 1..12");
    err.with("window.month_start", cfg.window.months.startMonth).with("window.month_end", cfg.window.months.endMonth);
    return false;
  }

  if (!std::isfinite(cfg.thermal.maxCloudCover))
    return Invalid(err, "thermal.max_cloud_cover", "cloud threshold must be finite", cfg.thermal.maxCloudCover);

  if (!(cfg.statistic.scaleMeters > 0.0))
    return Invalid(err, "statistic.scale_m", "scale must be > 0", cfg.statistic.scaleMeters);
  if (!(cfg.statistic.maxPixels > 0.0))
    return Invalid(err, "statistic.max_pixels", "pixel ceiling must be > 0", cfg.statistic.maxPixels);

  const auto& cuts = cfg.classify.cutPoints;
  for (std::size_t i = 0; i < cuts.size(); ++i) {
    if (!std::isfinite(cuts[i])) return Invalid(err, "classify.cut_points", "cut points must be finite", cuts[i]);
    if (i > 0 && !(cuts[i] > cuts[i - 1]))
      return Invalid(err, "classify.cut_points", "cut points must be strictly increasing", cuts[i]);
  }

  if (!(cfg.exportCfg.scaleMeters > 0.0))
    return Invalid(err, "export.scale_m", "scale must be > 0", cfg.exportCfg.scaleMeters);
  if (!(cfg.exportCfg.maxPixels > 0.0))
    return Invalid(err, "export.max_pixels", "pixel ceiling must be > 0", cfg.exportCfg.maxPixels);
  if (cfg.exportCfg.crs != "EPSG:4326") {
    err.set(PipelineErrorKind::InvalidConfig, "config", "only EPSG:4326 exports are supported");
    err.with("export.crs", cfg.exportCfg.crs);
    return false;
  }
  if (cfg.exportCfg.description.empty()) {
    err.set(PipelineErrorKind::InvalidConfig, "config", "export description must not be empty");
    return false;
  }

  return true;
}

} // namespace uhi
