#include "uhi/ThermalComposite.hpp"

#include <algorithm>
#include <utility>

namespace uhi {

CollectionQuery MakeThermalQuery(const PipelineConfig& cfg, const GeoBounds& roiBounds)
{
  CollectionQuery q;
  q.collection = cfg.thermal.collection;
  q.band = cfg.thermal.band;
  q.dates = cfg.window.dates;
  q.bounds = roiBounds;
  q.below = PropertyLessThan{cfg.thermal.cloudProperty, cfg.thermal.maxCloudCover};
  return q;
}

bool CalibrateAcquisition(const Acquisition& a, const ThermalConfig& cfg, Raster& out, PipelineError& err)
{
  const Raster* band = a.band(cfg.band);
  if (!band) {
    err.set(PipelineErrorKind::InvalidInput, "thermal", "acquisition has no band '" + cfg.band + "'");
    err.with("acquisition", a.id);
    return false;
  }

  const std::optional<double> scale = a.property(cfg.scaleProperty);
  const std::optional<double> offset = a.property(cfg.offsetProperty);
  if (!scale || !offset) {
    err.set(PipelineErrorKind::MissingCalibrationCoefficient, "thermal", "calibration coefficient not found");
    err.with("acquisition", a.id).with("property", !scale ? cfg.scaleProperty : cfg.offsetProperty);
    return false;
  }

  out = *band;
  for (Cell& c : out.cells) {
    if (c) c = *c * *scale + *offset;
  }
  return true;
}

Cell MedianOfValues(std::vector<double>& values, MedianTiePolicy tie)
{
  if (values.empty()) return std::nullopt;
  std::sort(values.begin(), values.end());
  const std::size_t n = values.size();
  if (n % 2 == 1) return values[n / 2];
  if (tie == MedianTiePolicy::LowerMiddle) return values[n / 2 - 1];
  return 0.5 * (values[n / 2 - 1] + values[n / 2]);
}

Raster MedianComposite(const std::vector<Raster>& layers, const GridSpec& grid, MedianTiePolicy tie)
{
  Raster out = Raster::Invalid(grid);
  std::vector<double> samples;
  samples.reserve(layers.size());
  for (std::size_t i = 0; i < out.cells.size(); ++i) {
    samples.clear();
    for (const Raster& l : layers) {
      if (i < l.cells.size() && l.cells[i]) samples.push_back(*l.cells[i]);
    }
    out.cells[i] = MedianOfValues(samples, tie);
  }
  return out;
}

bool BuildThermalComposite(const RasterStack& thermal, const PipelineConfig& cfg, const ResolvedRegion& roi,
                           const GridSpec& grid, ThermalCompositeResult& out, PipelineError& err)
{
  if (grid.cellCount() == 0) {
    err.set(PipelineErrorKind::InvalidInput, "thermal", "empty working grid");
    return false;
  }

  const CollectionQuery q = MakeThermalQuery(cfg, roi.bounds);

  ThermalCompositeResult r;
  std::vector<Raster> aligned;
  for (const Acquisition& a : thermal.items) {
    if (!MatchesMetadata(q, a.date, a.properties)) continue;
    const Raster* band = a.band(q.band);
    if (band && !band->grid.bounds().intersects(roi.bounds)) continue;

    Raster calibrated;
    PipelineError calErr;
    if (!CalibrateAcquisition(a, cfg.thermal, calibrated, calErr)) {
      if (calErr.kind == PipelineErrorKind::MissingCalibrationCoefficient &&
          cfg.thermal.missingCalibration == MissingCalibrationPolicy::Drop) {
        r.droppedIds.push_back(a.id);
        r.warnings.push_back("dropped acquisition " + a.id + ": " + calErr.message);
        continue;
      }
      err = std::move(calErr);
      return false;
    }

    aligned.push_back(ResampleNearest(calibrated, grid));
    r.usedIds.push_back(a.id);
  }

  if (aligned.empty()) {
    r.warnings.push_back("NoValidDataInWindow: no thermal acquisition passed the filters");
  }

  r.lst = ClipToRegion(MedianComposite(aligned, grid, cfg.thermal.medianTie), roi.geometry);

  out = std::move(r);
  return true;
}

} // namespace uhi
