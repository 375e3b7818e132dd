#include "uhi/HeatIsland.hpp"

#include <cmath>
#include <utility>

namespace uhi {

const char* UhiClassName(UhiClass c)
{
  switch (c) {
  case UhiClass::Unclassified: return "Unclassified";
  case UhiClass::Mild: return "Mild";
  case UhiClass::Moderate: return "Moderate";
  case UhiClass::Strong: return "Strong";
  case UhiClass::VeryStrong: return "Very Strong";
  case UhiClass::Extreme: return "Extreme";
  }
  return "Unknown";
}

int ClassifyUhiIndex(double x, const std::array<double, 5>& cutPoints)
{
  int cls = 0;
  for (std::size_t i = 0; i < cutPoints.size(); ++i) {
    if (x >= cutPoints[i]) cls = static_cast<int>(i) + 1;
  }
  return cls;
}

bool ComputeRegionMean(const Raster& lst, const ResolvedRegion& roi, const StatisticConfig& cfg,
                       ScalarStatistic& out, PipelineError& err)
{
  ScalarStatistic s;
  s.scaleMeters = cfg.scaleMeters;
  s.maxPixels = cfg.maxPixels;
  s.bounds = roi.bounds;
  s.estimatedPixels = EstimatePixelCount(roi.bounds, cfg.scaleMeters);

  if (!(s.estimatedPixels <= cfg.maxPixels)) {
    err.set(PipelineErrorKind::PixelBudgetExceeded, "mean", "region mean would touch too many pixels");
    err.with("estimated_pixels", s.estimatedPixels).with("max_pixels", cfg.maxPixels).with("scale_m", cfg.scaleMeters);
    return false;
  }

  const GridSpec lattice = MakeGridForBounds(roi.bounds, cfg.scaleMeters, lst.grid.crs);
  double sum = 0.0;
  std::size_t n = 0;
  for (int y = 0; y < lattice.height; ++y) {
    for (int x = 0; x < lattice.width; ++x) {
      const GeoPoint p = lattice.cellCenter(x, y);
      if (!PointInMultiPolygon(roi.geometry, p)) continue;
      int sx = 0;
      int sy = 0;
      if (!lst.grid.locate(p, sx, sy)) continue;
      const Cell& c = lst.at(sx, sy);
      if (!c) continue;
      sum += *c;
      ++n;
    }
  }

  s.sampledPixels = n;
  if (n > 0) s.value = sum / static_cast<double>(n);
  out = std::move(s);
  return true;
}

bool ComputeUhiIndex(const Raster& lst, const ScalarStatistic& mean, Raster& out, PipelineError& err)
{
  if (!mean.value || !std::isfinite(*mean.value) || *mean.value == 0.0) {
    err.set(PipelineErrorKind::DivisionByZeroMean, "classify", "region mean is zero or invalid");
    err.with("mean", mean.value ? std::to_string(*mean.value) : std::string("invalid"));
    err.with("sampled_pixels", static_cast<double>(mean.sampledPixels));
    return false;
  }

  const double m = *mean.value;
  out = Raster::Invalid(lst.grid);
  for (std::size_t i = 0; i < lst.cells.size(); ++i) {
    if (lst.cells[i]) out.cells[i] = (*lst.cells[i] - m) / m;
  }
  return true;
}

Raster ClassifyUhiRaster(const Raster& index, const ClassifyConfig& cfg)
{
  Raster out = Raster::Invalid(index.grid);
  for (std::size_t i = 0; i < index.cells.size(); ++i) {
    if (index.cells[i]) out.cells[i] = static_cast<double>(ClassifyUhiIndex(*index.cells[i], cfg.cutPoints));
  }
  return out;
}

bool ClassifyHeatIsland(const Raster& lst, const Raster& urbanMask, const ResolvedRegion& roi,
                        const PipelineConfig& cfg, HeatIndexResult& out, PipelineError& err)
{
  HeatIndexResult r;
  if (!ComputeRegionMean(lst, roi, cfg.statistic, r.mean, err)) return false;

  if (lst.validCount() == 0) {
    r.warnings.push_back("NoValidDataInWindow: temperature composite has no valid pixel; classification is empty");
    r.index = Raster::Invalid(lst.grid);
    r.unmasked = Raster::Invalid(lst.grid);
    r.classified = Raster::Invalid(lst.grid);
    out = std::move(r);
    return true;
  }

  if (!ComputeUhiIndex(lst, r.mean, r.index, err)) return false;

  r.unmasked = ClassifyUhiRaster(r.index, cfg.classify);
  r.classified = ApplyMask(r.unmasked, urbanMask);

  for (const Cell& c : r.classified.cells) {
    if (!c) continue;
    const int k = static_cast<int>(*c);
    if (k >= 0 && k < kUhiClassCount) ++r.classCounts[static_cast<std::size_t>(k)];
  }

  out = std::move(r);
  return true;
}

} // namespace uhi
