#include "uhi/UrbanMask.hpp"

#include <algorithm>
#include <utility>

namespace uhi {

CollectionQuery MakeLandCoverQuery(const PipelineConfig& cfg, const GeoBounds& roiBounds)
{
  CollectionQuery q;
  q.collection = cfg.landCover.collection;
  q.band = cfg.landCover.band;
  q.dates = cfg.window.dates;
  q.months = cfg.window.months;
  q.bounds = roiBounds;
  return q;
}

std::optional<double> LabelMode(std::vector<double>& labels)
{
  if (labels.empty()) return std::nullopt;
  std::sort(labels.begin(), labels.end());

  double best = labels[0];
  std::size_t bestRun = 0;
  std::size_t i = 0;
  while (i < labels.size()) {
    std::size_t j = i + 1;
    while (j < labels.size() && labels[j] == labels[i]) ++j;
    // Strictly greater keeps the smallest label on ties.
    if (j - i > bestRun) {
      bestRun = j - i;
      best = labels[i];
    }
    i = j;
  }
  return best;
}

bool BuildUrbanMask(const RasterStack& labels, const PipelineConfig& cfg, const ResolvedRegion& roi,
                    const GridSpec& grid, UrbanMaskResult& out, PipelineError& err)
{
  if (grid.cellCount() == 0) {
    err.set(PipelineErrorKind::InvalidInput, "urban_mask", "empty working grid");
    return false;
  }

  const CollectionQuery q = MakeLandCoverQuery(cfg, roi.bounds);

  UrbanMaskResult r;
  std::vector<Raster> aligned;
  for (const Acquisition& a : labels.items) {
    if (!MatchesMetadata(q, a.date, a.properties)) continue;
    const Raster* band = a.band(q.band);
    if (!band) {
      err.set(PipelineErrorKind::InvalidInput, "urban_mask", "acquisition has no band '" + q.band + "'");
      err.with("acquisition", a.id);
      return false;
    }
    if (!band->grid.bounds().intersects(roi.bounds)) continue;
    aligned.push_back(ResampleNearest(*band, grid));
    r.acquisitionIds.push_back(a.id);
  }

  if (aligned.empty()) {
    r.warnings.push_back("NoValidDataInWindow: no land-cover acquisition passed the filters");
  }

  const std::vector<std::uint8_t> inside = RegionCoverage(grid, roi.geometry);
  const double urban = static_cast<double>(cfg.landCover.urbanClass);

  r.mask = Raster::Invalid(grid);
  std::vector<double> samples;
  samples.reserve(aligned.size());
  for (std::size_t i = 0; i < grid.cellCount(); ++i) {
    if (!inside[i]) continue;
    samples.clear();
    for (const Raster& a : aligned) {
      if (a.cells[i]) samples.push_back(*a.cells[i]);
    }
    const std::optional<double> mode = LabelMode(samples);
    if (!mode) {
      ++r.noDataPixels;
      continue;
    }
    if (*mode == urban) {
      r.mask.cells[i] = 1.0;
      ++r.urbanPixels;
    } else {
      r.mask.cells[i] = 0.0;
      ++r.otherPixels;
    }
  }

  out = std::move(r);
  return true;
}

} // namespace uhi
