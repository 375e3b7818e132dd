#include "uhi/Pipeline.hpp"

#include "uhi/Date.hpp"

#include <ostream>
#include <sstream>
#include <utility>

namespace uhi {

namespace {

void Log(std::ostream* os, const std::string& line)
{
  if (os) *os << line << '\n';
}

} // namespace

Pipeline::Pipeline(PipelineConfig cfg, const BoundaryDataset& boundaries, const ImageCatalog& catalog,
                   std::ostream* log)
    : m_cfg(std::move(cfg))
{
  const PipelineConfig c = m_cfg;
  const BoundaryDataset* bds = &boundaries;
  const ImageCatalog* cat = &catalog;

  m_region = Deferred<ResolvedRegion>([c, bds, log](ResolvedRegion& out, PipelineError& err) {
    if (!ValidatePipelineConfig(c, err)) return false;
    if (!ResolveRegion(*bds, c.region.center, c.region.simplifyToleranceMeters, out, err)) return false;
    std::ostringstream oss;
    oss << "[region] point=" << c.region.center.lon << "," << c.region.center.lat
        << " tolerance_m=" << c.region.simplifyToleranceMeters << " features=" << out.features.size()
        << " polygons=" << out.geometry.polygons.size();
    Log(log, oss.str());
    return true;
  });

  const Deferred<ResolvedRegion> region = m_region;

  // The working grid is sized by the mean-reduction scale, so its budget check
  // happens here, before any catalog access.
  m_grid = Deferred<GridSpec>([c, region, log](GridSpec& out, PipelineError& err) {
    if (!region.evaluate(err)) return false;
    const GeoBounds& b = region.value().bounds;
    const double est = EstimatePixelCount(b, c.statistic.scaleMeters);
    if (!(est <= c.statistic.maxPixels)) {
      err.set(PipelineErrorKind::PixelBudgetExceeded, "mean", "region mean would touch too many pixels");
      err.with("estimated_pixels", est).with("max_pixels", c.statistic.maxPixels).with("scale_m", c.statistic.scaleMeters);
      return false;
    }
    out = MakeGridForBounds(b, c.statistic.scaleMeters);
    if (static_cast<double>(out.cellCount()) > kMaxGridCells) {
      err.set(PipelineErrorKind::InvalidConfig, "grid", "working grid too large to hold in memory");
      err.with("cells", static_cast<double>(out.cellCount())).with("scale_m", c.statistic.scaleMeters);
      return false;
    }
    std::ostringstream oss;
    oss << "[grid] " << out.width << "x" << out.height << " scale_m=" << c.statistic.scaleMeters
        << " estimated_pixels=" << est;
    Log(log, oss.str());
    return true;
  });

  const Deferred<GridSpec> grid = m_grid;

  m_landCover = Deferred<RasterStack>([c, cat, grid, region, log](RasterStack& out, PipelineError& err) {
    if (!grid.evaluate(err)) return false;
    const CollectionQuery q = MakeLandCoverQuery(c, region.value().bounds);
    if (!cat->query(q, out, err)) return false;
    Log(log, "[land_cover] collection=" + q.collection + " window=" + FormatIsoDate(q.dates->start) + ".." +
                 FormatIsoDate(q.dates->end) + " months=" + std::to_string(q.months->startMonth) + "-" +
                 std::to_string(q.months->endMonth) + " retained=" + std::to_string(out.items.size()));
    return true;
  });

  const Deferred<RasterStack> landCover = m_landCover;

  m_urban = Deferred<UrbanMaskResult>([c, region, grid, landCover, log](UrbanMaskResult& out, PipelineError& err) {
    if (!landCover.evaluate(err)) return false;
    if (!BuildUrbanMask(landCover.value(), c, region.value(), grid.value(), out, err)) return false;
    std::ostringstream oss;
    oss << "[urban_mask] urban_class=" << c.landCover.urbanClass << " urban=" << out.urbanPixels
        << " other=" << out.otherPixels << " no_data=" << out.noDataPixels;
    Log(log, oss.str());
    return true;
  });

  m_thermal = Deferred<RasterStack>([c, cat, grid, region, log](RasterStack& out, PipelineError& err) {
    if (!grid.evaluate(err)) return false;
    const CollectionQuery q = MakeThermalQuery(c, region.value().bounds);
    if (!cat->query(q, out, err)) return false;
    std::ostringstream oss;
    oss << "[thermal] collection=" << q.collection << " " << q.below->name << "<" << q.below->threshold
        << " retained=" << out.items.size();
    Log(log, oss.str());
    return true;
  });

  const Deferred<RasterStack> thermal = m_thermal;

  m_composite = Deferred<ThermalCompositeResult>(
      [c, region, grid, thermal, log](ThermalCompositeResult& out, PipelineError& err) {
        if (!thermal.evaluate(err)) return false;
        if (!BuildThermalComposite(thermal.value(), c, region.value(), grid.value(), out, err)) return false;
        std::ostringstream oss;
        oss << "[composite] used=" << out.usedIds.size() << " dropped=" << out.droppedIds.size()
            << " valid_pixels=" << out.lst.validCount()
            << " tie=" << MedianTiePolicyName(c.thermal.medianTie);
        Log(log, oss.str());
        return true;
      });

  const Deferred<UrbanMaskResult> urban = m_urban;
  const Deferred<ThermalCompositeResult> composite = m_composite;

  m_heat = Deferred<HeatIndexResult>([c, region, urban, composite, log](HeatIndexResult& out, PipelineError& err) {
    if (!composite.evaluate(err)) return false;
    if (!urban.evaluate(err)) return false;
    if (!ClassifyHeatIsland(composite.value().lst, urban.value().mask, region.value(), c, out, err)) return false;
    std::ostringstream oss;
    oss << "[classify] mean=";
    if (out.mean.value) {
      oss << *out.mean.value;
    } else {
      oss << "invalid";
    }
    oss << " sampled=" << out.mean.sampledPixels << " classes=";
    for (int k = 0; k < kUhiClassCount; ++k) oss << (k ? "/" : "") << out.classCounts[static_cast<std::size_t>(k)];
    Log(log, oss.str());
    return true;
  });

  const Deferred<HeatIndexResult> heat = m_heat;

  m_export = Deferred<ExportRequest>([c, region, heat](ExportRequest& out, PipelineError& err) {
    if (!heat.evaluate(err)) return false;
    out = MakeExportRequest(heat.value().classified, region.value(), c.exportCfg);
    return true;
  });
}

bool Pipeline::materialize(PipelineResult& out, PipelineError& err) const
{
  if (!m_export.evaluate(err)) return false;

  PipelineResult r;
  r.config = m_cfg;
  r.region = m_region.value();
  r.grid = m_grid.value();
  r.urban = m_urban.value();
  r.thermal = m_composite.value();
  r.heat = m_heat.value();
  r.exportRequest = m_export.value();

  for (const auto* w : {&r.urban.warnings, &r.thermal.warnings, &r.heat.warnings}) {
    r.warnings.insert(r.warnings.end(), w->begin(), w->end());
  }

  out = std::move(r);
  return true;
}

bool Pipeline::exportTo(ExportSink& sink, PipelineError& err) const
{
  if (!m_export.evaluate(err)) return false;
  return sink.submit(m_export.value(), err);
}

} // namespace uhi
