#pragma once

#include "uhi/Boundary.hpp"
#include "uhi/Catalog.hpp"
#include "uhi/Config.hpp"
#include "uhi/Deferred.hpp"
#include "uhi/Export.hpp"
#include "uhi/HeatIsland.hpp"
#include "uhi/RegionResolver.hpp"
#include "uhi/ThermalComposite.hpp"
#include "uhi/UrbanMask.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace uhi {

struct PipelineResult {
  PipelineConfig config;

  ResolvedRegion region;
  GridSpec grid;

  UrbanMaskResult urban;
  ThermalCompositeResult thermal;
  HeatIndexResult heat;

  ExportRequest exportRequest;

  // Non-fatal conditions from every stage, in stage order.
  std::vector<std::string> warnings;
};

// The analysis as a graph of deferred stages:
//
//   region -> grid -> { land cover -> urban mask, thermal -> composite } -> heat -> export
//
// Constructing a Pipeline only wires the stages; nothing is read or computed until a
// stage is evaluated (directly, through materialize() or through exportTo()). Each
// stage runs at most once per Pipeline.
//
// The boundary dataset and catalog are borrowed and must outlive the Pipeline.
class Pipeline {
public:
  Pipeline(PipelineConfig cfg, const BoundaryDataset& boundaries, const ImageCatalog& catalog,
           std::ostream* log = nullptr);

  const PipelineConfig& config() const { return m_cfg; }

  const Deferred<ResolvedRegion>& region() const { return m_region; }
  const Deferred<GridSpec>& grid() const { return m_grid; }
  const Deferred<RasterStack>& landCover() const { return m_landCover; }
  const Deferred<UrbanMaskResult>& urbanMask() const { return m_urban; }
  const Deferred<RasterStack>& thermal() const { return m_thermal; }
  const Deferred<ThermalCompositeResult>& composite() const { return m_composite; }
  const Deferred<HeatIndexResult>& heat() const { return m_heat; }
  const Deferred<ExportRequest>& exportRequest() const { return m_export; }

  // Force every stage and collect the intermediates.
  bool materialize(PipelineResult& out, PipelineError& err) const;

  // Force the export request and hand it to the sink.
  bool exportTo(ExportSink& sink, PipelineError& err) const;

private:
  PipelineConfig m_cfg;

  Deferred<ResolvedRegion> m_region;
  Deferred<GridSpec> m_grid;
  Deferred<RasterStack> m_landCover;
  Deferred<UrbanMaskResult> m_urban;
  Deferred<RasterStack> m_thermal;
  Deferred<ThermalCompositeResult> m_composite;
  Deferred<HeatIndexResult> m_heat;
  Deferred<ExportRequest> m_export;
};

} // namespace uhi
