#pragma once

#include "uhi/Catalog.hpp"
#include "uhi/Config.hpp"
#include "uhi/Raster.hpp"
#include "uhi/RegionResolver.hpp"

#include <string>
#include <vector>

namespace uhi {

struct ThermalCompositeResult {
  // Per-pixel median land surface temperature in Kelvin, clipped to the region.
  // Invalid where no retained acquisition observed the pixel.
  Raster lst;

  // Acquisitions that passed the filters and were calibrated, in stack order.
  std::vector<std::string> usedIds;

  // Acquisitions dropped for a missing coefficient (policy Drop only).
  std::vector<std::string> droppedIds;

  std::vector<std::string> warnings;
};

// Thermal query: date window, cloud cover < max and region bounds. No month filter.
CollectionQuery MakeThermalQuery(const PipelineConfig& cfg, const GeoBounds& roiBounds);

// value * scale + offset for every valid cell, with both coefficients read from the
// acquisition's own metadata. Invalid cells stay invalid.
//
// MissingCalibrationCoefficient when either property is absent.
bool CalibrateAcquisition(const Acquisition& a, const ThermalConfig& cfg, Raster& out, PipelineError& err);

// Median of the valid samples. Sorts `values` in place; empty -> invalid.
Cell MedianOfValues(std::vector<double>& values, MedianTiePolicy tie);

// Pixelwise median over rasters that share one grid.
Raster MedianComposite(const std::vector<Raster>& layers, const GridSpec& grid, MedianTiePolicy tie);

// Filter, calibrate, align to `grid` and reduce to the pixelwise median.
//
// An empty window is not an error: the composite is all-invalid and a warning
// is recorded.
bool BuildThermalComposite(const RasterStack& thermal, const PipelineConfig& cfg, const ResolvedRegion& roi,
                           const GridSpec& grid, ThermalCompositeResult& out, PipelineError& err);

} // namespace uhi
