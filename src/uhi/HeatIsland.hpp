#pragma once

#include "uhi/Config.hpp"
#include "uhi/PipelineError.hpp"
#include "uhi/Raster.hpp"
#include "uhi/RegionResolver.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uhi {

// Heat island intensity classes. 0 is the valid background for negative indices.
enum class UhiClass : std::uint8_t {
  Unclassified = 0,
  Mild = 1,
  Moderate = 2,
  Strong = 3,
  VeryStrong = 4,
  Extreme = 5,
};

constexpr int kUhiClassCount = 6;

const char* UhiClassName(UhiClass c);

// Half-open brackets [cut[i], cut[i+1]); values on a cut point go to the higher class.
// Returns 0 for x < cut[0].
int ClassifyUhiIndex(double x, const std::array<double, 5>& cutPoints);

// Result of a region-wide reduction, with the parameters that produced it.
struct ScalarStatistic {
  std::optional<double> value;
  std::string reducer = "mean";
  double scaleMeters = 0.0;
  double maxPixels = 0.0;
  double estimatedPixels = 0.0;
  std::size_t sampledPixels = 0;
  GeoBounds bounds;
};

// Mean of the valid composite values under a lattice of points `scaleMeters` apart
// covering the region.
//
// The pixel estimate depends only on the region bounds and the scale and is checked
// against maxPixels before anything is sampled (PixelBudgetExceeded, stage "mean").
// No valid sample leaves value empty; that is not an error here.
bool ComputeRegionMean(const Raster& lst, const ResolvedRegion& roi, const StatisticConfig& cfg,
                       ScalarStatistic& out, PipelineError& err);

// (t - mean) / mean per valid cell. DivisionByZeroMean when the mean is empty,
// zero or non-finite.
bool ComputeUhiIndex(const Raster& lst, const ScalarStatistic& mean, Raster& out, PipelineError& err);

// Class per valid index cell; invalid cells stay invalid.
Raster ClassifyUhiRaster(const Raster& index, const ClassifyConfig& cfg);

struct HeatIndexResult {
  ScalarStatistic mean;

  Raster index;

  // Classes before the urban mask.
  Raster unmasked;

  // Final product: classes where the urban mask is 1, invalid elsewhere.
  Raster classified;

  std::array<std::size_t, kUhiClassCount> classCounts{};

  std::vector<std::string> warnings;
};

// Mean, index, classification and urban masking in one step.
//
// An all-invalid composite produces an all-invalid classification plus a warning.
// A composite with data but no usable mean is a DivisionByZeroMean error.
bool ClassifyHeatIsland(const Raster& lst, const Raster& urbanMask, const ResolvedRegion& roi,
                        const PipelineConfig& cfg, HeatIndexResult& out, PipelineError& err);

} // namespace uhi
