#pragma once

#include "uhi/Catalog.hpp"
#include "uhi/Config.hpp"
#include "uhi/Raster.hpp"
#include "uhi/RegionResolver.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace uhi {

struct UrbanMaskResult {
  // 1 = modal label is the urban class, 0 = some other class, invalid = no
  // observation in the window (or outside the region).
  Raster mask;

  std::vector<std::string> acquisitionIds;

  std::size_t urbanPixels = 0;
  std::size_t otherPixels = 0;
  std::size_t noDataPixels = 0; // inside the region

  std::vector<std::string> warnings;
};

// Land-cover query for the configured window, summer months and region bounds.
CollectionQuery MakeLandCoverQuery(const PipelineConfig& cfg, const GeoBounds& roiBounds);

// Most frequent value; ties go to the smallest label. Sorts `labels` in place.
std::optional<double> LabelMode(std::vector<double>& labels);

// Per-pixel temporal mode of the land-cover labels, compared against the urban class.
//
// The stack is filtered again with MakeLandCoverQuery (so unfiltered stacks are
// fine), each element is sampled onto `grid` and only cells inside the region are
// considered. An empty window yields an all-invalid mask, not an error.
bool BuildUrbanMask(const RasterStack& labels, const PipelineConfig& cfg, const ResolvedRegion& roi,
                    const GridSpec& grid, UrbanMaskResult& out, PipelineError& err);

} // namespace uhi
