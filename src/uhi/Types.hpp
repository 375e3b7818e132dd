#pragma once

#include <optional>

namespace uhi {

// Geographic coordinate (degrees, lon/lat order as in GeoJSON).
struct GeoPoint {
  double lon = 0.0;
  double lat = 0.0;
};

// A single raster cell.
//
// "No data" is an empty optional, never a sentinel number, so a valid zero
// reading (or label 0) stays distinguishable from a masked pixel.
using Cell = std::optional<double>;

} // namespace uhi
