#pragma once

#include "uhi/Boundary.hpp"
#include "uhi/Geometry.hpp"
#include "uhi/PipelineError.hpp"

#include <cstddef>
#include <vector>

namespace uhi {

// Analysis region derived from a point and a boundary dataset.
struct ResolvedRegion {
  GeoPoint point;
  double toleranceMeters = 0.0;

  // Indices into the dataset of every feature containing the point, ascending.
  std::vector<std::size_t> featureIndices;

  // The matching features with simplified geometry (same order as featureIndices).
  std::vector<BoundaryFeature> features;

  // All simplified polygons of the matching features.
  GeoMultiPolygon geometry;
  GeoBounds bounds;

  bool empty() const { return geometry.empty(); }
};

// Select the boundary features that contain `point` and simplify each with
// `toleranceMeters`.
//
// Errors:
//  - InvalidConfig: tolerance < 0 (or NaN)
//  - InvalidInput: non-finite point
//  - RegionNotFound: no feature contains the point (wherever it lies)
bool ResolveRegion(const BoundaryDataset& boundaries, const GeoPoint& point, double toleranceMeters,
                   ResolvedRegion& out, PipelineError& err);

} // namespace uhi
