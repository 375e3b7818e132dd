#pragma once

#include "uhi/Geometry.hpp"
#include "uhi/Json.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace uhi {

// An administrative boundary record (e.g. a level-1 admin unit).
struct BoundaryFeature {
  // Feature properties rendered as strings (numbers use the shortest round-trip form).
  std::map<std::string, std::string> properties;

  GeoMultiPolygon geometry;
  GeoBounds bounds;
};

// Read-only collection of boundary features.
struct BoundaryDataset {
  std::vector<BoundaryFeature> features;

  // Indices of features whose extent and polygon contain p (edges count as inside).
  std::vector<std::size_t> queryPoint(const GeoPoint& p) const;
};

// Parse a GeoJSON FeatureCollection of Polygon / MultiPolygon features in lon/lat.
// Features with null geometry are skipped; other geometry types are an error.
bool BoundaryDatasetFromGeoJson(const JsonValue& root, BoundaryDataset& out, std::string& outError);
bool LoadBoundaryGeoJsonFile(const std::string& path, BoundaryDataset& out, std::string& outError);

} // namespace uhi
