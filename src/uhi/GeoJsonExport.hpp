#pragma once

#include "uhi/Geometry.hpp"

#include <map>
#include <string>
#include <vector>

namespace uhi {

class JsonWriter;
struct ResolvedRegion;

// GeoJSON writers for lon/lat geometry. Rings are written as stored (closed).
//
// An empty multipolygon is written as {"type":"GeometryCollection","geometries":[]}.
// A single polygon is written as "Polygon", anything else as "MultiPolygon".
void WriteGeoJsonRing(JsonWriter& w, const GeoRing& ring);
void WriteGeoJsonPolygonCoords(JsonWriter& w, const GeoPolygon& poly);
void WriteGeoJsonGeometry(JsonWriter& w, const GeoMultiPolygon& mp);

// FeatureCollection with one feature per matched boundary (simplified geometry,
// original properties plus "feature_index").
bool WriteRegionGeoJsonFile(const std::string& path, const ResolvedRegion& region, std::string& outError);

} // namespace uhi
