#include "uhi/GeoJsonExport.hpp"

#include "uhi/Json.hpp"
#include "uhi/RegionResolver.hpp"

#include <fstream>

namespace uhi {

void WriteGeoJsonRing(JsonWriter& w, const GeoRing& ring)
{
  w.beginArray();
  for (const GeoPoint& p : ring) {
    w.beginArray();
    w.numberValue(p.lon);
    w.numberValue(p.lat);
    w.endArray();
  }
  w.endArray();
}

void WriteGeoJsonPolygonCoords(JsonWriter& w, const GeoPolygon& poly)
{
  w.beginArray();
  WriteGeoJsonRing(w, poly.outer);
  for (const GeoRing& h : poly.holes) WriteGeoJsonRing(w, h);
  w.endArray();
}

void WriteGeoJsonGeometry(JsonWriter& w, const GeoMultiPolygon& mp)
{
  w.beginObject();
  if (mp.polygons.empty()) {
    w.key("type");
    w.stringValue("GeometryCollection");
    w.key("geometries");
    w.beginArray();
    w.endArray();
  } else if (mp.polygons.size() == 1) {
    w.key("type");
    w.stringValue("Polygon");
    w.key("coordinates");
    WriteGeoJsonPolygonCoords(w, mp.polygons.front());
  } else {
    w.key("type");
    w.stringValue("MultiPolygon");
    w.key("coordinates");
    w.beginArray();
    for (const GeoPolygon& p : mp.polygons) WriteGeoJsonPolygonCoords(w, p);
    w.endArray();
  }
  w.endObject();
}

bool WriteRegionGeoJsonFile(const std::string& path, const ResolvedRegion& region, std::string& outError)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path + " for writing";
    return false;
  }

  JsonWriter w(f, JsonWriteOptions{true, 2});
  w.beginObject();
  w.key("type");
  w.stringValue("FeatureCollection");
  w.key("features");
  w.beginArray();
  for (std::size_t i = 0; i < region.features.size(); ++i) {
    const BoundaryFeature& feat = region.features[i];
    w.beginObject();
    w.key("type");
    w.stringValue("Feature");
    w.key("properties");
    w.beginObject();
    for (const auto& kv : feat.properties) {
      w.key(kv.first);
      w.stringValue(kv.second);
    }
    w.key("feature_index");
    w.intValue(i < region.featureIndices.size() ? static_cast<std::int64_t>(region.featureIndices[i]) : -1);
    w.endObject();
    w.key("geometry");
    WriteGeoJsonGeometry(w, feat.geometry);
    w.endObject();
  }
  w.endArray();
  w.endObject();
  f << '\n';

  if (!w.ok()) {
    outError = w.error();
    return false;
  }
  if (!f) {
    outError = "failed to write " + path;
    return false;
  }
  return true;
}

} // namespace uhi
