#include "uhi/Boundary.hpp"

#include <cmath>
#include <sstream>

namespace uhi {

namespace {

bool ParsePosition(const JsonValue& v, GeoPoint& out)
{
  if (!v.isArray() || v.arrayValue.size() < 2) return false;
  const JsonValue& x = v.arrayValue[0];
  const JsonValue& y = v.arrayValue[1];
  if (!x.isNumber() || !y.isNumber()) return false;
  if (!std::isfinite(x.numberValue) || !std::isfinite(y.numberValue)) return false;
  out = GeoPoint{x.numberValue, y.numberValue};
  return true;
}

bool ParseRing(const JsonValue& v, GeoRing& out, std::string& err)
{
  if (!v.isArray()) {
    err = "ring must be an array of positions";
    return false;
  }
  out.clear();
  out.reserve(v.arrayValue.size() + 1);
  for (const JsonValue& pos : v.arrayValue) {
    GeoPoint p;
    if (!ParsePosition(pos, p)) {
      err = "invalid position in ring";
      return false;
    }
    out.push_back(p);
  }
  CloseRing(out);
  if (out.size() < 4) {
    err = "ring needs at least three distinct positions";
    return false;
  }
  return true;
}

bool ParsePolygonCoords(const JsonValue& v, GeoPolygon& out, std::string& err)
{
  if (!v.isArray() || v.arrayValue.empty()) {
    err = "polygon coordinates must be a non-empty array of rings";
    return false;
  }
  out = GeoPolygon{};
  if (!ParseRing(v.arrayValue[0], out.outer, err)) return false;
  for (std::size_t i = 1; i < v.arrayValue.size(); ++i) {
    GeoRing hole;
    if (!ParseRing(v.arrayValue[i], hole, err)) return false;
    out.holes.push_back(std::move(hole));
  }
  return true;
}

bool ParseGeometry(const JsonValue& g, GeoMultiPolygon& out, std::string& err)
{
  const JsonValue* type = FindJsonMember(g, "type");
  const JsonValue* coords = FindJsonMember(g, "coordinates");
  if (!type || !type->isString()) {
    err = "geometry without 'type'";
    return false;
  }
  if (!coords) {
    err = "geometry without 'coordinates'";
    return false;
  }

  out = GeoMultiPolygon{};
  if (type->stringValue == "Polygon") {
    GeoPolygon p;
    if (!ParsePolygonCoords(*coords, p, err)) return false;
    out.polygons.push_back(std::move(p));
    return true;
  }
  if (type->stringValue == "MultiPolygon") {
    if (!coords->isArray()) {
      err = "MultiPolygon coordinates must be an array";
      return false;
    }
    for (const JsonValue& pc : coords->arrayValue) {
      GeoPolygon p;
      if (!ParsePolygonCoords(pc, p, err)) return false;
      out.polygons.push_back(std::move(p));
    }
    return true;
  }

  err = "unsupported geometry type '" + type->stringValue + "'";
  return false;
}

std::string PropertyString(const JsonValue& v)
{
  switch (v.type) {
  case JsonValue::Type::String: return v.stringValue;
  case JsonValue::Type::Bool: return v.boolValue ? "true" : "false";
  case JsonValue::Type::Number: {
    std::ostringstream oss;
    oss.precision(15);
    oss << v.numberValue;
    return oss.str();
  }
  case JsonValue::Type::Null: return "";
  default: break;
  }
  return "<composite>";
}

} // namespace

std::vector<std::size_t> BoundaryDataset::queryPoint(const GeoPoint& p) const
{
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < features.size(); ++i) {
    const BoundaryFeature& f = features[i];
    if (!f.bounds.contains(p)) continue;
    if (PointInMultiPolygon(f.geometry, p)) out.push_back(i);
  }
  return out;
}

bool BoundaryDatasetFromGeoJson(const JsonValue& root, BoundaryDataset& out, std::string& outError)
{
  const JsonValue* type = FindJsonMember(root, "type");
  const JsonValue* feats = FindJsonMember(root, "features");
  if (!type || !type->isString() || type->stringValue != "FeatureCollection" || !feats || !feats->isArray()) {
    outError = "boundaries: expected a GeoJSON FeatureCollection";
    return false;
  }

  BoundaryDataset ds;
  for (std::size_t i = 0; i < feats->arrayValue.size(); ++i) {
    const JsonValue& f = feats->arrayValue[i];
    const JsonValue* g = FindJsonMember(f, "geometry");
    if (!g || g->isNull()) continue;

    BoundaryFeature bf;
    std::string err;
    if (!ParseGeometry(*g, bf.geometry, err)) {
      outError = "boundaries: feature " + std::to_string(i) + ": " + err;
      return false;
    }
    bf.bounds = ComputeBounds(bf.geometry);
    if (const JsonValue* props = FindJsonMember(f, "properties")) {
      for (const auto& kv : props->objectValue) bf.properties[kv.first] = PropertyString(kv.second);
    }
    ds.features.push_back(std::move(bf));
  }

  out = std::move(ds);
  return true;
}

bool LoadBoundaryGeoJsonFile(const std::string& path, BoundaryDataset& out, std::string& outError)
{
  JsonValue root;
  if (!ReadJsonFile(path, root, outError)) return false;
  if (!BoundaryDatasetFromGeoJson(root, out, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

} // namespace uhi
