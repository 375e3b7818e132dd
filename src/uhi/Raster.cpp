#include "uhi/Raster.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <utility>

namespace uhi {

GeoPoint GridSpec::cellCenter(int x, int y) const
{
  return GeoPoint{originLon + (static_cast<double>(x) + 0.5) * pixelWidthDeg,
                  originLat - (static_cast<double>(y) + 0.5) * pixelHeightDeg};
}

bool GridSpec::locate(const GeoPoint& p, int& outX, int& outY) const
{
  if (width <= 0 || height <= 0 || !(pixelWidthDeg > 0.0) || !(pixelHeightDeg > 0.0)) return false;
  const double fx = (p.lon - originLon) / pixelWidthDeg;
  const double fy = (originLat - p.lat) / pixelHeightDeg;
  if (!(fx >= 0.0) || !(fy >= 0.0)) return false;
  const int x = static_cast<int>(std::floor(fx));
  const int y = static_cast<int>(std::floor(fy));
  if (x >= width || y >= height) return false;
  outX = x;
  outY = y;
  return true;
}

GeoBounds GridSpec::bounds() const
{
  GeoBounds b;
  if (width <= 0 || height <= 0) return b;
  b.expand(GeoPoint{originLon, originLat});
  b.expand(GeoPoint{originLon + width * pixelWidthDeg, originLat - height * pixelHeightDeg});
  return b;
}

bool GridSpec::sameAs(const GridSpec& o) const
{
  return width == o.width && height == o.height && originLon == o.originLon && originLat == o.originLat &&
         pixelWidthDeg == o.pixelWidthDeg && pixelHeightDeg == o.pixelHeightDeg && crs == o.crs;
}

Raster Raster::Invalid(const GridSpec& grid)
{
  Raster r;
  r.grid = grid;
  r.cells.assign(grid.cellCount(), Cell{});
  return r;
}

std::size_t Raster::validCount() const
{
  return static_cast<std::size_t>(
      std::count_if(cells.begin(), cells.end(), [](const Cell& c) { return c.has_value(); }));
}

namespace {

int SaturatingCells(double span)
{
  const double n = std::ceil(span);
  if (!(n >= 1.0)) return 1;
  if (n >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
  return static_cast<int>(n);
}

} // namespace

GridSpec MakeGridForBounds(const GeoBounds& bounds, double scaleMeters, const std::string& crs)
{
  GridSpec g;
  g.crs = crs;
  if (!bounds.valid || !(scaleMeters > 0.0)) return g;

  const double lat0 = bounds.center().lat;
  g.pixelHeightDeg = scaleMeters / MetersPerDegreeLat();
  g.pixelWidthDeg = scaleMeters / std::max(1e-9, MetersPerDegreeLon(lat0));
  g.originLon = bounds.minLon;
  g.originLat = bounds.maxLat;
  g.width = SaturatingCells((bounds.maxLon - bounds.minLon) / g.pixelWidthDeg);
  g.height = SaturatingCells((bounds.maxLat - bounds.minLat) / g.pixelHeightDeg);
  return g;
}

double EstimatePixelCount(const GeoBounds& bounds, double scaleMeters)
{
  if (!bounds.valid || !(scaleMeters > 0.0)) return std::numeric_limits<double>::infinity();
  const double lat0 = bounds.center().lat;
  const double wM = (bounds.maxLon - bounds.minLon) * MetersPerDegreeLon(lat0);
  const double hM = (bounds.maxLat - bounds.minLat) * MetersPerDegreeLat();
  const double cols = std::max(1.0, std::ceil(wM / scaleMeters));
  const double rows = std::max(1.0, std::ceil(hM / scaleMeters));
  return cols * rows;
}

Raster ResampleNearest(const Raster& src, const GridSpec& dst)
{
  if (src.grid.sameAs(dst)) return src;

  Raster out = Raster::Invalid(dst);
  for (int y = 0; y < dst.height; ++y) {
    for (int x = 0; x < dst.width; ++x) {
      int sx = 0;
      int sy = 0;
      if (!src.grid.locate(dst.cellCenter(x, y), sx, sy)) continue;
      out.at(x, y) = src.at(sx, sy);
    }
  }
  return out;
}

std::vector<std::uint8_t> RegionCoverage(const GridSpec& grid, const GeoMultiPolygon& region)
{
  std::vector<std::uint8_t> inside(grid.cellCount(), 0);
  const GeoBounds rb = ComputeBounds(region);
  for (int y = 0; y < grid.height; ++y) {
    for (int x = 0; x < grid.width; ++x) {
      const GeoPoint p = grid.cellCenter(x, y);
      if (rb.contains(p) && PointInMultiPolygon(region, p)) inside[grid.index(x, y)] = 1;
    }
  }
  return inside;
}

Raster ClipToRegion(const Raster& src, const GeoMultiPolygon& region)
{
  Raster out = src;
  const std::vector<std::uint8_t> inside = RegionCoverage(src.grid, region);
  for (std::size_t i = 0; i < out.cells.size(); ++i) {
    if (!inside[i]) out.cells[i].reset();
  }
  return out;
}

Raster ApplyMask(const Raster& src, const Raster& mask)
{
  const Raster m = ResampleNearest(mask, src.grid);
  Raster out = src;
  for (std::size_t i = 0; i < out.cells.size(); ++i) {
    const Cell& mc = m.cells[i];
    if (!mc || *mc == 0.0) out.cells[i].reset();
  }
  return out;
}

bool ValidRange(const Raster& r, double& outMin, double& outMax)
{
  bool any = false;
  double mn = 0.0;
  double mx = 0.0;
  for (const Cell& c : r.cells) {
    if (!c) continue;
    if (!any) {
      mn = mx = *c;
      any = true;
      continue;
    }
    mn = std::min(mn, *c);
    mx = std::max(mx, *c);
  }
  if (!any) return false;
  outMin = mn;
  outMax = mx;
  return true;
}

namespace {

bool GetNumber(const JsonValue& obj, const char* key, double& out, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || !v->isNumber() || !std::isfinite(v->numberValue)) {
    err = std::string("grid: expected finite number for key '") + key + "'";
    return false;
  }
  out = v->numberValue;
  return true;
}

} // namespace

bool RasterFromJson(const JsonValue& root, Raster& out, std::string& outError)
{
  const JsonValue* g = FindJsonMember(root, "grid");
  if (!g || !g->isObject()) {
    outError = "raster: missing 'grid' object";
    return false;
  }

  GridSpec grid;
  double w = 0.0;
  double h = 0.0;
  if (!GetNumber(*g, "origin_lon", grid.originLon, outError)) return false;
  if (!GetNumber(*g, "origin_lat", grid.originLat, outError)) return false;
  if (!GetNumber(*g, "pixel_width_deg", grid.pixelWidthDeg, outError)) return false;
  if (!GetNumber(*g, "pixel_height_deg", grid.pixelHeightDeg, outError)) return false;
  if (!GetNumber(*g, "width", w, outError)) return false;
  if (!GetNumber(*g, "height", h, outError)) return false;
  if (w < 1.0 || h < 1.0 || w > 1e6 || h > 1e6 || !(grid.pixelWidthDeg > 0.0) || !(grid.pixelHeightDeg > 0.0)) {
    outError = "raster: invalid grid dimensions";
    return false;
  }
  grid.width = static_cast<int>(w);
  grid.height = static_cast<int>(h);
  if (const JsonValue* crs = FindJsonMember(*g, "crs")) {
    if (!crs->isString()) {
      outError = "raster: 'crs' must be a string";
      return false;
    }
    grid.crs = crs->stringValue;
  }

  const JsonValue* values = FindJsonMember(root, "values");
  if (!values || !values->isArray()) {
    outError = "raster: missing 'values' array";
    return false;
  }
  if (values->arrayValue.size() != grid.cellCount()) {
    outError = "raster: 'values' length does not match width*height";
    return false;
  }

  Raster r = Raster::Invalid(grid);
  for (std::size_t i = 0; i < values->arrayValue.size(); ++i) {
    const JsonValue& v = values->arrayValue[i];
    if (v.isNull()) continue;
    if (!v.isNumber() || !std::isfinite(v.numberValue)) {
      outError = "raster: values must be finite numbers or null";
      return false;
    }
    r.cells[i] = v.numberValue;
  }

  out = std::move(r);
  return true;
}

bool ReadRasterJsonFile(const std::string& path, Raster& out, std::string& outError)
{
  JsonValue root;
  if (!ReadJsonFile(path, root, outError)) return false;
  if (!RasterFromJson(root, out, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

void WriteGridJson(JsonWriter& w, const GridSpec& g)
{
  w.beginObject();
  w.key("origin_lon");
  w.numberValue(g.originLon);
  w.key("origin_lat");
  w.numberValue(g.originLat);
  w.key("pixel_width_deg");
  w.numberValue(g.pixelWidthDeg);
  w.key("pixel_height_deg");
  w.numberValue(g.pixelHeightDeg);
  w.key("width");
  w.intValue(g.width);
  w.key("height");
  w.intValue(g.height);
  w.key("crs");
  w.stringValue(g.crs);
  w.endObject();
}

bool WriteRasterJsonFile(const std::string& path, const Raster& r, std::string& outError)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path + " for writing";
    return false;
  }

  JsonWriteOptions opt;
  opt.pretty = false;
  JsonWriter w(f, opt);
  w.beginObject();
  w.key("grid");
  WriteGridJson(w, r.grid);
  w.key("values");
  w.beginArray();
  for (const Cell& c : r.cells) {
    if (c) {
      w.numberValue(*c);
    } else {
      w.nullValue();
    }
  }
  w.endArray();
  w.endObject();

  if (!w.ok()) {
    outError = w.error();
    return false;
  }
  if (!f) {
    outError = "write failed: " + path;
    return false;
  }
  return true;
}

} // namespace uhi
