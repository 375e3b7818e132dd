#pragma once

#include "uhi/Geometry.hpp"
#include "uhi/Json.hpp"
#include "uhi/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace uhi {

// North-up geographic grid.
//
// (originLon, originLat) is the top-left corner of cell (0,0). x grows east,
// y grows south; pixel sizes are positive degrees.
struct GridSpec {
  double originLon = 0.0;
  double originLat = 0.0;
  double pixelWidthDeg = 1.0;
  double pixelHeightDeg = 1.0;
  int width = 0;
  int height = 0;
  std::string crs = "EPSG:4326";

  std::size_t cellCount() const
  {
    return (width > 0 && height > 0) ? static_cast<std::size_t>(width) * static_cast<std::size_t>(height) : 0u;
  }

  std::size_t index(int x, int y) const
  {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
  }

  GeoPoint cellCenter(int x, int y) const;

  // False when p lies outside the grid extent.
  bool locate(const GeoPoint& p, int& outX, int& outY) const;

  GeoBounds bounds() const;

  bool sameAs(const GridSpec& o) const;
};

// A single-band raster with per-cell validity.
struct Raster {
  GridSpec grid;
  std::vector<Cell> cells;

  static Raster Invalid(const GridSpec& grid);

  const Cell& at(int x, int y) const { return cells[grid.index(x, y)]; }
  Cell& at(int x, int y) { return cells[grid.index(x, y)]; }

  std::size_t validCount() const;
};

// Cap on cells of any grid held in memory (working grid, export grid),
// independent of the configured pixel ceilings.
constexpr double kMaxGridCells = 2.0e8;

// Working grid covering `bounds` at roughly `scaleMeters` per pixel (degrees
// converted at the bounds' center latitude). Width and height saturate at INT_MAX;
// callers check cellCount() or the pixel estimate against kMaxGridCells first.
GridSpec MakeGridForBounds(const GeoBounds& bounds, double scaleMeters, const std::string& crs = "EPSG:4326");

// Number of pixels a reduction at `scaleMeters` over `bounds` would touch. Depends
// only on geometry and scale, never on data.
double EstimatePixelCount(const GeoBounds& bounds, double scaleMeters);

// Nearest-neighbour sampling of src onto dst. Cells outside src's extent are invalid.
Raster ResampleNearest(const Raster& src, const GridSpec& dst);

// 1 for cells whose center lies inside the region, else 0 (row-major, grid.cellCount()).
std::vector<std::uint8_t> RegionCoverage(const GridSpec& grid, const GeoMultiPolygon& region);

// Invalidate cells whose center lies outside the region.
Raster ClipToRegion(const Raster& src, const GeoMultiPolygon& region);

// Keep src cells where mask is valid and non-zero (mask is resampled when its grid differs).
Raster ApplyMask(const Raster& src, const Raster& mask);

// Min/max over valid cells. False if the raster has no valid cell.
bool ValidRange(const Raster& r, double& outMin, double& outMax);

// JSON form: {"grid":{...},"values":[v0, v1, null, ...]} (row-major).
bool RasterFromJson(const JsonValue& root, Raster& out, std::string& outError);
bool ReadRasterJsonFile(const std::string& path, Raster& out, std::string& outError);
bool WriteRasterJsonFile(const std::string& path, const Raster& r, std::string& outError);

void WriteGridJson(JsonWriter& w, const GridSpec& g);

} // namespace uhi
