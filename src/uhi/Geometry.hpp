#pragma once

#include "uhi/Types.hpp"

#include <vector>

namespace uhi {

// -----------------------------------------------------------------------------------------------
// Geographic vector geometry (lon/lat degrees, dependency-free)
//
// Rings are closed (ring.front() == ring.back()). Polygons have one outer ring and
// optional holes. Distances used by simplification are measured in a local
// equirectangular projection centered on the geometry, which is accurate enough for
// city-sized regions.
// -----------------------------------------------------------------------------------------------

using GeoRing = std::vector<GeoPoint>;

struct GeoPolygon {
  GeoRing outer;
  std::vector<GeoRing> holes;
};

struct GeoMultiPolygon {
  std::vector<GeoPolygon> polygons;

  bool empty() const { return polygons.empty(); }
};

struct GeoBounds {
  double minLon = 0.0;
  double minLat = 0.0;
  double maxLon = 0.0;
  double maxLat = 0.0;
  bool valid = false;

  void expand(const GeoPoint& p);
  void expand(const GeoBounds& b);

  bool contains(const GeoPoint& p) const;
  bool intersects(const GeoBounds& o) const;

  // Degenerate bounds (a single point) are still valid, with zero area.
  GeoPoint center() const { return GeoPoint{0.5 * (minLon + maxLon), 0.5 * (minLat + maxLat)}; }
};

GeoBounds ComputeBounds(const GeoRing& ring);
GeoBounds ComputeBounds(const GeoPolygon& poly);
GeoBounds ComputeBounds(const GeoMultiPolygon& mp);

constexpr double kEarthRadiusMeters = 6371000.0;

double MetersPerDegreeLat();
double MetersPerDegreeLon(double latDeg);

// Points on a ring edge count as inside.
bool PointInRing(const GeoRing& ring, const GeoPoint& p);
bool PointInPolygon(const GeoPolygon& poly, const GeoPoint& p);
bool PointInMultiPolygon(const GeoMultiPolygon& mp, const GeoPoint& p);

// True if two non-adjacent edges of the closed ring touch or cross.
bool RingSelfIntersects(const GeoRing& ring);

// A usable ring: closed, at least three distinct vertices, non-zero area, no self-intersection.
bool IsValidRing(const GeoRing& ring);

// Signed shoelace area in square degrees (positive = counter-clockwise).
double RingSignedAreaDeg2(const GeoRing& ring);

// Douglas-Peucker simplification with a distance tolerance in meters.
//
// The result keeps a subset of the input vertices, so its bounding extent never
// grows. If simplification at the requested tolerance would yield an invalid
// ring, the tolerance is halved until the result is valid (falling back to the
// input ring). tolerance <= 0 returns the input unchanged.
GeoRing SimplifyRing(const GeoRing& ring, double toleranceMeters);

// Holes that collapse or cross the simplified outer ring are kept unsimplified
// when still valid, otherwise dropped.
GeoPolygon SimplifyPolygon(const GeoPolygon& poly, double toleranceMeters);
GeoMultiPolygon SimplifyMultiPolygon(const GeoMultiPolygon& mp, double toleranceMeters);

// Close an open ring in place (appends front() when needed).
void CloseRing(GeoRing& ring);

} // namespace uhi
