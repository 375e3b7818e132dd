#include "uhi/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

namespace uhi {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct XY {
  double x = 0.0;
  double y = 0.0;
};

// Local equirectangular projection (meters) around a reference latitude.
std::vector<XY> Project(const GeoRing& ring, double refLat)
{
  const double kx = MetersPerDegreeLon(refLat);
  const double ky = MetersPerDegreeLat();
  std::vector<XY> out;
  out.reserve(ring.size());
  for (const GeoPoint& p : ring) out.push_back(XY{p.lon * kx, p.lat * ky});
  return out;
}

double SegmentDistance(const XY& p, const XY& a, const XY& b)
{
  const double dx = b.x - a.x;
  const double dy = b.y - a.y;
  const double len2 = dx * dx + dy * dy;
  if (len2 <= 0.0) return std::hypot(p.x - a.x, p.y - a.y);
  double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / len2;
  t = std::clamp(t, 0.0, 1.0);
  return std::hypot(p.x - (a.x + t * dx), p.y - (a.y + t * dy));
}

// Marks vertices in [first, last] to keep (endpoints are assumed kept).
void DouglasPeucker(const std::vector<XY>& pts, std::size_t first, std::size_t last, double tol,
                    std::vector<char>& keep)
{
  // Explicit stack keeps large rings from exhausting the call stack.
  std::vector<std::pair<std::size_t, std::size_t>> todo;
  todo.emplace_back(first, last);
  while (!todo.empty()) {
    const auto [a, b] = todo.back();
    todo.pop_back();
    if (b <= a + 1) continue;

    double best = -1.0;
    std::size_t bestIdx = a;
    for (std::size_t i = a + 1; i < b; ++i) {
      const double d = SegmentDistance(pts[i], pts[a], pts[b]);
      if (d > best) {
        best = d;
        bestIdx = i;
      }
    }
    if (best > tol) {
      keep[bestIdx] = 1;
      todo.emplace_back(a, bestIdx);
      todo.emplace_back(bestIdx, b);
    }
  }
}

double Cross(double ax, double ay, double bx, double by, double cx, double cy)
{
  return (bx - ax) * (cy - ay) - (by - ay) * (cx - ax);
}

bool OnSegment(const GeoPoint& a, const GeoPoint& b, const GeoPoint& p)
{
  if (Cross(a.lon, a.lat, b.lon, b.lat, p.lon, p.lat) != 0.0) return false;
  return p.lon >= std::min(a.lon, b.lon) && p.lon <= std::max(a.lon, b.lon) && p.lat >= std::min(a.lat, b.lat) &&
         p.lat <= std::max(a.lat, b.lat);
}

int Sign(double v)
{
  return (v > 0.0) - (v < 0.0);
}

bool SegmentsIntersect(const GeoPoint& p1, const GeoPoint& p2, const GeoPoint& q1, const GeoPoint& q2)
{
  const int d1 = Sign(Cross(q1.lon, q1.lat, q2.lon, q2.lat, p1.lon, p1.lat));
  const int d2 = Sign(Cross(q1.lon, q1.lat, q2.lon, q2.lat, p2.lon, p2.lat));
  const int d3 = Sign(Cross(p1.lon, p1.lat, p2.lon, p2.lat, q1.lon, q1.lat));
  const int d4 = Sign(Cross(p1.lon, p1.lat, p2.lon, p2.lat, q2.lon, q2.lat));

  if (d1 != d2 && d3 != d4 && d1 != 0 && d2 != 0 && d3 != 0 && d4 != 0) return true;

  if (d1 == 0 && OnSegment(q1, q2, p1)) return true;
  if (d2 == 0 && OnSegment(q1, q2, p2)) return true;
  if (d3 == 0 && OnSegment(p1, p2, q1)) return true;
  if (d4 == 0 && OnSegment(p1, p2, q2)) return true;
  return false;
}

bool RingsIntersect(const GeoRing& a, const GeoRing& b)
{
  for (std::size_t i = 0; i + 1 < a.size(); ++i) {
    for (std::size_t j = 0; j + 1 < b.size(); ++j) {
      if (SegmentsIntersect(a[i], a[i + 1], b[j], b[j + 1])) return true;
    }
  }
  return false;
}

GeoRing SimplifyRingAt(const GeoRing& ring, double tol)
{
  // Drop the closing vertex, simplify the two chains split at the vertex farthest
  // from ring[0], then re-close.
  const std::size_t n = ring.size() - 1;
  const GeoBounds b = ComputeBounds(ring);
  const std::vector<XY> pts = Project(ring, b.center().lat);

  std::size_t far = 0;
  double farDist = -1.0;
  for (std::size_t i = 1; i < n; ++i) {
    const double d = std::hypot(pts[i].x - pts[0].x, pts[i].y - pts[0].y);
    if (d > farDist) {
      farDist = d;
      far = i;
    }
  }

  std::vector<char> keep(n + 1, 0);
  keep[0] = 1;
  keep[far] = 1;
  keep[n] = 1;
  DouglasPeucker(pts, 0, far, tol, keep);
  DouglasPeucker(pts, far, n, tol, keep);

  GeoRing out;
  for (std::size_t i = 0; i <= n; ++i) {
    if (keep[i]) out.push_back(ring[i]);
  }
  return out;
}

} // namespace

void GeoBounds::expand(const GeoPoint& p)
{
  if (!valid) {
    minLon = maxLon = p.lon;
    minLat = maxLat = p.lat;
    valid = true;
    return;
  }
  minLon = std::min(minLon, p.lon);
  maxLon = std::max(maxLon, p.lon);
  minLat = std::min(minLat, p.lat);
  maxLat = std::max(maxLat, p.lat);
}

void GeoBounds::expand(const GeoBounds& b)
{
  if (!b.valid) return;
  expand(GeoPoint{b.minLon, b.minLat});
  expand(GeoPoint{b.maxLon, b.maxLat});
}

bool GeoBounds::contains(const GeoPoint& p) const
{
  return valid && p.lon >= minLon && p.lon <= maxLon && p.lat >= minLat && p.lat <= maxLat;
}

bool GeoBounds::intersects(const GeoBounds& o) const
{
  if (!valid || !o.valid) return false;
  return !(o.minLon > maxLon || o.maxLon < minLon || o.minLat > maxLat || o.maxLat < minLat);
}

GeoBounds ComputeBounds(const GeoRing& ring)
{
  GeoBounds b;
  for (const GeoPoint& p : ring) b.expand(p);
  return b;
}

GeoBounds ComputeBounds(const GeoPolygon& poly)
{
  // Holes lie inside the outer ring by construction.
  return ComputeBounds(poly.outer);
}

GeoBounds ComputeBounds(const GeoMultiPolygon& mp)
{
  GeoBounds b;
  for (const GeoPolygon& p : mp.polygons) b.expand(ComputeBounds(p));
  return b;
}

double MetersPerDegreeLat()
{
  return kEarthRadiusMeters * kPi / 180.0;
}

double MetersPerDegreeLon(double latDeg)
{
  return MetersPerDegreeLat() * std::cos(latDeg * kPi / 180.0);
}

bool PointInRing(const GeoRing& ring, const GeoPoint& p)
{
  if (ring.size() < 4) return false;
  bool inside = false;
  for (std::size_t i = 0, j = ring.size() - 2; i + 1 < ring.size(); j = i++) {
    const GeoPoint& a = ring[i];
    const GeoPoint& b = ring[j];
    if (OnSegment(a, b, p)) return true;
    if ((a.lat > p.lat) != (b.lat > p.lat)) {
      const double xCross = (b.lon - a.lon) * (p.lat - a.lat) / (b.lat - a.lat) + a.lon;
      if (p.lon < xCross) inside = !inside;
    }
  }
  return inside;
}

bool PointInPolygon(const GeoPolygon& poly, const GeoPoint& p)
{
  if (!PointInRing(poly.outer, p)) return false;
  for (const GeoRing& hole : poly.holes) {
    if (!PointInRing(hole, p)) continue;
    // A point on the hole edge is on the polygon boundary.
    bool onEdge = false;
    for (std::size_t i = 0; i + 1 < hole.size() && !onEdge; ++i) onEdge = OnSegment(hole[i], hole[i + 1], p);
    if (!onEdge) return false;
  }
  return true;
}

bool PointInMultiPolygon(const GeoMultiPolygon& mp, const GeoPoint& p)
{
  for (const GeoPolygon& poly : mp.polygons) {
    if (PointInPolygon(poly, p)) return true;
  }
  return false;
}

bool RingSelfIntersects(const GeoRing& ring)
{
  const std::size_t edges = ring.size() < 2 ? 0 : ring.size() - 1;
  for (std::size_t i = 0; i < edges; ++i) {
    for (std::size_t j = i + 1; j < edges; ++j) {
      // Adjacent edges share a vertex by construction (including last/first).
      if (j == i + 1) continue;
      if (i == 0 && j == edges - 1) continue;
      if (SegmentsIntersect(ring[i], ring[i + 1], ring[j], ring[j + 1])) return true;
    }
  }
  return false;
}

double RingSignedAreaDeg2(const GeoRing& ring)
{
  double a = 0.0;
  for (std::size_t i = 0; i + 1 < ring.size(); ++i) {
    a += ring[i].lon * ring[i + 1].lat - ring[i + 1].lon * ring[i].lat;
  }
  return 0.5 * a;
}

bool IsValidRing(const GeoRing& ring)
{
  if (ring.size() < 4) return false;
  if (ring.front().lon != ring.back().lon || ring.front().lat != ring.back().lat) return false;
  if (RingSignedAreaDeg2(ring) == 0.0) return false;
  return !RingSelfIntersects(ring);
}

void CloseRing(GeoRing& ring)
{
  if (ring.empty()) return;
  const GeoPoint& f = ring.front();
  const GeoPoint& l = ring.back();
  if (f.lon != l.lon || f.lat != l.lat) ring.push_back(f);
}

GeoRing SimplifyRing(const GeoRing& ring, double toleranceMeters)
{
  if (!(toleranceMeters > 0.0) || ring.size() <= 4) return ring;

  double tol = toleranceMeters;
  for (int attempt = 0; attempt < 32; ++attempt) {
    GeoRing s = SimplifyRingAt(ring, tol);
    if (IsValidRing(s)) return s;
    tol *= 0.5;
    if (tol < 1e-3) break;
  }
  return ring;
}

GeoPolygon SimplifyPolygon(const GeoPolygon& poly, double toleranceMeters)
{
  GeoPolygon out;
  out.outer = SimplifyRing(poly.outer, toleranceMeters);
  for (const GeoRing& hole : poly.holes) {
    GeoRing h = SimplifyRing(hole, toleranceMeters);
    if (!IsValidRing(h) || RingsIntersect(h, out.outer)) h = hole;
    if (!IsValidRing(h) || RingsIntersect(h, out.outer)) continue;
    out.holes.push_back(std::move(h));
  }
  return out;
}

GeoMultiPolygon SimplifyMultiPolygon(const GeoMultiPolygon& mp, double toleranceMeters)
{
  GeoMultiPolygon out;
  out.polygons.reserve(mp.polygons.size());
  for (const GeoPolygon& p : mp.polygons) out.polygons.push_back(SimplifyPolygon(p, toleranceMeters));
  return out;
}

} // namespace uhi
