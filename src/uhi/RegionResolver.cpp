#include "uhi/RegionResolver.hpp"

#include <cmath>
#include <utility>

namespace uhi {

bool ResolveRegion(const BoundaryDataset& boundaries, const GeoPoint& point, double toleranceMeters,
                   ResolvedRegion& out, PipelineError& err)
{
  if (!(toleranceMeters >= 0.0)) {
    err.set(PipelineErrorKind::InvalidConfig, "region", "simplification tolerance must be >= 0");
    err.with("tolerance_m", toleranceMeters);
    return false;
  }

  if (!std::isfinite(point.lon) || !std::isfinite(point.lat)) {
    err.set(PipelineErrorKind::InvalidInput, "region", "point coordinates must be finite");
    err.with("lon", point.lon).with("lat", point.lat);
    return false;
  }

  ResolvedRegion r;
  r.point = point;
  r.toleranceMeters = toleranceMeters;
  r.featureIndices = boundaries.queryPoint(point);

  for (std::size_t idx : r.featureIndices) {
    BoundaryFeature f = boundaries.features[idx];
    f.geometry = SimplifyMultiPolygon(f.geometry, toleranceMeters);
    f.bounds = ComputeBounds(f.geometry);
    for (const GeoPolygon& p : f.geometry.polygons) r.geometry.polygons.push_back(p);
    r.features.push_back(std::move(f));
  }
  r.bounds = ComputeBounds(r.geometry);

  if (r.empty()) {
    err.set(PipelineErrorKind::RegionNotFound, "region", "no boundary feature contains the point");
    err.with("lon", point.lon).with("lat", point.lat).with("tolerance_m", toleranceMeters);
    err.with("features", static_cast<double>(boundaries.features.size()));
    return false;
  }

  out = std::move(r);
  return true;
}

} // namespace uhi
