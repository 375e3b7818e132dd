#pragma once

#include "uhi/Date.hpp"
#include "uhi/Geometry.hpp"
#include "uhi/PipelineError.hpp"
#include "uhi/Raster.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace uhi {

// One element of a raster time series: acquisition metadata plus its bands.
struct Acquisition {
  std::string id;
  CivilDate date;

  // Numeric metadata (cloud cover, calibration coefficients, ...). A missing key
  // means the attribute is absent for this acquisition.
  std::map<std::string, double> properties;

  std::map<std::string, Raster> bands;

  std::optional<double> property(const std::string& name) const;
  const Raster* band(const std::string& name) const;
};

// Time-ordered acquisitions of one collection (ascending date, then id).
struct RasterStack {
  std::string collection;
  std::vector<Acquisition> items;
};

// Strict "property < threshold" metadata filter. Elements lacking the property
// never match.
struct PropertyLessThan {
  std::string name;
  double threshold = 0.0;
};

struct CollectionQuery {
  std::string collection;

  // Band to select; elements that lack it are an input error.
  std::string band;

  std::optional<DateRange> dates;
  std::optional<MonthFilter> months;
  std::optional<GeoBounds> bounds;
  std::optional<PropertyLessThan> below;
};

// Metadata part of a query (dates, months, property threshold).
bool MatchesMetadata(const CollectionQuery& q, const CivilDate& date, const std::map<std::string, double>& props);

// -----------------------------------------------------------------------------------------------
// ImageCatalog
//
// Read-only access to raster time series: in-memory stacks or a data directory.
// -----------------------------------------------------------------------------------------------
class ImageCatalog {
public:
  virtual ~ImageCatalog() = default;

  // Returns the matching elements with only the selected band kept.
  virtual bool query(const CollectionQuery& q, RasterStack& out, PipelineError& err) const = 0;
};

class MemoryCatalog final : public ImageCatalog {
public:
  void add(const std::string& collection, Acquisition a);

  bool query(const CollectionQuery& q, RasterStack& out, PipelineError& err) const override;

private:
  std::map<std::string, std::vector<Acquisition>> m_collections;
};

// Directory layout:
//   <dir>/catalog.json
//     {"collections": {"<name>": [
//        {"id": "...", "date": "YYYY-MM-DD", "properties": {"K": 1.0, ...},
//         "bands": {"<band>": "relative/raster.json", ...}}, ...]}}
//
// Band rasters are read lazily, only for elements that pass the metadata filters.
class DirectoryCatalog final : public ImageCatalog {
public:
  bool open(const std::string& dir, std::string& outError);

  bool query(const CollectionQuery& q, RasterStack& out, PipelineError& err) const override;

  std::size_t acquisitionCount() const;

private:
  struct Entry {
    std::string id;
    CivilDate date;
    std::map<std::string, double> properties;
    std::map<std::string, std::string> bandFiles;
  };

  std::string m_dir;
  std::map<std::string, std::vector<Entry>> m_collections;
};

} // namespace uhi
