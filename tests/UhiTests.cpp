#include "uhi/Boundary.hpp"
#include "uhi/Catalog.hpp"
#include "uhi/Checksum.hpp"
#include "uhi/ConfigIO.hpp"
#include "uhi/Date.hpp"
#include "uhi/Deferred.hpp"
#include "uhi/Export.hpp"
#include "uhi/GeoJsonExport.hpp"
#include "uhi/Geometry.hpp"
#include "uhi/HeatIsland.hpp"
#include "uhi/Json.hpp"
#include "uhi/LogTee.hpp"
#include "uhi/Pipeline.hpp"
#include "uhi/Raster.hpp"
#include "uhi/RegionResolver.hpp"
#include "uhi/RunReport.hpp"
#include "uhi/ThermalComposite.hpp"
#include "uhi/UrbanMask.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace uhi;

const char* kLandCover = "GOOGLE/DYNAMICWORLD/V1";
const char* kThermal = "LANDSAT/LC08/C02/T1_L2";

fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;
  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");
  const auto stamp = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

GeoPolygon Box(double lon0, double lat0, double lon1, double lat1)
{
  GeoPolygon p;
  p.outer = {{lon0, lat0}, {lon1, lat0}, {lon1, lat1}, {lon0, lat1}, {lon0, lat0}};
  return p;
}

BoundaryFeature Feature(const std::string& name, const GeoPolygon& poly)
{
  BoundaryFeature f;
  f.properties["name"] = name;
  f.geometry.polygons.push_back(poly);
  f.bounds = ComputeBounds(f.geometry);
  return f;
}

// West and East share the edge lon = 80.30. Far lies east of a gap.
BoundaryDataset TestBoundaries()
{
  BoundaryDataset ds;
  ds.features.push_back(Feature("West", Box(80.20, 13.00, 80.30, 13.10)));
  ds.features.push_back(Feature("East", Box(80.30, 13.00, 80.40, 13.10)));
  ds.features.push_back(Feature("Far", Box(80.50, 13.00, 80.60, 13.10)));
  return ds;
}

// 0.01 degree cells covering lon 80.15..80.45, lat 12.95..13.15.
GridSpec SourceGrid()
{
  GridSpec g;
  g.originLon = 80.15;
  g.originLat = 13.15;
  g.pixelWidthDeg = 0.01;
  g.pixelHeightDeg = 0.01;
  g.width = 30;
  g.height = 20;
  return g;
}

Raster Uniform(const GridSpec& g, double v)
{
  Raster r;
  r.grid = g;
  r.cells.assign(g.cellCount(), Cell(v));
  return r;
}

// Urban (6) west of lon 80.25, `east` elsewhere.
Raster LabelsSplit(double east)
{
  Raster r = Uniform(SourceGrid(), 6.0);
  for (int y = 0; y < r.grid.height; ++y) {
    for (int x = 0; x < r.grid.width; ++x) {
      if (r.grid.cellCenter(x, y).lon > 80.25) r.at(x, y) = east;
    }
  }
  return r;
}

Acquisition LandCoverScene(const std::string& id, CivilDate date, Raster labels)
{
  Acquisition a;
  a.id = id;
  a.date = date;
  a.bands.emplace("label", std::move(labels));
  return a;
}

// Raw thermal counts calibrated with scale 0.5 / offset 100.
Acquisition ThermalScene(const std::string& id, CivilDate date, double cloud, double raw)
{
  Acquisition a;
  a.id = id;
  a.date = date;
  a.properties["CLOUD_COVER"] = cloud;
  a.properties["TEMPERATURE_MULT_BAND_ST_B10"] = 0.5;
  a.properties["TEMPERATURE_ADD_BAND_ST_B10"] = 100.0;
  a.bands.emplace("ST_B10", Uniform(SourceGrid(), raw));
  return a;
}

// Summer scenes vote urban in the west and class 1 in the east; a January scene
// (outside the month filter) and a 2024 scene (outside the window) would vote urban
// everywhere.
MemoryCatalog TestCatalog()
{
  MemoryCatalog c;
  c.add(kLandCover, LandCoverScene("lc_2023_06", {2023, 6, 10}, LabelsSplit(1.0)));
  c.add(kLandCover, LandCoverScene("lc_2023_07", {2023, 7, 10}, LabelsSplit(6.0)));
  c.add(kLandCover, LandCoverScene("lc_2023_08", {2023, 8, 10}, LabelsSplit(1.0)));
  c.add(kLandCover, LandCoverScene("lc_2023_01", {2023, 1, 10}, Uniform(SourceGrid(), 6.0)));
  c.add(kLandCover, LandCoverScene("lc_2024_06", {2024, 6, 10}, Uniform(SourceGrid(), 6.0)));

  c.add(kThermal, ThermalScene("lst_a", {2023, 3, 1}, 5.0, 400.0));    // 300 K
  c.add(kThermal, ThermalScene("lst_b", {2023, 9, 1}, 3.0, 402.0));    // 301 K
  c.add(kThermal, ThermalScene("lst_cloudy", {2023, 4, 1}, 10.0, 1000.0));
  c.add(kThermal, ThermalScene("lst_2024", {2024, 2, 1}, 1.0, 1000.0));
  return c;
}

PipelineConfig TestConfig()
{
  PipelineConfig cfg;
  cfg.region.center = GeoPoint{80.25, 13.05};
  cfg.region.simplifyToleranceMeters = 100.0;
  cfg.statistic.scaleMeters = 1000.0;
  cfg.exportCfg.scaleMeters = 1000.0;
  return cfg;
}

// Records every query so tests can check that a stage never reached the data.
class CountingCatalog final : public ImageCatalog {
public:
  explicit CountingCatalog(const ImageCatalog& inner) : m_inner(inner) {}

  bool query(const CollectionQuery& q, RasterStack& out, PipelineError& err) const override
  {
    ++queries;
    return m_inner.query(q, out, err);
  }

  mutable int queries = 0;

private:
  const ImageCatalog& m_inner;
};

bool SameCells(const Raster& a, const Raster& b)
{
  return a.grid.sameAs(b.grid) && a.cells == b.cells;
}

bool WriteText(const fs::path& p, const std::string& text)
{
  std::ofstream f(p, std::ios::binary);
  f << text;
  return static_cast<bool>(f);
}

std::string ReadText(const fs::path& p)
{
  std::ifstream f(p, std::ios::binary);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

} // namespace

void TestDates()
{
  CivilDate d;
  EXPECT_TRUE(ParseIsoDate("2023", d));
  EXPECT_EQ(FormatIsoDate(d), std::string("2023-01-01"));
  EXPECT_TRUE(ParseIsoDate("2024-02-29", d));
  EXPECT_EQ(d.day, 29);
  EXPECT_FALSE(ParseIsoDate("2023-02-29", d));
  EXPECT_FALSE(ParseIsoDate("2023-13", d));
  EXPECT_FALSE(ParseIsoDate("23-01-01", d));
  EXPECT_FALSE(ParseIsoDate("", d));
  EXPECT_EQ(DaysInMonth(2023, 2), 28);
  EXPECT_EQ(DaysInMonth(2000, 2), 29);

  const DateRange r{{2023, 1, 1}, {2024, 1, 1}};
  EXPECT_TRUE(r.contains(CivilDate{2023, 1, 1}));
  EXPECT_TRUE(r.contains(CivilDate{2023, 12, 31}));
  EXPECT_FALSE(r.contains(CivilDate{2024, 1, 1}));

  const MonthFilter summer{5, 9};
  EXPECT_TRUE(summer.contains(5));
  EXPECT_TRUE(summer.contains(9));
  EXPECT_FALSE(summer.contains(10));

  const MonthFilter winter{11, 2};
  EXPECT_TRUE(winter.contains(12));
  EXPECT_TRUE(winter.contains(1));
  EXPECT_FALSE(winter.contains(5));
}

void TestJsonRoundTrip()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"a\":[1,2.5,null,true],\"s\":\"x\\u00e9\\n\"}", v, err));
  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isArray() && a->arrayValue.size() == 4);
  EXPECT_EQ(a->arrayValue[1].numberValue, 2.5);
  EXPECT_TRUE(a->arrayValue[2].isNull());
  const JsonValue* s = FindJsonMember(v, "s");
  ASSERT_TRUE(s && s->isString());
  EXPECT_EQ(s->stringValue, std::string("x\xc3\xa9\n"));

  EXPECT_FALSE(ParseJson("{\"a\":}", v, err));
  EXPECT_FALSE(ParseJson("[1,2", v, err));

  std::ostringstream oss;
  JsonWriter w(oss, JsonWriteOptions{false, 0});
  w.beginObject();
  w.key("x");
  w.numberValue(0.1);
  w.key("y");
  w.nullValue();
  w.endObject();
  EXPECT_TRUE(w.ok());
  EXPECT_EQ(oss.str(), std::string("{\"x\":0.1,\"y\":null}"));
}

void TestChecksums()
{
  const std::string check = "123456789";
  EXPECT_EQ(Crc32(reinterpret_cast<const std::uint8_t*>(check.data()), check.size()), 0xCBF43926u);
  const std::string wiki = "Wikipedia";
  EXPECT_EQ(Adler32(reinterpret_cast<const std::uint8_t*>(wiki.data()), wiki.size()), 0x11E60398u);
  EXPECT_EQ(Adler32(nullptr, 0), 1u);
}

void TestPointInPolygonEdges()
{
  GeoPolygon p = Box(0.0, 0.0, 1.0, 1.0);
  p.holes.push_back(Box(0.4, 0.4, 0.6, 0.6).outer);

  EXPECT_TRUE(PointInPolygon(p, GeoPoint{0.2, 0.2}));
  EXPECT_TRUE(PointInPolygon(p, GeoPoint{0.0, 0.5}));  // outer edge
  EXPECT_TRUE(PointInPolygon(p, GeoPoint{1.0, 1.0}));  // vertex
  EXPECT_FALSE(PointInPolygon(p, GeoPoint{0.5, 0.5})); // inside hole
  EXPECT_TRUE(PointInPolygon(p, GeoPoint{0.4, 0.5}));  // hole edge
  EXPECT_FALSE(PointInPolygon(p, GeoPoint{1.5, 0.5}));
}

void TestSimplifyKeepsBoundsAndValidity()
{
  // A noisy ~10 km circle around Chennai.
  GeoRing ring;
  const int n = 180;
  for (int i = 0; i < n; ++i) {
    const double t = 2.0 * 3.14159265358979323846 * static_cast<double>(i) / n;
    const double r = 0.09 + ((i % 3 == 0) ? 0.002 : 0.0);
    ring.push_back(GeoPoint{80.27 + r * std::cos(t), 13.08 + r * std::sin(t)});
  }
  CloseRing(ring);
  ASSERT_TRUE(IsValidRing(ring));

  const GeoBounds before = ComputeBounds(ring);
  for (double tol : {0.0, 50.0, 500.0, 1000.0, 5000.0}) {
    const GeoRing s = SimplifyRing(ring, tol);
    EXPECT_TRUE(IsValidRing(s));
    EXPECT_TRUE(s.size() <= ring.size());
    const GeoBounds after = ComputeBounds(s);
    EXPECT_TRUE(after.minLon >= before.minLon && after.maxLon <= before.maxLon);
    EXPECT_TRUE(after.minLat >= before.minLat && after.maxLat <= before.maxLat);
  }

  const GeoRing same = SimplifyRing(ring, 0.0);
  ASSERT_TRUE(same.size() == ring.size());
  for (std::size_t i = 0; i < ring.size(); ++i) {
    EXPECT_EQ(same[i].lon, ring[i].lon);
    EXPECT_EQ(same[i].lat, ring[i].lat);
  }
  EXPECT_TRUE(SimplifyRing(ring, 1000.0).size() < ring.size());
}

void TestBoundaryGeoJson()
{
  const std::string text =
      "{\"type\":\"FeatureCollection\",\"features\":["
      "{\"type\":\"Feature\",\"properties\":{\"NAME_1\":\"Tamil Nadu\",\"ID\":31},"
      "\"geometry\":{\"type\":\"Polygon\",\"coordinates\":[[[80,13],[81,13],[81,14],[80,14]]]}},"
      "{\"type\":\"Feature\",\"properties\":{},\"geometry\":null},"
      "{\"type\":\"Feature\",\"properties\":{\"NAME_1\":\"Islands\"},"
      "\"geometry\":{\"type\":\"MultiPolygon\",\"coordinates\":[[[[82,13],[83,13],[83,14],[82,13]]],"
      "[[[84,13],[85,13],[85,14],[84,13]]]]}}]}";
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(text, root, err));

  BoundaryDataset ds;
  ASSERT_TRUE(BoundaryDatasetFromGeoJson(root, ds, err));
  ASSERT_TRUE(ds.features.size() == 2);
  EXPECT_EQ(ds.features[0].properties.at("NAME_1"), std::string("Tamil Nadu"));
  EXPECT_EQ(ds.features[0].properties.at("ID"), std::string("31"));
  // Open ring gets closed.
  EXPECT_EQ(ds.features[0].geometry.polygons[0].outer.size(), static_cast<std::size_t>(5));
  EXPECT_EQ(ds.features[1].geometry.polygons.size(), static_cast<std::size_t>(2));

  const std::vector<std::size_t> hit = ds.queryPoint(GeoPoint{80.5, 13.5});
  ASSERT_TRUE(hit.size() == 1);
  EXPECT_EQ(hit[0], static_cast<std::size_t>(0));
  EXPECT_TRUE(ds.queryPoint(GeoPoint{81.5, 13.5}).empty());

  JsonValue bad;
  ASSERT_TRUE(ParseJson("{\"type\":\"FeatureCollection\",\"features\":[{\"type\":\"Feature\","
                        "\"geometry\":{\"type\":\"Point\",\"coordinates\":[1,2]}}]}",
                        bad, err));
  EXPECT_FALSE(BoundaryDatasetFromGeoJson(bad, ds, err));
}

void TestResolveRegion()
{
  const BoundaryDataset ds = TestBoundaries();

  ResolvedRegion r;
  PipelineError err;
  ASSERT_TRUE(ResolveRegion(ds, GeoPoint{80.25, 13.05}, 1000.0, r, err));
  ASSERT_TRUE(r.featureIndices.size() == 1);
  EXPECT_EQ(r.featureIndices[0], static_cast<std::size_t>(0));
  EXPECT_FALSE(r.empty());
  EXPECT_TRUE(r.bounds.minLon >= 80.20 && r.bounds.maxLon <= 80.30);

  // On the shared edge both neighbours contain the point.
  ASSERT_TRUE(ResolveRegion(ds, GeoPoint{80.30, 13.05}, 0.0, r, err));
  EXPECT_EQ(r.featureIndices.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(r.geometry.polygons.size(), static_cast<std::size_t>(2));

  // Inside the dataset extent, but in the gap between East and Far.
  PipelineError gap;
  EXPECT_FALSE(ResolveRegion(ds, GeoPoint{80.45, 13.05}, 1000.0, r, gap));
  EXPECT_EQ(gap.kind, PipelineErrorKind::RegionNotFound);
  EXPECT_EQ(gap.stage, std::string("region"));

  // Far from every feature: still "no region", not a malformed input.
  PipelineError outside;
  EXPECT_FALSE(ResolveRegion(ds, GeoPoint{10.0, 10.0}, 1000.0, r, outside));
  EXPECT_EQ(outside.kind, PipelineErrorKind::RegionNotFound);

  BoundaryDataset single;
  single.features.push_back(Feature("Square", Box(80.0, 13.0, 81.0, 14.0)));
  PipelineError lone;
  EXPECT_FALSE(ResolveRegion(single, GeoPoint{10.0, 10.0}, 1000.0, r, lone));
  EXPECT_EQ(lone.kind, PipelineErrorKind::RegionNotFound);

  PipelineError nan;
  EXPECT_FALSE(ResolveRegion(ds, GeoPoint{std::nan(""), 13.05}, 1000.0, r, nan));
  EXPECT_EQ(nan.kind, PipelineErrorKind::InvalidInput);

  PipelineError tol;
  EXPECT_FALSE(ResolveRegion(ds, GeoPoint{80.25, 13.05}, -1.0, r, tol));
  EXPECT_EQ(tol.kind, PipelineErrorKind::InvalidConfig);
}

void TestRasterGridAndResample()
{
  GeoBounds b;
  b.expand(GeoPoint{80.20, 13.00});
  b.expand(GeoPoint{80.30, 13.10});

  const GridSpec g = MakeGridForBounds(b, 1000.0);
  EXPECT_TRUE(g.width >= 10 && g.width <= 12);
  EXPECT_TRUE(g.height >= 11 && g.height <= 13);
  EXPECT_NEAR(EstimatePixelCount(b, 1000.0), static_cast<double>(g.cellCount()), 2.0 * (g.width + g.height));
  EXPECT_TRUE(std::isinf(EstimatePixelCount(GeoBounds{}, 1000.0)));

  // Destination cells outside the source extent (east of 80.25) come back invalid.
  GridSpec small = SourceGrid();
  small.width = 10;
  const Raster src = Uniform(small, 7.0);
  const Raster dst = ResampleNearest(src, g);
  EXPECT_EQ(dst.cells.size(), g.cellCount());
  EXPECT_TRUE(dst.at(0, 0).has_value());
  EXPECT_FALSE(dst.at(g.width - 1, 0).has_value());
}

void TestRasterJsonRoundTrip()
{
  Raster r = Uniform(SourceGrid(), 1.5);
  r.cells[3].reset();
  const fs::path p = MakeTempPath("uhi_raster") += ".json";

  std::string err;
  ASSERT_TRUE(WriteRasterJsonFile(p.string(), r, err));
  Raster back;
  ASSERT_TRUE(ReadRasterJsonFile(p.string(), back, err));
  EXPECT_TRUE(SameCells(r, back));

  std::error_code ec;
  fs::remove(p, ec);

  JsonValue bad;
  ASSERT_TRUE(ParseJson("{\"grid\":{\"origin_lon\":0,\"origin_lat\":0,\"pixel_width_deg\":1,"
                        "\"pixel_height_deg\":1,\"width\":2,\"height\":2},\"values\":[1,2,3]}",
                        bad, err));
  EXPECT_FALSE(RasterFromJson(bad, back, err));
}

void TestClassificationBoundaries()
{
  const std::array<double, 5> cuts = ClassifyConfig{}.cutPoints;
  EXPECT_EQ(ClassifyUhiIndex(-0.0001, cuts), 0);
  EXPECT_EQ(ClassifyUhiIndex(0.0, cuts), 1);
  EXPECT_EQ(ClassifyUhiIndex(0.0049999, cuts), 1);
  EXPECT_EQ(ClassifyUhiIndex(0.005, cuts), 2);
  EXPECT_EQ(ClassifyUhiIndex(0.010, cuts), 3);
  EXPECT_EQ(ClassifyUhiIndex(0.015, cuts), 4);
  EXPECT_EQ(ClassifyUhiIndex(0.020, cuts), 5);
  EXPECT_EQ(ClassifyUhiIndex(3.0, cuts), 5);

  int prev = ClassifyUhiIndex(0.0, cuts);
  for (int i = 1; i <= 3000; ++i) {
    const int c = ClassifyUhiIndex(static_cast<double>(i) * 1e-5, cuts);
    EXPECT_TRUE(c >= prev);
    prev = c;
  }

  EXPECT_EQ(std::string(UhiClassName(UhiClass::VeryStrong)), std::string("Very Strong"));
}

void TestCalibrationAndMedian()
{
  ThermalConfig tc;
  Acquisition a = ThermalScene("id", {2023, 5, 1}, 1.0, 0.0);
  a.properties[tc.scaleProperty] = 1.0;
  a.properties[tc.offsetProperty] = 0.0;
  Raster raw = Uniform(SourceGrid(), 12345.0);
  raw.cells[0].reset();
  a.bands[tc.band] = raw;

  Raster out;
  PipelineError err;
  ASSERT_TRUE(CalibrateAcquisition(a, tc, out, err));
  EXPECT_TRUE(SameCells(out, raw));

  a.properties.erase(tc.offsetProperty);
  EXPECT_FALSE(CalibrateAcquisition(a, tc, out, err));
  EXPECT_EQ(err.kind, PipelineErrorKind::MissingCalibrationCoefficient);

  std::vector<double> odd = {14.0, 10.0, 12.0};
  EXPECT_EQ(MedianOfValues(odd, MedianTiePolicy::MeanOfMiddle), Cell(12.0));
  std::vector<double> even = {14.0, 10.0};
  EXPECT_EQ(MedianOfValues(even, MedianTiePolicy::MeanOfMiddle), Cell(12.0));
  even = {14.0, 10.0};
  EXPECT_EQ(MedianOfValues(even, MedianTiePolicy::LowerMiddle), Cell(10.0));
  std::vector<double> none;
  EXPECT_FALSE(MedianOfValues(none, MedianTiePolicy::MeanOfMiddle).has_value());

  // [10, invalid, 14] at one pixel; a pixel invalid everywhere stays invalid.
  GridSpec g;
  g.width = 2;
  g.height = 1;
  std::vector<Raster> layers(3, Raster::Invalid(g));
  layers[0].cells[0] = 10.0;
  layers[2].cells[0] = 14.0;
  const Raster m = MedianComposite(layers, g, MedianTiePolicy::MeanOfMiddle);
  EXPECT_EQ(m.cells[0], Cell(12.0));
  EXPECT_FALSE(m.cells[1].has_value());
}

void TestLabelMode()
{
  std::vector<double> v = {6.0, 1.0, 6.0, 1.0, 3.0};
  EXPECT_EQ(LabelMode(v), std::optional<double>(1.0));
  v = {6.0, 6.0, 1.0};
  EXPECT_EQ(LabelMode(v), std::optional<double>(6.0));
  v.clear();
  EXPECT_FALSE(LabelMode(v).has_value());
}

void TestUrbanMaskNoDataIsInvalid()
{
  const BoundaryDataset ds = TestBoundaries();
  const PipelineConfig cfg = TestConfig();
  ResolvedRegion roi;
  PipelineError err;
  ASSERT_TRUE(ResolveRegion(ds, cfg.region.center, 0.0, roi, err));
  const GridSpec grid = MakeGridForBounds(roi.bounds, 1000.0);

  // Observations only in the west half; the east half has no valid label at all.
  Raster labels = LabelsSplit(1.0);
  for (int y = 0; y < labels.grid.height; ++y) {
    for (int x = 0; x < labels.grid.width; ++x) {
      if (labels.grid.cellCenter(x, y).lon > 80.25) labels.at(x, y).reset();
    }
  }
  RasterStack stack;
  stack.items.push_back(LandCoverScene("a", {2023, 6, 1}, labels));

  UrbanMaskResult m;
  ASSERT_TRUE(BuildUrbanMask(stack, cfg, roi, grid, m, err));
  EXPECT_TRUE(m.urbanPixels > 0);
  EXPECT_EQ(m.otherPixels, static_cast<std::size_t>(0));
  EXPECT_TRUE(m.noDataPixels > 0);
  EXPECT_EQ(m.mask.validCount(), m.urbanPixels);
  EXPECT_TRUE(m.warnings.empty());

  // Nothing in the window: all invalid plus a warning, not an error.
  RasterStack empty;
  ASSERT_TRUE(BuildUrbanMask(empty, cfg, roi, grid, m, err));
  EXPECT_EQ(m.mask.validCount(), static_cast<std::size_t>(0));
  EXPECT_EQ(m.warnings.size(), static_cast<std::size_t>(1));
}

void TestMaskingIdempotentAndCommutes()
{
  GridSpec g;
  g.width = 4;
  g.height = 1;
  Raster index = Raster::Invalid(g);
  index.cells = {Cell(-0.01), Cell(0.007), Cell(0.03), Cell()};
  Raster urban = Raster::Invalid(g);
  urban.cells = {Cell(1.0), Cell(0.0), Cell(1.0), Cell(1.0)};

  const ClassifyConfig cc;
  const Raster a = ApplyMask(ClassifyUhiRaster(index, cc), urban);
  const Raster b = ClassifyUhiRaster(ApplyMask(index, urban), cc);
  EXPECT_TRUE(SameCells(a, b));
  EXPECT_TRUE(SameCells(ApplyMask(a, urban), a));

  EXPECT_EQ(a.cells[0], Cell(0.0)); // negative index: valid background
  EXPECT_FALSE(a.cells[1].has_value());
  EXPECT_EQ(a.cells[2], Cell(5.0));
  EXPECT_FALSE(a.cells[3].has_value());
}

void TestIndexScenario()
{
  GridSpec g;
  g.width = 2;
  g.height = 1;
  Raster lst = Raster::Invalid(g);
  lst.cells = {Cell(301.5), Cell(301.5)};
  Raster urban = Raster::Invalid(g);
  urban.cells = {Cell(1.0), Cell(0.0)};

  ScalarStatistic mean;
  mean.value = 300.0;
  Raster index;
  PipelineError err;
  ASSERT_TRUE(ComputeUhiIndex(lst, mean, index, err));
  EXPECT_NEAR(*index.cells[0], 0.005, 1e-15);

  const Raster classes = ApplyMask(ClassifyUhiRaster(index, ClassifyConfig{}), urban);
  EXPECT_EQ(classes.cells[0], Cell(2.0));
  EXPECT_FALSE(classes.cells[1].has_value());

  ScalarStatistic zero;
  zero.value = 0.0;
  EXPECT_FALSE(ComputeUhiIndex(lst, zero, index, err));
  EXPECT_EQ(err.kind, PipelineErrorKind::DivisionByZeroMean);

  ScalarStatistic missing;
  PipelineError err2;
  EXPECT_FALSE(ComputeUhiIndex(lst, missing, index, err2));
  EXPECT_EQ(err2.kind, PipelineErrorKind::DivisionByZeroMean);
}

void TestRegionMeanBudget()
{
  const BoundaryDataset ds = TestBoundaries();
  ResolvedRegion roi;
  PipelineError err;
  ASSERT_TRUE(ResolveRegion(ds, GeoPoint{80.25, 13.05}, 0.0, roi, err));

  const GridSpec grid = MakeGridForBounds(roi.bounds, 1000.0);
  const Raster lst = ClipToRegion(Uniform(grid, 300.0), roi.geometry);

  StatisticConfig sc;
  sc.scaleMeters = 1000.0;
  ScalarStatistic s;
  ASSERT_TRUE(ComputeRegionMean(lst, roi, sc, s, err));
  ASSERT_TRUE(s.value.has_value());
  EXPECT_EQ(*s.value, 300.0);
  EXPECT_TRUE(s.sampledPixels > 0);
  EXPECT_EQ(s.reducer, std::string("mean"));

  // The ceiling depends on geometry and scale only: an all-invalid raster fails too.
  sc.maxPixels = 10.0;
  PipelineError budget;
  EXPECT_FALSE(ComputeRegionMean(Raster::Invalid(grid), roi, sc, s, budget));
  EXPECT_EQ(budget.kind, PipelineErrorKind::PixelBudgetExceeded);
  EXPECT_EQ(budget.stage, std::string("mean"));
  EXPECT_FALSE(budget.context.empty());
}

void TestPipelineEndToEnd()
{
  const BoundaryDataset ds = TestBoundaries();
  const MemoryCatalog cat = TestCatalog();
  const CountingCatalog counting(cat);
  std::ostringstream log;
  const Pipeline p(TestConfig(), ds, counting, &log);

  // Wiring alone touches no data.
  EXPECT_EQ(counting.queries, 0);
  EXPECT_FALSE(p.heat().evaluated());

  PipelineResult r;
  PipelineError err;
  ASSERT_TRUE(p.materialize(r, err));
  EXPECT_EQ(counting.queries, 2);

  ASSERT_TRUE(r.urban.acquisitionIds.size() == 3);
  EXPECT_EQ(r.thermal.usedIds, (std::vector<std::string>{"lst_a", "lst_b"}));
  EXPECT_TRUE(r.warnings.empty());

  // Median of 300 K and 301 K everywhere.
  ASSERT_TRUE(r.heat.mean.value.has_value());
  EXPECT_EQ(*r.heat.mean.value, 300.5);

  EXPECT_TRUE(r.urban.urbanPixels > 0);
  EXPECT_TRUE(r.urban.otherPixels > 0);
  EXPECT_EQ(r.heat.classCounts[1], r.urban.urbanPixels);
  for (std::size_t i = 0; i < r.heat.classified.cells.size(); ++i) {
    const Cell& m = r.urban.mask.cells[i];
    const Cell& c = r.heat.classified.cells[i];
    EXPECT_EQ(c.has_value(), m.has_value() && *m == 1.0);
    if (c) EXPECT_EQ(*c, 1.0);
  }

  EXPECT_EQ(r.exportRequest.crs, std::string("EPSG:4326"));
  EXPECT_EQ(r.exportRequest.description, std::string("UHI_Classes_Landsat8_Export"));
  EXPECT_TRUE(log.str().find("[thermal]") != std::string::npos);

  // Evaluating again reuses the memoized stages.
  ASSERT_TRUE(p.materialize(r, err));
  EXPECT_EQ(counting.queries, 2);

  PipelineConfig lower = TestConfig();
  lower.thermal.medianTie = MedianTiePolicy::LowerMiddle;
  const Pipeline p2(lower, ds, cat);
  ASSERT_TRUE(p2.materialize(r, err));
  EXPECT_EQ(*r.heat.mean.value, 300.0);
}

void TestPipelineBudgetBeforeData()
{
  const BoundaryDataset ds = TestBoundaries();
  const MemoryCatalog cat = TestCatalog();
  const CountingCatalog counting(cat);

  PipelineConfig cfg = TestConfig();
  cfg.statistic.maxPixels = 10.0;
  const Pipeline p(cfg, ds, counting);

  PipelineResult r;
  PipelineError err;
  EXPECT_FALSE(p.materialize(r, err));
  EXPECT_EQ(err.kind, PipelineErrorKind::PixelBudgetExceeded);
  EXPECT_EQ(err.stage, std::string("mean"));
  EXPECT_EQ(counting.queries, 0);
  EXPECT_TRUE(FormatPipelineError(err).find("max_pixels=") != std::string::npos);
}

void TestPipelineRegionNotFound()
{
  const BoundaryDataset ds = TestBoundaries();
  const MemoryCatalog cat = TestCatalog();
  PipelineConfig cfg = TestConfig();
  cfg.region.center = GeoPoint{80.45, 13.05};
  const Pipeline p(cfg, ds, cat);

  PipelineResult r;
  PipelineError err;
  EXPECT_FALSE(p.materialize(r, err));
  EXPECT_EQ(err.kind, PipelineErrorKind::RegionNotFound);
  EXPECT_EQ(FormatPipelineError(err).rfind("[region] RegionNotFound:", 0), static_cast<std::size_t>(0));
}

void TestPipelineMissingCalibration()
{
  const BoundaryDataset ds = TestBoundaries();
  MemoryCatalog cat = TestCatalog();
  Acquisition bad = ThermalScene("lst_nocal", {2023, 6, 1}, 2.0, 500.0);
  bad.properties.erase("TEMPERATURE_ADD_BAND_ST_B10");
  cat.add(kThermal, bad);
  // Filtered out by cloud cover, so its missing coefficient never matters.
  Acquisition cloudy = ThermalScene("lst_cloudy_nocal", {2023, 6, 2}, 50.0, 500.0);
  cloudy.properties.erase("TEMPERATURE_MULT_BAND_ST_B10");
  cat.add(kThermal, cloudy);

  {
    const Pipeline p(TestConfig(), ds, cat);
    PipelineResult r;
    PipelineError err;
    EXPECT_FALSE(p.materialize(r, err));
    EXPECT_EQ(err.kind, PipelineErrorKind::MissingCalibrationCoefficient);
    EXPECT_EQ(err.stage, std::string("thermal"));
  }

  {
    PipelineConfig cfg = TestConfig();
    cfg.thermal.missingCalibration = MissingCalibrationPolicy::Drop;
    const Pipeline p(cfg, ds, cat);
    PipelineResult r;
    PipelineError err;
    ASSERT_TRUE(p.materialize(r, err));
    EXPECT_EQ(r.thermal.droppedIds, (std::vector<std::string>{"lst_nocal"}));
    EXPECT_EQ(r.thermal.usedIds.size(), static_cast<std::size_t>(2));
    EXPECT_EQ(r.warnings.size(), static_cast<std::size_t>(1));
  }
}

void TestPipelineEmptyWindowAndZeroMean()
{
  const BoundaryDataset ds = TestBoundaries();

  {
    const MemoryCatalog cat = TestCatalog();
    PipelineConfig cfg = TestConfig();
    cfg.window.dates = DateRange{{2019, 1, 1}, {2020, 1, 1}};
    const Pipeline p(cfg, ds, cat);
    PipelineResult r;
    PipelineError err;
    ASSERT_TRUE(p.materialize(r, err));
    EXPECT_EQ(r.heat.classified.validCount(), static_cast<std::size_t>(0));
    EXPECT_EQ(r.urban.mask.validCount(), static_cast<std::size_t>(0));
    EXPECT_FALSE(r.heat.mean.value.has_value());
    EXPECT_TRUE(r.warnings.size() >= 2);
  }

  {
    MemoryCatalog cat;
    cat.add(kLandCover, LandCoverScene("lc", {2023, 6, 1}, Uniform(SourceGrid(), 6.0)));
    // Calibrates to exactly 0 K.
    cat.add(kThermal, ThermalScene("lst_zero", {2023, 6, 1}, 1.0, -200.0));
    const Pipeline p(TestConfig(), ds, cat);
    PipelineResult r;
    PipelineError err;
    EXPECT_FALSE(p.materialize(r, err));
    EXPECT_EQ(err.kind, PipelineErrorKind::DivisionByZeroMean);
  }
}

void TestDeferredRunsOnce()
{
  int calls = 0;
  const Deferred<int> d([&calls](int& out, PipelineError&) {
    ++calls;
    out = 42;
    return true;
  });
  const Deferred<int> copy = d;
  PipelineError err;
  EXPECT_EQ(calls, 0);
  ASSERT_TRUE(copy.evaluate(err));
  ASSERT_TRUE(d.evaluate(err));
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(d.value(), 42);

  int failCalls = 0;
  const Deferred<int> f([&failCalls](int&, PipelineError& e) {
    ++failCalls;
    return e.set(PipelineErrorKind::InvalidInput, "test", "boom");
  });
  PipelineError e1;
  PipelineError e2;
  EXPECT_FALSE(f.evaluate(e1));
  EXPECT_FALSE(f.evaluate(e2));
  EXPECT_EQ(failCalls, 1);
  EXPECT_EQ(e2.message, std::string("boom"));

  const Deferred<int> undefined{};
  EXPECT_FALSE(undefined.evaluate(err));
}

void TestConfigJson()
{
  PipelineConfig cfg;
  cfg.region.center = GeoPoint{77.5946, 12.9716};
  cfg.window.months = MonthFilter{11, 2};
  cfg.thermal.maxCloudCover = 20.0;
  cfg.thermal.missingCalibration = MissingCalibrationPolicy::Drop;
  cfg.classify.cutPoints = {0.0, 0.01, 0.02, 0.03, 0.04};

  const std::string text = PipelineConfigToJson(cfg);
  ASSERT_TRUE(!text.empty());
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(text, root, err));
  PipelineConfig back;
  ASSERT_TRUE(ApplyPipelineConfigJson(root, back, err));
  EXPECT_EQ(PipelineConfigToJson(back), text);
  EXPECT_EQ(back.thermal.missingCalibration, MissingCalibrationPolicy::Drop);
  EXPECT_EQ(back.window.months.startMonth, 11);

  // Merge: only the named key changes.
  PipelineConfig merged;
  ASSERT_TRUE(ParseJson("{\"thermal\":{\"max_cloud_cover\":5}}", root, err));
  ASSERT_TRUE(ApplyPipelineConfigJson(root, merged, err));
  EXPECT_EQ(merged.thermal.maxCloudCover, 5.0);
  EXPECT_EQ(merged.landCover.urbanClass, 6);

  PipelineConfig untouched;
  ASSERT_TRUE(ParseJson("{\"region\":{\"simplify_tolerance_m\":\"far\"}}", root, err));
  EXPECT_FALSE(ApplyPipelineConfigJson(root, untouched, err));
  EXPECT_TRUE(err.find("simplify_tolerance_m") != std::string::npos);
  EXPECT_EQ(untouched.region.simplifyToleranceMeters, 1000.0);
}

void TestConfigValidation()
{
  PipelineError err;
  EXPECT_TRUE(ValidatePipelineConfig(PipelineConfig{}, err));

  PipelineConfig cuts;
  cuts.classify.cutPoints = {0.0, 0.01, 0.01, 0.02, 0.03};
  EXPECT_FALSE(ValidatePipelineConfig(cuts, err));
  EXPECT_EQ(err.kind, PipelineErrorKind::InvalidConfig);

  PipelineConfig window;
  window.window.dates = DateRange{{2024, 1, 1}, {2023, 1, 1}};
  EXPECT_FALSE(ValidatePipelineConfig(window, err));

  PipelineConfig crs;
  crs.exportCfg.crs = "EPSG:3857";
  EXPECT_FALSE(ValidatePipelineConfig(crs, err));

  PipelineConfig tol;
  tol.region.simplifyToleranceMeters = -5.0;
  EXPECT_FALSE(ValidatePipelineConfig(tol, err));
}

void TestDirectoryCatalog()
{
  const fs::path dir = MakeTempPath("uhi_catalog");
  std::error_code ec;
  fs::create_directories(dir / "rasters", ec);
  ASSERT_TRUE(!ec);

  GridSpec g;
  g.originLon = 80.0;
  g.originLat = 14.0;
  g.pixelWidthDeg = 0.5;
  g.pixelHeightDeg = 0.5;
  g.width = 2;
  g.height = 2;
  Raster r = Uniform(g, 400.0);
  r.cells[1].reset();
  std::string err;
  ASSERT_TRUE(WriteRasterJsonFile((dir / "rasters" / "a.json").string(), r, err));

  ASSERT_TRUE(WriteText(dir / "catalog.json",
                        "{\"collections\":{\"LANDSAT/LC08/C02/T1_L2\":["
                        "{\"id\":\"a\",\"date\":\"2023-05-02\",\"properties\":{\"CLOUD_COVER\":4.5},"
                        "\"bands\":{\"ST_B10\":\"rasters/a.json\"}},"
                        "{\"id\":\"b\",\"date\":\"2023-06-02\",\"properties\":{\"CLOUD_COVER\":40},"
                        "\"bands\":{\"ST_B10\":\"rasters/missing.json\"}}]}}"));

  DirectoryCatalog cat;
  ASSERT_TRUE(cat.open(dir.string(), err));
  EXPECT_EQ(cat.acquisitionCount(), static_cast<std::size_t>(2));

  // The cloudy element's raster does not exist, but it is never read.
  CollectionQuery q;
  q.collection = kThermal;
  q.band = "ST_B10";
  q.below = PropertyLessThan{"CLOUD_COVER", 10.0};
  RasterStack stack;
  PipelineError perr;
  ASSERT_TRUE(cat.query(q, stack, perr));
  ASSERT_TRUE(stack.items.size() == 1);
  EXPECT_EQ(stack.items[0].id, std::string("a"));
  const Raster* band = stack.items[0].band("ST_B10");
  ASSERT_TRUE(band != nullptr);
  EXPECT_TRUE(SameCells(*band, r));

  q.below.reset();
  PipelineError missing;
  EXPECT_FALSE(cat.query(q, stack, missing));
  EXPECT_EQ(missing.kind, PipelineErrorKind::Io);

  fs::remove_all(dir, ec);
}

void TestExportGridMemoryCap()
{
  // One degree square at 1 m: ~1.2e10 cells, under the default ceiling of 1e13.
  ResolvedRegion roi;
  roi.geometry.polygons.push_back(Box(80.0, 13.0, 81.0, 14.0));
  roi.bounds = ComputeBounds(roi.geometry);

  GridSpec coarse = MakeGridForBounds(roi.bounds, 10000.0);
  ExportConfig ec;
  ec.scaleMeters = 1.0;
  const ExportRequest req = MakeExportRequest(Uniform(coarse, 1.0), roi, ec);
  EXPECT_TRUE(EstimatePixelCount(roi.bounds, 1.0) <= req.maxPixels);

  Raster out;
  PipelineError err;
  EXPECT_FALSE(PrepareExportRaster(req, out, err));
  EXPECT_EQ(err.kind, PipelineErrorKind::InvalidConfig);
  EXPECT_EQ(err.stage, std::string("export"));
  EXPECT_TRUE(out.cells.empty());

  // Sub-millimetre scales saturate instead of overflowing the grid dimensions.
  const GridSpec tiny = MakeGridForBounds(roi.bounds, 1e-6);
  EXPECT_TRUE(tiny.width > 0 && tiny.height > 0);
  EXPECT_TRUE(static_cast<double>(tiny.cellCount()) > kMaxGridCells);

  // The pipeline reports the same cap for the working grid.
  const BoundaryDataset ds = TestBoundaries();
  const MemoryCatalog cat = TestCatalog();
  PipelineConfig cfg = TestConfig();
  cfg.statistic.scaleMeters = 0.5;
  const Pipeline p(cfg, ds, cat);
  PipelineResult r;
  PipelineError perr;
  EXPECT_FALSE(p.materialize(r, perr));
  EXPECT_EQ(perr.kind, PipelineErrorKind::InvalidConfig);
  EXPECT_EQ(perr.stage, std::string("grid"));
}

void TestFileExportSink()
{
  const BoundaryDataset ds = TestBoundaries();
  const MemoryCatalog cat = TestCatalog();
  const Pipeline p(TestConfig(), ds, cat);

  const fs::path dir = MakeTempPath("uhi_export");
  FileExportSink sink(dir.string());
  PipelineError err;
  ASSERT_TRUE(p.exportTo(sink, err));
  ASSERT_TRUE(sink.writtenFiles().size() == 3);

  const fs::path base = dir / "UrbanHeat" / "UHI_Classes_Landsat8_Export";
  EXPECT_TRUE(fs::exists(fs::path(base) += ".json"));
  const std::string csv = ReadText(fs::path(base) += ".csv");
  EXPECT_EQ(csv.rfind("x,y,lon,lat,class\n", 0), static_cast<std::size_t>(0));
  EXPECT_TRUE(csv.find(",1\n") != std::string::npos);

  const std::string png = ReadText(fs::path(base) += ".png");
  ASSERT_TRUE(png.size() > 8);
  EXPECT_EQ(png.substr(1, 3), std::string("PNG"));

  JsonValue meta;
  std::string jerr;
  ASSERT_TRUE(ReadJsonFile((fs::path(base) += ".json").string(), meta, jerr));
  const JsonValue* legend = FindJsonMember(meta, "legend");
  ASSERT_TRUE(legend && legend->isArray() && legend->arrayValue.size() == 5);
  const JsonValue* label = FindJsonMember(legend->arrayValue[4], "label");
  ASSERT_TRUE(label && label->isString());
  EXPECT_EQ(label->stringValue, std::string("Extreme"));

  // Export ceiling is checked before anything is written.
  ExportRequest req = p.exportRequest().value();
  req.maxPixels = 1.0;
  const fs::path dir2 = MakeTempPath("uhi_export_budget");
  FileExportSink sink2(dir2.string());
  PipelineError budget;
  EXPECT_FALSE(sink2.submit(req, budget));
  EXPECT_EQ(budget.kind, PipelineErrorKind::PixelBudgetExceeded);
  EXPECT_EQ(budget.stage, std::string("export"));
  EXPECT_FALSE(fs::exists(dir2));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

void TestSideOutputs()
{
  const BoundaryDataset ds = TestBoundaries();
  const MemoryCatalog cat = TestCatalog();
  const Pipeline p(TestConfig(), ds, cat);
  PipelineResult r;
  PipelineError err;
  ASSERT_TRUE(p.materialize(r, err));

  const RgbImage classes = RenderClassImage(r.heat.classified);
  EXPECT_EQ(classes.width, r.grid.width);
  EXPECT_EQ(classes.rgb.size(), r.grid.cellCount() * 3u);

  const RgbImage temp = RenderTemperatureImage(r.thermal.lst);
  EXPECT_EQ(temp.height, r.grid.height);

  const fs::path dir = MakeTempPath("uhi_side");
  std::error_code ec;
  fs::create_directories(dir, ec);
  std::string werr;
  EXPECT_TRUE(WritePng((dir / "mask.png").string(), RenderMaskImage(r.urban.mask), werr));
  EXPECT_TRUE(WriteRegionGeoJsonFile((dir / "region.geojson").string(), r.region, werr));
  EXPECT_TRUE(WriteRunReportJsonFile((dir / "summary.json").string(), r, werr));

  JsonValue region;
  ASSERT_TRUE(ReadJsonFile((dir / "region.geojson").string(), region, werr));
  BoundaryDataset reread;
  ASSERT_TRUE(BoundaryDatasetFromGeoJson(region, reread, werr));
  EXPECT_EQ(reread.features.size(), static_cast<std::size_t>(1));

  JsonValue summary;
  ASSERT_TRUE(ReadJsonFile((dir / "summary.json").string(), summary, werr));
  const JsonValue* mean = FindJsonMember(summary, "mean_temperature");
  ASSERT_TRUE(mean != nullptr);
  const JsonValue* value = FindJsonMember(*mean, "value");
  ASSERT_TRUE(value && value->isNumber());
  EXPECT_EQ(value->numberValue, 300.5);

  RgbImage empty;
  EXPECT_FALSE(WritePng((dir / "empty.png").string(), empty, werr));

  fs::remove_all(dir, ec);
}

void TestLogTeeRotation()
{
  const fs::path dir = MakeTempPath("uhi_log");
  const fs::path log = dir / "run.log";

  for (int i = 0; i < 2; ++i) {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = log;
    opt.keepFiles = 2;
    std::string err;
    ASSERT_TRUE(tee.start(opt, err));
    std::cout << "run " << i << std::endl;
    tee.stop();
    EXPECT_FALSE(tee.active());
  }

  const std::string current = ReadText(log);
  EXPECT_TRUE(current.find("[OUT] run 1") != std::string::npos);
  const std::string previous = ReadText(fs::path(log) += ".1");
  EXPECT_TRUE(previous.find("[OUT] run 0") != std::string::npos);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

int main()
{
  TestDates();
  TestJsonRoundTrip();
  TestChecksums();
  TestPointInPolygonEdges();
  TestSimplifyKeepsBoundsAndValidity();
  TestBoundaryGeoJson();
  TestResolveRegion();
  TestRasterGridAndResample();
  TestRasterJsonRoundTrip();
  TestClassificationBoundaries();
  TestCalibrationAndMedian();
  TestLabelMode();
  TestUrbanMaskNoDataIsInvalid();
  TestMaskingIdempotentAndCommutes();
  TestIndexScenario();
  TestRegionMeanBudget();
  TestPipelineEndToEnd();
  TestPipelineBudgetBeforeData();
  TestPipelineRegionNotFound();
  TestPipelineMissingCalibration();
  TestPipelineEmptyWindowAndZeroMean();
  TestDeferredRunsOnce();
  TestConfigJson();
  TestConfigValidation();
  TestDirectoryCatalog();
  TestExportGridMemoryCap();
  TestFileExportSink();
  TestSideOutputs();
  TestLogTeeRotation();

  if (g_failures == 0) {
    std::cout << "uhi_tests: OK\n";
    return 0;
  }

  std::cerr << "uhi_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
