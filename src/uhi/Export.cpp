#include "uhi/Export.hpp"

#include "uhi/GeoJsonExport.hpp"
#include "uhi/Json.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace uhi {

const std::array<LegendEntry, 5>& UhiLegend()
{
  static const std::array<LegendEntry, 5> kLegend = {{
      {1, "Mild", "white", Rgb{255, 255, 255}},
      {2, "Moderate", "yellow", Rgb{255, 255, 0}},
      {3, "Strong", "orange", Rgb{255, 165, 0}},
      {4, "Very Strong", "red", Rgb{255, 0, 0}},
      {5, "Extreme", "darkred", Rgb{139, 0, 0}},
  }};
  return kLegend;
}

ExportRequest MakeExportRequest(const Raster& classified, const ResolvedRegion& roi, const ExportConfig& cfg)
{
  ExportRequest req;
  req.image = classified;
  req.region = roi.geometry;
  req.scaleMeters = cfg.scaleMeters;
  req.crs = cfg.crs;
  req.maxPixels = cfg.maxPixels;
  req.description = cfg.description;
  req.folder = cfg.folder;
  return req;
}

GridSpec ExportGrid(const ExportRequest& req)
{
  return MakeGridForBounds(ComputeBounds(req.region), req.scaleMeters, req.crs);
}

void WriteExportRequestJson(JsonWriter& w, const ExportRequest& req, bool includeValues)
{
  w.beginObject();
  w.key("description");
  w.stringValue(req.description);
  w.key("folder");
  w.stringValue(req.folder);
  w.key("scale_m");
  w.numberValue(req.scaleMeters);
  w.key("crs");
  w.stringValue(req.crs);
  w.key("max_pixels");
  w.numberValue(req.maxPixels);
  w.key("estimated_pixels");
  w.numberValue(EstimatePixelCount(ComputeBounds(req.region), req.scaleMeters));

  w.key("legend");
  w.beginArray();
  for (const LegendEntry& e : UhiLegend()) {
    w.beginObject();
    w.key("value");
    w.intValue(e.value);
    w.key("label");
    w.stringValue(e.label);
    w.key("color");
    w.stringValue(e.colorName);
    w.endObject();
  }
  w.endArray();

  w.key("region");
  WriteGeoJsonGeometry(w, req.region);

  w.key("image");
  w.beginObject();
  w.key("grid");
  WriteGridJson(w, req.image.grid);
  w.key("valid_pixels");
  w.intValue(static_cast<std::int64_t>(req.image.validCount()));
  if (includeValues) {
    w.key("values");
    w.beginArray();
    for (const Cell& c : req.image.cells) {
      if (c) {
        w.numberValue(*c);
      } else {
        w.nullValue();
      }
    }
    w.endArray();
  }
  w.endObject();

  w.endObject();
}

bool PrepareExportRaster(const ExportRequest& req, Raster& out, PipelineError& err)
{
  if (req.crs != "EPSG:4326") {
    err.set(PipelineErrorKind::InvalidConfig, "export", "unsupported CRS");
    err.with("crs", req.crs);
    return false;
  }

  const GeoBounds b = ComputeBounds(req.region);
  const double estimate = EstimatePixelCount(b, req.scaleMeters);
  if (!(estimate <= req.maxPixels)) {
    err.set(PipelineErrorKind::PixelBudgetExceeded, "export", "export would exceed the pixel ceiling");
    err.with("estimated_pixels", estimate).with("max_pixels", req.maxPixels).with("scale_m", req.scaleMeters);
    return false;
  }
  if (estimate > kMaxGridCells) {
    err.set(PipelineErrorKind::InvalidConfig, "export", "export grid too large to hold in memory");
    err.with("estimated_pixels", estimate).with("max_cells", kMaxGridCells).with("scale_m", req.scaleMeters);
    return false;
  }

  out = ClipToRegion(ResampleNearest(req.image, ExportGrid(req)), req.region);
  return true;
}

FileExportSink::FileExportSink(std::string dir) : m_dir(std::move(dir)) {}

namespace {

bool IoFail(PipelineError& err, const std::string& msg, const std::string& path)
{
  err.set(PipelineErrorKind::Io, "export", msg);
  err.with("path", path);
  return false;
}

} // namespace

bool FileExportSink::submit(const ExportRequest& req, PipelineError& err)
{
  m_written.clear();

  Raster img;
  if (!PrepareExportRaster(req, img, err)) return false;

  const std::filesystem::path folder = std::filesystem::path(m_dir) / req.folder;
  std::error_code ec;
  std::filesystem::create_directories(folder, ec);
  if (ec) return IoFail(err, "failed to create export folder: " + ec.message(), folder.string());

  const std::string base = (folder / req.description).string();
  std::vector<std::string> written;

  // Metadata describes the exported (resampled) grid.
  {
    ExportRequest meta = req;
    meta.image = img;
    const std::string path = base + ".json";
    std::ofstream f(path, std::ios::binary);
    if (!f) return IoFail(err, "failed to open file", path);
    JsonWriter w(f, JsonWriteOptions{true, 2});
    WriteExportRequestJson(w, meta, false);
    f << '\n';
    if (!w.ok()) return IoFail(err, w.error(), path);
    if (!f) return IoFail(err, "write failed", path);
    written.push_back(path);
  }

  {
    const std::string path = base + ".csv";
    std::ofstream f(path, std::ios::binary);
    if (!f) return IoFail(err, "failed to open file", path);
    f << "x,y,lon,lat,class\n";
    f << std::setprecision(10);
    for (int y = 0; y < img.grid.height; ++y) {
      for (int x = 0; x < img.grid.width; ++x) {
        const Cell& c = img.at(x, y);
        if (!c) continue;
        const GeoPoint p = img.grid.cellCenter(x, y);
        f << x << ',' << y << ',' << p.lon << ',' << p.lat << ',' << static_cast<int>(*c) << '\n';
      }
    }
    if (!f) return IoFail(err, "write failed", path);
    written.push_back(path);
  }

  {
    const std::string path = base + ".png";
    std::string pngErr;
    if (!WritePng(path, RenderClassImage(img), pngErr)) return IoFail(err, pngErr, path);
    written.push_back(path);
  }

  m_written = std::move(written);
  return true;
}

RgbImage RenderMaskImage(const Raster& mask)
{
  RgbImage img(mask.grid.width, mask.grid.height);
  for (int y = 0; y < mask.grid.height; ++y) {
    for (int x = 0; x < mask.grid.width; ++x) {
      const Cell& c = mask.at(x, y);
      if (!c) continue;
      img.set(x, y, *c != 0.0 ? Rgb{255, 255, 255} : Rgb{64, 64, 64});
    }
  }
  return img;
}

RgbImage RenderTemperatureImage(const Raster& lst)
{
  RgbImage img(lst.grid.width, lst.grid.height);
  double lo = 0.0;
  double hi = 0.0;
  if (!ValidRange(lst, lo, hi)) return img;
  const double span = hi - lo;

  for (int y = 0; y < lst.grid.height; ++y) {
    for (int x = 0; x < lst.grid.width; ++x) {
      const Cell& c = lst.at(x, y);
      if (!c) continue;
      const double t = span > 0.0 ? (*c - lo) / span : 0.5;
      // Keep valid pixels distinguishable from the black background.
      const auto v = static_cast<std::uint8_t>(std::lround(16.0 + t * 239.0));
      img.set(x, y, Rgb{v, v, v});
    }
  }
  return img;
}

RgbImage RenderClassImage(const Raster& classes)
{
  RgbImage img(classes.grid.width, classes.grid.height);
  const auto& legend = UhiLegend();
  for (int y = 0; y < classes.grid.height; ++y) {
    for (int x = 0; x < classes.grid.width; ++x) {
      const Cell& c = classes.at(x, y);
      if (!c) continue;
      const int k = static_cast<int>(*c);
      if (k >= 1 && k <= 5) {
        img.set(x, y, legend[static_cast<std::size_t>(k - 1)].color);
      } else {
        img.set(x, y, Rgb{200, 200, 200});
      }
    }
  }
  return img;
}

} // namespace uhi
