#pragma once

#include "uhi/Config.hpp"
#include "uhi/ImageIO.hpp"
#include "uhi/PipelineError.hpp"
#include "uhi/Raster.hpp"
#include "uhi/RegionResolver.hpp"

#include <array>
#include <string>
#include <vector>

namespace uhi {

class JsonWriter;

struct LegendEntry {
  int value = 0;
  const char* label = "";
  const char* colorName = "";
  Rgb color;
};

// Classes 1..5 with labels and the white -> darkred palette.
const std::array<LegendEntry, 5>& UhiLegend();

// Everything an external export collaborator needs: the classified raster, the clip
// geometry, resolution, CRS and pixel ceiling, plus naming and the legend.
struct ExportRequest {
  Raster image;
  GeoMultiPolygon region;
  double scaleMeters = 100.0;
  std::string crs = "EPSG:4326";
  double maxPixels = 1e13;

  std::string description;
  std::string folder;
};

ExportRequest MakeExportRequest(const Raster& classified, const ResolvedRegion& roi, const ExportConfig& cfg);

// Request metadata as a JSON object. Cell values are included only when asked for.
void WriteExportRequestJson(JsonWriter& w, const ExportRequest& req, bool includeValues = false);

// Output grid for the request: the region bounds at the requested scale.
GridSpec ExportGrid(const ExportRequest& req);

// Check the CRS, the pixel ceiling (PixelBudgetExceeded, stage "export") and the
// in-memory grid cap (InvalidConfig, stage "export"), then resample the image onto
// the export grid and clip it to the region.
bool PrepareExportRaster(const ExportRequest& req, Raster& out, PipelineError& err);

// Destination of the final product.
class ExportSink {
public:
  virtual ~ExportSink() = default;
  virtual bool submit(const ExportRequest& req, PipelineError& err) = 0;
};

// Writes <dir>/<folder>/<description>.{json,csv,png}.
class FileExportSink final : public ExportSink {
public:
  explicit FileExportSink(std::string dir);

  bool submit(const ExportRequest& req, PipelineError& err) override;

  // Paths written by the last successful submit.
  const std::vector<std::string>& writtenFiles() const { return m_written; }

private:
  std::string m_dir;
  std::vector<std::string> m_written;
};

// Side renders. Invalid cells are black.
RgbImage RenderMaskImage(const Raster& mask);          // urban white, other dark gray
RgbImage RenderTemperatureImage(const Raster& lst);     // grayscale stretched min..max
RgbImage RenderClassImage(const Raster& classes);       // legend palette, class 0 light gray

} // namespace uhi
