#include "cli/CliParse.hpp"

#include "uhi/Boundary.hpp"
#include "uhi/Catalog.hpp"
#include "uhi/ConfigIO.hpp"
#include "uhi/Date.hpp"
#include "uhi/Export.hpp"
#include "uhi/GeoJsonExport.hpp"
#include "uhi/ImageIO.hpp"
#include "uhi/LogTee.hpp"
#include "uhi/Pipeline.hpp"
#include "uhi/RunReport.hpp"
#include "uhi/Version.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace {

using namespace uhi;

void PrintHelp()
{
  std::cout
      << "uhi_cli (urban heat island classification from land-cover and thermal time series)\n\n"
      << "Usage:\n"
      << "  uhi_cli --boundaries <file.geojson> --catalog <dir> [--config <cfg.json>]\n"
      << "          [--center <lon,lat>] [--start <date>] [--end <date>] [--months <a-b>]\n"
      << "          [--cloud-max <F>] [--urban-class <N>] [--tolerance <m>] [--scale <m>]\n"
      << "          [--max-pixels <F>] [--missing-calibration <fail|drop>]\n"
      << "          [--out-dir <dir>] [--json <summary.json>]\n"
      << "          [--png-mask <out.png>] [--png-lst <out.png>] [--png-classes <out.png>]\n"
      << "          [--region-geojson <out.geojson>] [--write-config <cfg.json>] [--log <file>]\n\n"
      << "Inputs:\n"
      << "  --boundaries <path>         Administrative boundaries (GeoJSON FeatureCollection, lon/lat).\n"
      << "  --catalog <dir>             Raster catalog directory (catalog.json + raster JSON files).\n"
      << "  --config <path>             Pipeline config JSON. Flags below override it.\n\n"
      << "Analysis:\n"
      << "  --center <lon,lat>          Point that selects the region (default: 80.2707,13.0827).\n"
      << "  --start <date>              Window start, inclusive (YYYY[-MM[-DD]], default: 2023).\n"
      << "  --end <date>                Window end, exclusive (default: 2024).\n"
      << "  --months <a-b>              Land-cover months, inclusive, may wrap (default: 5-9).\n"
      << "  --cloud-max <F>             Keep thermal scenes with cloud cover < F (default: 10).\n"
      << "  --urban-class <N>           Land-cover label treated as urban (default: 6).\n"
      << "  --tolerance <m>             Boundary simplification tolerance in meters (default: 1000).\n"
      << "  --scale <m>                 Working grid / mean reduction scale in meters (default: 100).\n"
      << "  --max-pixels <F>            Pixel ceiling for the mean reduction (default: 1e13).\n"
      << "  --missing-calibration <p>   fail | drop scenes without calibration coefficients (default: fail).\n\n"
      << "Outputs:\n"
      << "  --out-dir <dir>             Export classified raster to <dir>/<folder>/<description>.{json,csv,png}.\n"
      << "  --json <path>               Run summary.\n"
      << "  --png-mask <path>           Urban mask render.\n"
      << "  --png-lst <path>            Median land surface temperature render.\n"
      << "  --png-classes <path>        Class map render (legend palette).\n"
      << "  --region-geojson <path>     Resolved (simplified) region.\n"
      << "  --write-config <path>       Write the effective config. Without inputs, exit after writing.\n"
      << "  --log <path>                Mirror stdout/stderr into a rotated log file.\n"
      << "  --version                   Print version and exit.\n\n"
      << "Exit codes: 0 success, 1 pipeline or I/O error, 2 usage error.\n";
}

// Flag values applied on top of the (optional) config file.
struct Overrides {
  std::optional<GeoPoint> center;
  std::optional<CivilDate> start;
  std::optional<CivilDate> end;
  std::optional<MonthFilter> months;
  std::optional<double> cloudMax;
  std::optional<int> urbanClass;
  std::optional<double> tolerance;
  std::optional<double> scale;
  std::optional<double> maxPixels;
  std::optional<MissingCalibrationPolicy> missingCalibration;
};

void ApplyOverrides(const Overrides& o, PipelineConfig& cfg)
{
  if (o.center) cfg.region.center = *o.center;
  if (o.start) cfg.window.dates.start = *o.start;
  if (o.end) cfg.window.dates.end = *o.end;
  if (o.months) cfg.window.months = *o.months;
  if (o.cloudMax) cfg.thermal.maxCloudCover = *o.cloudMax;
  if (o.urbanClass) cfg.landCover.urbanClass = *o.urbanClass;
  if (o.tolerance) cfg.region.simplifyToleranceMeters = *o.tolerance;
  if (o.scale) cfg.statistic.scaleMeters = *o.scale;
  if (o.maxPixels) cfg.statistic.maxPixels = *o.maxPixels;
  if (o.missingCalibration) cfg.thermal.missingCalibration = *o.missingCalibration;
}

int Fail(const PipelineError& err)
{
  std::cerr << "error: " << FormatPipelineError(err) << "\n";
  return 1;
}

bool WriteImage(const std::string& path, const RgbImage& img, const char* what)
{
  if (!uhi::cli::EnsureParentDir(path)) {
    std::cerr << "failed to create parent directory for " << path << "\n";
    return false;
  }
  std::string err;
  if (!WritePng(path, img, err)) {
    std::cerr << "failed to write " << what << ": " << err << "\n";
    return false;
  }
  std::cout << "wrote " << what << ": " << path << "\n";
  return true;
}

} // namespace

int main(int argc, char** argv)
{
  std::string boundariesPath;
  std::string catalogDir;
  std::string configPath;
  std::string outDir;
  std::string outJson;
  std::string outMask;
  std::string outLst;
  std::string outClasses;
  std::string outRegion;
  std::string outConfig;
  std::string logPath;
  Overrides ov;

  auto requireValue = [&](int& i, std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string v;
    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--version") {
      std::cout << UhiFullVersionString() << "\n";
      return 0;
    } else if (arg == "--boundaries") {
      if (!requireValue(i, boundariesPath)) {
        std::cerr << "--boundaries expects a path\n";
        return 2;
      }
    } else if (arg == "--catalog") {
      if (!requireValue(i, catalogDir)) {
        std::cerr << "--catalog expects a directory\n";
        return 2;
      }
    } else if (arg == "--config") {
      if (!requireValue(i, configPath)) {
        std::cerr << "--config expects a path\n";
        return 2;
      }
    } else if (arg == "--center") {
      GeoPoint p;
      if (!requireValue(i, v) || !uhi::cli::ParseLonLat(v, &p)) {
        std::cerr << "--center expects lon,lat\n";
        return 2;
      }
      ov.center = p;
    } else if (arg == "--start" || arg == "--end") {
      CivilDate d;
      if (!requireValue(i, v) || !ParseIsoDate(v, d)) {
        std::cerr << arg << " expects YYYY, YYYY-MM or YYYY-MM-DD\n";
        return 2;
      }
      (arg == "--start" ? ov.start : ov.end) = d;
    } else if (arg == "--months") {
      MonthFilter m;
      if (!requireValue(i, v) || !uhi::cli::ParseMonthRange(v, &m.startMonth, &m.endMonth)) {
        std::cerr << "--months expects a-b with months in 1..12\n";
        return 2;
      }
      ov.months = m;
    } else if (arg == "--cloud-max") {
      double f = 0.0;
      if (!requireValue(i, v) || !uhi::cli::ParseF64(v, &f)) {
        std::cerr << "--cloud-max expects a number\n";
        return 2;
      }
      ov.cloudMax = f;
    } else if (arg == "--urban-class") {
      int n = 0;
      if (!requireValue(i, v) || !uhi::cli::ParseI32(v, &n)) {
        std::cerr << "--urban-class expects an integer\n";
        return 2;
      }
      ov.urbanClass = n;
    } else if (arg == "--tolerance") {
      double f = 0.0;
      if (!requireValue(i, v) || !uhi::cli::ParseF64(v, &f)) {
        std::cerr << "--tolerance expects meters\n";
        return 2;
      }
      ov.tolerance = f;
    } else if (arg == "--scale") {
      double f = 0.0;
      if (!requireValue(i, v) || !uhi::cli::ParseF64(v, &f)) {
        std::cerr << "--scale expects meters\n";
        return 2;
      }
      ov.scale = f;
    } else if (arg == "--max-pixels") {
      double f = 0.0;
      if (!requireValue(i, v) || !uhi::cli::ParseF64(v, &f)) {
        std::cerr << "--max-pixels expects a number\n";
        return 2;
      }
      ov.maxPixels = f;
    } else if (arg == "--missing-calibration") {
      MissingCalibrationPolicy p = MissingCalibrationPolicy::Fail;
      if (!requireValue(i, v) || !ParseMissingCalibrationPolicy(v, p)) {
        std::cerr << "--missing-calibration expects fail|drop\n";
        return 2;
      }
      ov.missingCalibration = p;
    } else if (arg == "--out-dir") {
      if (!requireValue(i, outDir)) {
        std::cerr << "--out-dir expects a directory\n";
        return 2;
      }
    } else if (arg == "--json") {
      if (!requireValue(i, outJson)) {
        std::cerr << "--json expects a path\n";
        return 2;
      }
    } else if (arg == "--png-mask") {
      if (!requireValue(i, outMask)) {
        std::cerr << "--png-mask expects a path\n";
        return 2;
      }
    } else if (arg == "--png-lst") {
      if (!requireValue(i, outLst)) {
        std::cerr << "--png-lst expects a path\n";
        return 2;
      }
    } else if (arg == "--png-classes") {
      if (!requireValue(i, outClasses)) {
        std::cerr << "--png-classes expects a path\n";
        return 2;
      }
    } else if (arg == "--region-geojson") {
      if (!requireValue(i, outRegion)) {
        std::cerr << "--region-geojson expects a path\n";
        return 2;
      }
    } else if (arg == "--write-config") {
      if (!requireValue(i, outConfig)) {
        std::cerr << "--write-config expects a path\n";
        return 2;
      }
    } else if (arg == "--log") {
      if (!requireValue(i, logPath)) {
        std::cerr << "--log expects a path\n";
        return 2;
      }
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      std::cerr << "Run with --help for usage.\n";
      return 2;
    }
  }

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions lo;
    lo.path = logPath;
    std::string err;
    if (!logTee.start(lo, err)) {
      std::cerr << "failed to start log: " << err << "\n";
      return 1;
    }
  }

  PipelineConfig cfg;
  if (!configPath.empty()) {
    std::string err;
    if (!LoadPipelineConfigJsonFile(configPath, cfg, err)) {
      PipelineError e;
      e.set(PipelineErrorKind::InvalidConfig, "config", err);
      e.with("path", configPath);
      return Fail(e);
    }
  }
  ApplyOverrides(ov, cfg);

  {
    PipelineError e;
    if (!ValidatePipelineConfig(cfg, e)) return Fail(e);
  }

  if (!outConfig.empty()) {
    std::string err;
    if (!uhi::cli::EnsureParentDir(outConfig) || !WritePipelineConfigJsonFile(outConfig, cfg, err)) {
      std::cerr << "failed to write config " << outConfig << ": " << err << "\n";
      return 1;
    }
    std::cout << "wrote config: " << outConfig << "\n";
    if (boundariesPath.empty() && catalogDir.empty()) return 0;
  }

  if (boundariesPath.empty() || catalogDir.empty()) {
    std::cerr << "--boundaries and --catalog are required\n";
    std::cerr << "Run with --help for usage.\n";
    return 2;
  }

  BoundaryDataset boundaries;
  {
    std::string err;
    if (!LoadBoundaryGeoJsonFile(boundariesPath, boundaries, err)) {
      PipelineError e;
      e.set(PipelineErrorKind::Io, "boundaries", err);
      e.with("path", boundariesPath);
      return Fail(e);
    }
  }
  std::cout << "[boundaries] " << boundaries.features.size() << " features from " << boundariesPath << "\n";

  DirectoryCatalog catalog;
  {
    std::string err;
    if (!catalog.open(catalogDir, err)) {
      PipelineError e;
      e.set(PipelineErrorKind::Io, "catalog", err);
      e.with("path", catalogDir);
      return Fail(e);
    }
  }
  std::cout << "[catalog] " << catalog.acquisitionCount() << " acquisitions in " << catalogDir << "\n";

  const Pipeline pipeline(cfg, boundaries, catalog, &std::cout);

  PipelineResult result;
  PipelineError perr;
  if (!pipeline.materialize(result, perr)) return Fail(perr);

  for (const std::string& w : result.warnings) std::cerr << "warning: " << w << "\n";

  bool ok = true;
  if (!outMask.empty()) ok = WriteImage(outMask, RenderMaskImage(result.urban.mask), "urban mask") && ok;
  if (!outLst.empty()) ok = WriteImage(outLst, RenderTemperatureImage(result.thermal.lst), "temperature") && ok;
  if (!outClasses.empty()) ok = WriteImage(outClasses, RenderClassImage(result.heat.classified), "classes") && ok;

  if (!outRegion.empty()) {
    std::string err;
    if (!uhi::cli::EnsureParentDir(outRegion) || !WriteRegionGeoJsonFile(outRegion, result.region, err)) {
      std::cerr << "failed to write region GeoJSON: " << err << "\n";
      ok = false;
    } else {
      std::cout << "wrote region: " << outRegion << "\n";
    }
  }

  if (!outDir.empty()) {
    FileExportSink sink(outDir);
    if (!pipeline.exportTo(sink, perr)) return Fail(perr);
    for (const std::string& p : sink.writtenFiles()) std::cout << "exported: " << p << "\n";
  }

  if (!outJson.empty()) {
    std::string err;
    if (!uhi::cli::EnsureParentDir(outJson) || !WriteRunReportJsonFile(outJson, result, err)) {
      std::cerr << "failed to write summary: " << err << "\n";
      ok = false;
    } else {
      std::cout << "wrote summary: " << outJson << "\n";
    }
  }

  return ok ? 0 : 1;
}
