#pragma once

#include "uhi/Date.hpp"
#include "uhi/PipelineError.hpp"
#include "uhi/Types.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace uhi {

// What to do with a retained thermal acquisition that lacks a calibration coefficient.
enum class MissingCalibrationPolicy : std::uint8_t {
  Fail = 0, // abort the run with MissingCalibrationCoefficient
  Drop = 1, // exclude the acquisition and record a warning
};

// Median of an even number of samples.
enum class MedianTiePolicy : std::uint8_t {
  MeanOfMiddle = 0, // (a[n/2-1] + a[n/2]) / 2
  LowerMiddle = 1,  // a[n/2-1]
};

const char* MissingCalibrationPolicyName(MissingCalibrationPolicy p);
bool ParseMissingCalibrationPolicy(const std::string& s, MissingCalibrationPolicy& out);
const char* MedianTiePolicyName(MedianTiePolicy p);
bool ParseMedianTiePolicy(const std::string& s, MedianTiePolicy& out);

struct RegionConfig {
  GeoPoint center{80.2707, 13.0827};
  double simplifyToleranceMeters = 1000.0;
};

struct WindowConfig {
  DateRange dates{};
  // Applied to the land-cover series only.
  MonthFilter months{5, 9};
};

struct LandCoverConfig {
  std::string collection = "GOOGLE/DYNAMICWORLD/V1";
  std::string band = "label";
  int urbanClass = 6; // "built area"
};

struct ThermalConfig {
  std::string collection = "LANDSAT/LC08/C02/T1_L2";
  std::string band = "ST_B10";

  std::string cloudProperty = "CLOUD_COVER";
  double maxCloudCover = 10.0; // strict: cloud < maxCloudCover

  std::string scaleProperty = "TEMPERATURE_MULT_BAND_ST_B10";
  std::string offsetProperty = "TEMPERATURE_ADD_BAND_ST_B10";

  MissingCalibrationPolicy missingCalibration = MissingCalibrationPolicy::Fail;
  MedianTiePolicy medianTie = MedianTiePolicy::MeanOfMiddle;
};

// Region-wide mean reduction. The scale also defines the working grid.
struct StatisticConfig {
  double scaleMeters = 100.0;
  double maxPixels = 1e13;
};

struct ClassifyConfig {
  // Lower bounds of classes 1..5; strictly increasing. Intervals are [cut[i], cut[i+1]).
  std::array<double, 5> cutPoints{0.0, 0.005, 0.010, 0.015, 0.020};
};

struct ExportConfig {
  double scaleMeters = 100.0;
  std::string crs = "EPSG:4326";
  double maxPixels = 1e13;
  std::string description = "UHI_Classes_Landsat8_Export";
  std::string folder = "UrbanHeat";
};

// Immutable run configuration, threaded through every stage.
struct PipelineConfig {
  RegionConfig region;
  WindowConfig window;
  LandCoverConfig landCover;
  ThermalConfig thermal;
  StatisticConfig statistic;
  ClassifyConfig classify;
  ExportConfig exportCfg;
};

bool ValidatePipelineConfig(const PipelineConfig& cfg, PipelineError& err);

} // namespace uhi
