#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace uhi {

// Fatal pipeline conditions.
//
// Stages report failures through a PipelineError out-parameter and a false
// return value. Nothing is retried.
//
// An empty urban mask or composite is an all-invalid raster plus a warning,
// not an error.
enum class PipelineErrorKind : std::uint8_t {
  None = 0,
  RegionNotFound,
  MissingCalibrationCoefficient,
  DivisionByZeroMean,
  PixelBudgetExceeded,
  InvalidConfig,
  InvalidInput,
  Io,
};

const char* PipelineErrorKindName(PipelineErrorKind kind);

struct PipelineError {
  PipelineErrorKind kind = PipelineErrorKind::None;

  // Stage that raised the error ("region", "urban_mask", "thermal", "mean", "classify", "export", ...).
  std::string stage;

  std::string message;

  // Parameters in effect, in insertion order.
  std::vector<std::pair<std::string, std::string>> context;

  bool ok() const { return kind == PipelineErrorKind::None; }

  // Reset and fill in one go. Always returns false so callers can write
  //   return err.set(...);
  bool set(PipelineErrorKind k, std::string stageName, std::string msg);

  PipelineError& with(const std::string& key, const std::string& value);
  PipelineError& with(const std::string& key, double value);
};

// "[stage] Kind: message (k=v, k=v)"
std::string FormatPipelineError(const PipelineError& err);

} // namespace uhi
