#include "uhi/PipelineError.hpp"

#include <sstream>

namespace uhi {

const char* PipelineErrorKindName(PipelineErrorKind kind)
{
  switch (kind) {
  case PipelineErrorKind::None: return "None";
  case PipelineErrorKind::RegionNotFound: return "RegionNotFound";
  case PipelineErrorKind::MissingCalibrationCoefficient: return "MissingCalibrationCoefficient";
  case PipelineErrorKind::DivisionByZeroMean: return "DivisionByZeroMean";
  case PipelineErrorKind::PixelBudgetExceeded: return "PixelBudgetExceeded";
  case PipelineErrorKind::InvalidConfig: return "InvalidConfig";
  case PipelineErrorKind::InvalidInput: return "InvalidInput";
  case PipelineErrorKind::Io: return "Io";
  }
  return "Unknown";
}

bool PipelineError::set(PipelineErrorKind k, std::string stageName, std::string msg)
{
  kind = k;
  stage = std::move(stageName);
  message = std::move(msg);
  context.clear();
  return false;
}

PipelineError& PipelineError::with(const std::string& key, const std::string& value)
{
  context.emplace_back(key, value);
  return *this;
}

PipelineError& PipelineError::with(const std::string& key, double value)
{
  std::ostringstream oss;
  oss << value;
  context.emplace_back(key, oss.str());
  return *this;
}

std::string FormatPipelineError(const PipelineError& err)
{
  std::ostringstream oss;
  oss << "[" << (err.stage.empty() ? "pipeline" : err.stage) << "] " << PipelineErrorKindName(err.kind) << ": "
      << err.message;
  if (!err.context.empty()) {
    oss << " (";
    for (std::size_t i = 0; i < err.context.size(); ++i) {
      if (i) oss << ", ";
      oss << err.context[i].first << "=" << err.context[i].second;
    }
    oss << ")";
  }
  return oss.str();
}

} // namespace uhi
