#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace clearledger {
namespace config {

struct InputConfig {
  bool skip_header{true};
  bool skip_malformed_lines{false};
};

struct OutputConfig {
  bool sort_by_client{true};
  std::int64_t decimal_places{4};
};

struct ReportingConfig {
  bool report_rejections{true};
  bool verbose{false};
};

struct TelemetryConfig {
  bool enabled{false};
};

struct AppConfig {
  InputConfig input;
  OutputConfig output;
  ReportingConfig reporting;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  AppConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const AppConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace clearledger
