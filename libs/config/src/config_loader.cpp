#include "clearledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

#include "clearledger/common/amount.hpp"

namespace clearledger {
namespace config {

namespace {

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

InputConfig parse_input(const toml::table& root) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.skip_header = get_bool_or(*input, "skip_header", cfg.skip_header);
    cfg.skip_malformed_lines = get_bool_or(*input, "skip_malformed_lines", cfg.skip_malformed_lines);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root) {
  OutputConfig cfg;
  if (auto* output = root["output"].as_table()) {
    cfg.sort_by_client = get_bool_or(*output, "sort_by_client", cfg.sort_by_client);
    cfg.decimal_places = get_int_or(*output, "decimal_places", cfg.decimal_places);
  }
  return cfg;
}

ReportingConfig parse_reporting(const toml::table& root) {
  ReportingConfig cfg;
  if (auto* reporting = root["reporting"].as_table()) {
    cfg.report_rejections = get_bool_or(*reporting, "report_rejections", cfg.report_rejections);
    cfg.verbose = get_bool_or(*reporting, "verbose", cfg.verbose);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

AppConfig parse_config(const toml::table& root) {
  AppConfig cfg;
  cfg.input = parse_input(root);
  cfg.output = parse_output(root);
  cfg.reporting = parse_reporting(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const AppConfig& config) {
  std::vector<ValidationError> errors;

  if (config.output.decimal_places < 0 || config.output.decimal_places > common::Amount::kDecimalPlaces) {
    errors.push_back({"output.decimal_places",
                      "must be between 0 and " + std::to_string(common::Amount::kDecimalPlaces)});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# clearledger configuration
# Generated default configuration

[input]
skip_header = true            # skip a leading "type,client,tx,amount" line
skip_malformed_lines = false  # abort the run on the first malformed line

[output]
sort_by_client = true
decimal_places = 4

[reporting]
report_rejections = true
verbose = false

[telemetry]
enabled = false
)";
}

}  // namespace config
}  // namespace clearledger
