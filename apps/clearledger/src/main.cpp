#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "clearledger/config/config_loader.hpp"
#include "clearledger/ingest/csv_reader.hpp"
#include "clearledger/ledger/account_ledger.hpp"
#include "clearledger/ledger/transaction.hpp"
#include "clearledger/replay/replay_driver.hpp"
#include "clearledger/report/account_report.hpp"
#include "clearledger/telemetry/telemetry_sink.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: type,client,tx,amount records to apply in order\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./clearledger.toml or generates defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./clearledger.toml",
      "/etc/clearledger/clearledger.toml",
      std::filesystem::path{home ? home : ""} / ".config/clearledger/clearledger.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(const std::filesystem::path& config_path, clearledger::config::AppConfig& cfg) {
  using clearledger::config::ConfigLoader;

  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

void print_telemetry(const clearledger::telemetry::TelemetrySink& telemetry) {
  const auto summary = telemetry.summary();
  std::cerr << "Telemetry:\n";
  for (const auto& counter : summary.counters) {
    std::cerr << "  " << clearledger::telemetry::metric_name(counter.metric) << ": " << counter.value << "\n";
  }
  std::cerr << "  apply_latency: samples=" << summary.latency_samples
            << " mean_ns=" << summary.latency_mean_ns
            << " p99_ns=" << summary.latency_p99_ns << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace clearledger;

  if (argc < 2) {
    std::cerr << "Expected input file path\n";
    print_usage(argv[0]);
    return 1;
  }

  const std::filesystem::path input_path{argv[1]};
  const auto config_path = find_config_path(argc, argv);

  config::AppConfig cfg;
  if (!load_config(config_path, cfg)) {
    return 1;
  }

  if (cfg.reporting.verbose) {
    if (config_path.empty()) {
      std::cerr << "No config file found, using defaults\n";
    } else {
      std::cerr << "Loaded config from: " << config_path << "\n";
    }
    std::cerr << "  Input: " << input_path << "\n";
    std::cerr << "  Skip malformed lines: " << (cfg.input.skip_malformed_lines ? "yes" : "no") << "\n";
    std::cerr << "  Decimal places: " << cfg.output.decimal_places << "\n";
  }

  std::ifstream input(input_path);
  if (!input) {
    std::cerr << "Unable to open " << input_path << "\n";
    return 1;
  }

  ingest::CsvReader reader(input, ingest::CsvReader::Config{.skip_header = cfg.input.skip_header});
  ledger::AccountLedger ledger;
  telemetry::TelemetrySink telemetry;

  replay::Driver driver;
  driver.configure({.skip_malformed_lines = cfg.input.skip_malformed_lines});
  if (cfg.telemetry.enabled) {
    driver.attach_telemetry(&telemetry);
  }
  if (cfg.reporting.report_rejections) {
    driver.set_rejection_handler(
        [](std::size_t line, const ledger::ClientTransaction& client_tx, const ledger::TransactionResult& result) {
          std::cerr << "Error executing " << ledger::kind_name(client_tx.tx) << " for client " << client_tx.client
                    << " on line " << line << ": " << ledger::describe(result) << "\n";
        });
  }
  driver.set_parse_error_handler([](const ingest::ParseError& error) {
    std::cerr << error.what() << " (skipped)\n";
  });

  try {
    const auto stats = driver.execute(reader, ledger);
    if (cfg.reporting.verbose) {
      std::cerr << "Processed " << stats.transactions_read << " transactions: " << stats.applied << " applied, "
                << stats.rejected << " rejected, " << stats.malformed << " malformed\n";
    }
  } catch (const ingest::ParseError& error) {
    std::cerr << error.what() << "\n";
    return 1;
  } catch (const std::runtime_error& error) {
    std::cerr << error.what() << "\n";
    return 1;
  }

  report::write_accounts(std::cout, ledger,
                         report::Options{.sort_by_client = cfg.output.sort_by_client,
                                         .decimal_places = static_cast<int>(cfg.output.decimal_places)});

  if (cfg.telemetry.enabled) {
    print_telemetry(telemetry);
  }
  return 0;
}
