#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "clearledger/ingest/csv_reader.hpp"
#include "clearledger/ledger/account_ledger.hpp"
#include "clearledger/ledger/transaction.hpp"
#include "clearledger/telemetry/telemetry_sink.hpp"

namespace clearledger {
namespace replay {

// Feeds every transaction from a reader into a ledger, in input order.
class Driver {
 public:
  struct Config {
    // When false a malformed line aborts the run by rethrowing the ParseError.
    bool skip_malformed_lines{false};
  };

  struct Stats {
    std::uint64_t transactions_read{0};
    std::uint64_t applied{0};
    std::uint64_t rejected{0};
    std::uint64_t malformed{0};
  };

  using RejectionHandler = std::function<void(std::size_t line, const ledger::ClientTransaction&,
                                              const ledger::TransactionResult&)>;
  using ParseErrorHandler = std::function<void(const ingest::ParseError&)>;

  Driver();

  void configure(Config config);
  void set_rejection_handler(RejectionHandler handler);
  void set_parse_error_handler(ParseErrorHandler handler);
  // The sink must outlive execute(). nullptr detaches.
  void attach_telemetry(telemetry::TelemetrySink* sink) noexcept { telemetry_ = sink; }

  // Throws ingest::ParseError (unless skipping) and std::runtime_error on read failure.
  Stats execute(ingest::CsvReader& reader, ledger::AccountLedger& ledger);

 private:
  Config config_{};
  RejectionHandler rejection_handler_{};
  ParseErrorHandler parse_error_handler_{};
  telemetry::TelemetrySink* telemetry_{nullptr};

  void record_outcome(const ledger::TransactionResult& result);
};

}  // namespace replay
}  // namespace clearledger
