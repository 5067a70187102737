#include "clearledger/replay/replay_driver.hpp"

#include <chrono>
#include <utility>

namespace clearledger {
namespace replay {

namespace {

telemetry::Metric metric_for(ledger::Outcome outcome) noexcept {
  switch (outcome) {
    case ledger::Outcome::kApplied: return telemetry::Metric::kTransactionsApplied;
    case ledger::Outcome::kRejectedDuplicateTransactionId: return telemetry::Metric::kRejectedDuplicateTransactionId;
    case ledger::Outcome::kRejectedAccountFrozen: return telemetry::Metric::kRejectedAccountFrozen;
    case ledger::Outcome::kRejectedInsufficientFunds: return telemetry::Metric::kRejectedInsufficientFunds;
    case ledger::Outcome::kRejectedInvalidDispute: return telemetry::Metric::kRejectedInvalidDispute;
    case ledger::Outcome::kRejectedUndisputedResolution: return telemetry::Metric::kRejectedUndisputedResolution;
    case ledger::Outcome::kRejectedUndisputedChargeback: return telemetry::Metric::kRejectedUndisputedChargeback;
    case ledger::Outcome::kRejectedAmountOverflow: return telemetry::Metric::kRejectedAmountOverflow;
  }
  return telemetry::Metric::kCount;
}

}  // namespace

Driver::Driver() = default;

void Driver::configure(Config config) {
  config_ = config;
}

void Driver::set_rejection_handler(RejectionHandler handler) {
  rejection_handler_ = std::move(handler);
}

void Driver::set_parse_error_handler(ParseErrorHandler handler) {
  parse_error_handler_ = std::move(handler);
}

Driver::Stats Driver::execute(ingest::CsvReader& reader, ledger::AccountLedger& ledger) {
  Stats stats;
  ledger::ClientTransaction client_tx;

  while (true) {
    try {
      if (!reader.next(client_tx)) {
        break;
      }
    } catch (const ingest::ParseError& error) {
      if (!config_.skip_malformed_lines) {
        throw;
      }
      ++stats.malformed;
      if (telemetry_) {
        telemetry_->increment(telemetry::Metric::kMalformedLines);
      }
      if (parse_error_handler_) {
        parse_error_handler_(error);
      }
      continue;
    }

    ++stats.transactions_read;
    const auto started = std::chrono::steady_clock::now();
    const auto result = ledger.apply(client_tx);
    if (telemetry_) {
      telemetry_->record_latency(
          std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - started));
    }
    record_outcome(result);

    if (result.ok()) {
      ++stats.applied;
      continue;
    }

    ++stats.rejected;
    if (rejection_handler_) {
      rejection_handler_(reader.line_number(), client_tx, result);
    }
  }

  return stats;
}

void Driver::record_outcome(const ledger::TransactionResult& result) {
  if (telemetry_) {
    telemetry_->increment(metric_for(result.outcome));
  }
}

}  // namespace replay
}  // namespace clearledger
