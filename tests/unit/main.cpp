// Unit test runner - calls test functions from per-component test files

#include "test_account.hpp"
#include "test_amount.hpp"
#include "test_config.hpp"
#include "test_ingest.hpp"
#include "test_ledger.hpp"
#include "test_replay.hpp"
#include "test_report.hpp"
#include "test_telemetry.hpp"

int main() {
  using namespace clearledger::tests;

  // Amount tests
  test_amount_exact_sum();
  test_amount_from_double();
  test_amount_parse();
  test_amount_to_string();
  test_amount_checked_arithmetic();

  // Account tests
  test_account_deposit_withdrawal();
  test_account_dispute_resolve();
  test_account_dispute_chargeback();
  test_account_duplicate_transaction_id();
  test_account_invalid_disputes();
  test_account_rejections_leave_state_unchanged();
  test_account_amount_overflow();
  test_account_dispute_overflow();
  test_account_replay_total();

  // Ledger tests
  test_ledger_routes_by_client();
  test_ledger_find_distinguishes_missing();
  test_ledger_summaries();
  test_ledger_dispute_resolve_scenario();
  test_ledger_chargeback_scenario();

  // Ingest tests
  test_parse_transaction_kinds();
  test_parse_transaction_errors();
  test_csv_reader_skips_header_and_blanks();
  test_csv_reader_continues_after_parse_error();
  test_csv_reader_header_only_on_first_line();
  test_csv_reader_stream_failure();

  // Replay tests
  test_replay_end_to_end();
  test_replay_aborts_on_malformed_line();
  test_replay_skips_malformed_lines();

  // Report tests
  test_report_sorted_rows();
  test_report_decimal_places();

  // Config tests
  test_config_defaults();
  test_config_overrides();
  test_config_validation();
  test_config_load_errors();

  // Telemetry tests
  test_telemetry_counters();
  test_telemetry_latency();

  return 0;
}
