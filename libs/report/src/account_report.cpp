#include "clearledger/report/account_report.hpp"

namespace clearledger {
namespace report {

void write_accounts(std::ostream& out, const ledger::AccountLedger& ledger, const Options& options) {
  out << "client,available,held,total,locked\n";
  for (const auto& row : ledger.summaries(options.sort_by_client)) {
    out << row.client << ','
        << row.available.to_string(options.decimal_places) << ','
        << row.held.to_string(options.decimal_places) << ','
        << row.total.to_string(options.decimal_places) << ','
        << (row.frozen ? "true" : "false") << '\n';
  }
  out.flush();
}

}  // namespace report
}  // namespace clearledger
