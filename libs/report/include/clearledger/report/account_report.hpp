#pragma once

#include <ostream>

#include "clearledger/ledger/account_ledger.hpp"

namespace clearledger {
namespace report {

struct Options {
  bool sort_by_client{true};
  int decimal_places{4};
};

// Writes "client,available,held,total,locked" and one row per account.
void write_accounts(std::ostream& out, const ledger::AccountLedger& ledger, const Options& options = {});

}  // namespace report
}  // namespace clearledger
