#include "clearledger/ledger/account_ledger.hpp"

#include <algorithm>

namespace clearledger {
namespace ledger {

TransactionResult AccountLedger::apply(common::ClientId client, const Transaction& tx) {
  return ensure_account(client).apply(tx);
}

TransactionResult AccountLedger::apply(const ClientTransaction& client_tx) {
  return apply(client_tx.client, client_tx.tx);
}

const Account* AccountLedger::find(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

std::vector<AccountSummary> AccountLedger::summaries(bool sort_by_client) const {
  std::vector<AccountSummary> rows;
  rows.reserve(accounts_.size());
  for (const auto& [client, account] : accounts_) {
    rows.push_back(AccountSummary{
        .client = client,
        .available = account.available(),
        .held = account.held(),
        .total = account.total(),
        .frozen = account.frozen(),
    });
  }

  if (sort_by_client) {
    std::sort(rows.begin(), rows.end(), [](const AccountSummary& lhs, const AccountSummary& rhs) {
      return lhs.client < rhs.client;
    });
  }
  return rows;
}

Account& AccountLedger::ensure_account(common::ClientId client) {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    it = accounts_.emplace(client, Account{}).first;
  }
  return it->second;
}

}  // namespace ledger
}  // namespace clearledger
