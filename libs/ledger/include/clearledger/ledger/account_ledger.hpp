#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "clearledger/common/amount.hpp"
#include "clearledger/common/types.hpp"
#include "clearledger/ledger/account.hpp"
#include "clearledger/ledger/transaction.hpp"

namespace clearledger {
namespace ledger {

struct AccountSummary {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool frozen{false};
};

// Every account touched during a run, keyed by client. Accounts are created on
// first reference and never removed.
class AccountLedger {
 public:
  using AccountMap = std::unordered_map<common::ClientId, Account>;
  using const_iterator = AccountMap::const_iterator;

  TransactionResult apply(common::ClientId client, const Transaction& tx);
  TransactionResult apply(const ClientTransaction& client_tx);

  // nullptr when the client has never been referenced.
  [[nodiscard]] const Account* find(common::ClientId client) const;
  [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }

  // Iteration order is unspecified.
  [[nodiscard]] const_iterator begin() const noexcept { return accounts_.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return accounts_.end(); }

  [[nodiscard]] std::vector<AccountSummary> summaries(bool sort_by_client = true) const;

 private:
  Account& ensure_account(common::ClientId client);

  AccountMap accounts_{};
};

}  // namespace ledger
}  // namespace clearledger
