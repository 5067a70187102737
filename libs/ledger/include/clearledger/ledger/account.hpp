#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>

#include "clearledger/common/amount.hpp"
#include "clearledger/common/types.hpp"
#include "clearledger/ledger/transaction.hpp"

namespace clearledger {
namespace ledger {

enum class ChangeKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
};

struct BalanceChange {
  ChangeKind kind{ChangeKind::kDeposit};
  common::Amount amount{};
};

// One client's balances. State only changes through apply(); a rejected
// transaction leaves every field exactly as it was.
class Account {
 public:
  TransactionResult apply(const Transaction& tx);

  [[nodiscard]] common::Amount available() const noexcept { return available_; }
  [[nodiscard]] common::Amount held() const noexcept { return held_; }
  [[nodiscard]] common::Amount total() const noexcept { return available_ + held_; }
  [[nodiscard]] bool frozen() const noexcept { return frozen_; }

  [[nodiscard]] bool has_history(common::TransactionId tx_id) const;
  [[nodiscard]] bool is_disputed(common::TransactionId tx_id) const;
  [[nodiscard]] std::size_t open_disputes() const noexcept { return disputed_.size(); }

 private:
  TransactionResult apply_change(common::TransactionId tx_id, BalanceChange change);
  TransactionResult apply_dispute(const Dispute& dispute);
  TransactionResult apply_resolve(const Resolve& resolve);
  TransactionResult apply_chargeback(const Chargeback& chargeback);

  common::Amount available_{};
  common::Amount held_{};
  bool frozen_{false};
  // Deposits and withdrawals by id. Charged-back ids are erased.
  std::unordered_map<common::TransactionId, BalanceChange> history_{};
  std::unordered_set<common::TransactionId> disputed_{};
};

}  // namespace ledger
}  // namespace clearledger
