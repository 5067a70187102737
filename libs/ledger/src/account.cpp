#include "clearledger/ledger/account.hpp"

#include <optional>

namespace clearledger {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeDuplicateTransactionId = 3001;
constexpr std::uint16_t kRejectCodeAccountFrozen = 3002;
constexpr std::uint16_t kRejectCodeInsufficientFunds = 3003;
constexpr std::uint16_t kRejectCodeInvalidDispute = 3004;
constexpr std::uint16_t kRejectCodeUndisputedResolution = 3005;
constexpr std::uint16_t kRejectCodeUndisputedChargeback = 3006;
constexpr std::uint16_t kRejectCodeAmountOverflow = 3007;

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

TransactionResult applied(common::TransactionId tx_id) {
  return TransactionResult{.outcome = Outcome::kApplied, .reject_code = 0, .tx_id = tx_id};
}

TransactionResult rejected(Outcome outcome, std::uint16_t code, common::TransactionId tx_id) {
  return TransactionResult{.outcome = outcome, .reject_code = code, .tx_id = tx_id};
}
}  // namespace

TransactionResult Account::apply(const Transaction& tx) {
  return std::visit(
      Overloaded{
          [this](const Deposit& deposit) {
            return apply_change(deposit.tx_id, BalanceChange{.kind = ChangeKind::kDeposit, .amount = deposit.amount});
          },
          [this](const Withdrawal& withdrawal) {
            return apply_change(withdrawal.tx_id,
                                BalanceChange{.kind = ChangeKind::kWithdrawal, .amount = withdrawal.amount});
          },
          [this](const Dispute& dispute) { return apply_dispute(dispute); },
          [this](const Resolve& resolve) { return apply_resolve(resolve); },
          [this](const Chargeback& chargeback) { return apply_chargeback(chargeback); },
      },
      tx);
}

bool Account::has_history(common::TransactionId tx_id) const {
  return history_.find(tx_id) != history_.end();
}

bool Account::is_disputed(common::TransactionId tx_id) const {
  return disputed_.find(tx_id) != disputed_.end();
}

TransactionResult Account::apply_change(common::TransactionId tx_id, BalanceChange change) {
  if (history_.find(tx_id) != history_.end()) {
    return rejected(Outcome::kRejectedDuplicateTransactionId, kRejectCodeDuplicateTransactionId, tx_id);
  }

  std::optional<common::Amount> next_available;
  switch (change.kind) {
    case ChangeKind::kDeposit:
      next_available = available_.checked_add(change.amount);
      break;
    case ChangeKind::kWithdrawal:
      if (frozen_) {
        return rejected(Outcome::kRejectedAccountFrozen, kRejectCodeAccountFrozen, tx_id);
      }
      if (available_ < change.amount) {
        auto result = rejected(Outcome::kRejectedInsufficientFunds, kRejectCodeInsufficientFunds, tx_id);
        result.current = available_;
        result.requested = change.amount;
        return result;
      }
      next_available = available_.checked_sub(change.amount);
      break;
  }

  // total() must stay representable as well.
  if (!next_available || !next_available->checked_add(held_)) {
    return rejected(Outcome::kRejectedAmountOverflow, kRejectCodeAmountOverflow, tx_id);
  }

  available_ = *next_available;
  history_.emplace(tx_id, change);
  return applied(tx_id);
}

TransactionResult Account::apply_dispute(const Dispute& dispute) {
  const auto it = history_.find(dispute.tx_id);
  if (it == history_.end() || it->second.kind != ChangeKind::kDeposit || is_disputed(dispute.tx_id)) {
    return rejected(Outcome::kRejectedInvalidDispute, kRejectCodeInvalidDispute, dispute.tx_id);
  }

  // available may go negative here if the deposit was already spent.
  const auto next_available = available_.checked_sub(it->second.amount);
  const auto next_held = held_.checked_add(it->second.amount);
  if (!next_available || !next_held) {
    return rejected(Outcome::kRejectedAmountOverflow, kRejectCodeAmountOverflow, dispute.tx_id);
  }

  available_ = *next_available;
  held_ = *next_held;
  disputed_.insert(dispute.tx_id);
  return applied(dispute.tx_id);
}

TransactionResult Account::apply_resolve(const Resolve& resolve) {
  const auto it = history_.find(resolve.tx_id);
  if (!is_disputed(resolve.tx_id) || it == history_.end()) {
    return rejected(Outcome::kRejectedUndisputedResolution, kRejectCodeUndisputedResolution, resolve.tx_id);
  }

  available_ += it->second.amount;
  held_ -= it->second.amount;
  disputed_.erase(resolve.tx_id);
  return applied(resolve.tx_id);
}

TransactionResult Account::apply_chargeback(const Chargeback& chargeback) {
  const auto it = history_.find(chargeback.tx_id);
  if (!is_disputed(chargeback.tx_id) || it == history_.end()) {
    return rejected(Outcome::kRejectedUndisputedChargeback, kRejectCodeUndisputedChargeback, chargeback.tx_id);
  }

  held_ -= it->second.amount;
  frozen_ = true;
  disputed_.erase(chargeback.tx_id);
  history_.erase(it);
  return applied(chargeback.tx_id);
}

}  // namespace ledger
}  // namespace clearledger
