#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "clearledger/common/amount.hpp"
#include "clearledger/common/types.hpp"

namespace clearledger {
namespace ledger {

struct Deposit {
  common::TransactionId tx_id{0};
  common::Amount amount{};
};

struct Withdrawal {
  common::TransactionId tx_id{0};
  common::Amount amount{};
};

// Moves the funds of an earlier deposit from available to held.
struct Dispute {
  common::TransactionId tx_id{0};
};

// Releases the held funds of a disputed deposit back to available.
struct Resolve {
  common::TransactionId tx_id{0};
};

// Removes the held funds of a disputed deposit and freezes the account.
struct Chargeback {
  common::TransactionId tx_id{0};
};

using Transaction = std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

struct ClientTransaction {
  common::ClientId client{0};
  Transaction tx{};
};

[[nodiscard]] common::TransactionId transaction_id(const Transaction& tx) noexcept;
[[nodiscard]] std::string_view kind_name(const Transaction& tx) noexcept;

enum class Outcome : std::uint8_t {
  kApplied,
  kRejectedDuplicateTransactionId,
  kRejectedAccountFrozen,
  kRejectedInsufficientFunds,
  kRejectedInvalidDispute,
  kRejectedUndisputedResolution,
  kRejectedUndisputedChargeback,
  kRejectedAmountOverflow,
};

struct TransactionResult {
  Outcome outcome{Outcome::kApplied};
  std::uint16_t reject_code{0};
  common::TransactionId tx_id{0};
  // Only set for kRejectedInsufficientFunds.
  common::Amount current{};
  common::Amount requested{};

  [[nodiscard]] bool ok() const noexcept { return outcome == Outcome::kApplied; }
};

[[nodiscard]] std::string describe(const TransactionResult& result);

}  // namespace ledger
}  // namespace clearledger
