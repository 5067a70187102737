#include "clearledger/ledger/transaction.hpp"

#include <sstream>
#include <type_traits>

namespace clearledger {
namespace ledger {

common::TransactionId transaction_id(const Transaction& tx) noexcept {
  return std::visit([](const auto& t) { return t.tx_id; }, tx);
}

std::string_view kind_name(const Transaction& tx) noexcept {
  return std::visit(
      [](const auto& t) -> std::string_view {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Deposit>) {
          return "deposit";
        } else if constexpr (std::is_same_v<T, Withdrawal>) {
          return "withdrawal";
        } else if constexpr (std::is_same_v<T, Dispute>) {
          return "dispute";
        } else if constexpr (std::is_same_v<T, Resolve>) {
          return "resolve";
        } else {
          return "chargeback";
        }
      },
      tx);
}

std::string describe(const TransactionResult& result) {
  std::ostringstream oss;
  switch (result.outcome) {
    case Outcome::kApplied:
      oss << "Transaction " << result.tx_id << " applied";
      break;
    case Outcome::kRejectedDuplicateTransactionId:
      oss << "Transaction id " << result.tx_id << " has already been used";
      break;
    case Outcome::kRejectedAccountFrozen:
      oss << "Account is frozen";
      break;
    case Outcome::kRejectedInsufficientFunds:
      oss << "Attempted to withdraw " << result.requested << " from an account with "
          << result.current << " available";
      break;
    case Outcome::kRejectedInvalidDispute:
      oss << "The transaction with id " << result.tx_id << " does not exist or cannot be disputed";
      break;
    case Outcome::kRejectedUndisputedResolution:
      oss << "Cannot resolve transaction " << result.tx_id << ": it is not under dispute";
      break;
    case Outcome::kRejectedUndisputedChargeback:
      oss << "Cannot charge back transaction " << result.tx_id << ": it is not under dispute";
      break;
    case Outcome::kRejectedAmountOverflow:
      oss << "Transaction " << result.tx_id << " would push the account balance out of range";
      break;
  }
  return oss.str();
}

}  // namespace ledger
}  // namespace clearledger
