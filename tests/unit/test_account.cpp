#include "test_account.hpp"

#include <cassert>
#include <cstdint>
#include <random>

#include "clearledger/ledger/account.hpp"

namespace clearledger::tests {

using common::Amount;
using ledger::Account;
using ledger::Outcome;

namespace {

Amount units(std::int64_t whole) {
  return Amount::from_scaled(whole * Amount::kScale);
}

Account account_with_100() {
  Account account;
  const auto result = account.apply(ledger::Deposit{.tx_id = 0, .amount = units(100)});
  assert(result.ok());
  return account;
}

struct Snapshot {
  Amount available;
  Amount held;
  bool frozen;
  std::size_t open_disputes;
};

Snapshot snapshot_of(const Account& account) {
  return Snapshot{account.available(), account.held(), account.frozen(), account.open_disputes()};
}

bool same(const Snapshot& lhs, const Snapshot& rhs) {
  return lhs.available == rhs.available && lhs.held == rhs.held && lhs.frozen == rhs.frozen &&
         lhs.open_disputes == rhs.open_disputes;
}

}  // namespace

void test_account_deposit_withdrawal() {
  auto account = account_with_100();
  assert(account.total() == units(100));

  assert(account.apply(ledger::Withdrawal{.tx_id = 1, .amount = units(60)}).ok());

  const auto result = account.apply(ledger::Withdrawal{.tx_id = 2, .amount = units(60)});
  assert(result.outcome == Outcome::kRejectedInsufficientFunds);
  assert(result.reject_code == 3003);
  assert(result.tx_id == 2);
  assert(result.current == units(40));
  assert(result.requested == units(60));

  assert(account.available() == units(40));
  assert(account.held() == Amount{});
  assert(account.total() == units(40));
  assert(!account.has_history(2));

  // Exact balance may be withdrawn.
  assert(account.apply(ledger::Withdrawal{.tx_id = 3, .amount = units(40)}).ok());
  assert(account.available() == Amount{});
}

void test_account_dispute_resolve() {
  auto account = account_with_100();
  const auto before = snapshot_of(account);

  assert(account.apply(ledger::Dispute{.tx_id = 0}).ok());
  assert(account.available() == Amount{});
  assert(account.held() == units(100));
  assert(account.total() == units(100));
  assert(account.is_disputed(0));

  assert(account.apply(ledger::Resolve{.tx_id = 0}).ok());
  assert(same(snapshot_of(account), before));
  assert(!account.frozen());
  assert(!account.is_disputed(0));

  const auto again = account.apply(ledger::Resolve{.tx_id = 0});
  assert(again.outcome == Outcome::kRejectedUndisputedResolution);
  assert(again.reject_code == 3005);

  // A resolved deposit stays in history and can be disputed again.
  assert(account.apply(ledger::Dispute{.tx_id = 0}).ok());
  assert(account.held() == units(100));
}

void test_account_dispute_chargeback() {
  Account account;
  assert(account.apply(ledger::Deposit{.tx_id = 10, .amount = units(100)}).ok());
  assert(account.apply(ledger::Dispute{.tx_id = 10}).ok());
  assert(account.apply(ledger::Chargeback{.tx_id = 10}).ok());

  assert(account.available() == Amount{});
  assert(account.held() == Amount{});
  assert(account.total() == Amount{});
  assert(account.frozen());
  assert(!account.has_history(10));
  assert(account.open_disputes() == 0);

  const auto second_chargeback = account.apply(ledger::Chargeback{.tx_id = 10});
  assert(second_chargeback.outcome == Outcome::kRejectedUndisputedChargeback);
  assert(second_chargeback.reject_code == 3006);
  const auto redispute = account.apply(ledger::Dispute{.tx_id = 10});
  assert(redispute.outcome == Outcome::kRejectedInvalidDispute);

  // Deposits still land on a frozen account; withdrawals do not.
  assert(account.apply(ledger::Deposit{.tx_id = 11, .amount = units(5)}).ok());
  assert(account.available() == units(5));

  const auto withdrawal = account.apply(ledger::Withdrawal{.tx_id = 12, .amount = units(1)});
  assert(withdrawal.outcome == Outcome::kRejectedAccountFrozen);
  assert(withdrawal.reject_code == 3002);
  assert(account.available() == units(5));
  assert(!account.has_history(12));
}

void test_account_duplicate_transaction_id() {
  Account account;
  assert(account.apply(ledger::Deposit{.tx_id = 1, .amount = units(10)}).ok());
  const auto before = snapshot_of(account);

  const auto deposit_again = account.apply(ledger::Deposit{.tx_id = 1, .amount = units(10)});
  assert(deposit_again.outcome == Outcome::kRejectedDuplicateTransactionId);
  assert(deposit_again.reject_code == 3001);
  assert(deposit_again.tx_id == 1);
  assert(same(snapshot_of(account), before));

  const auto withdrawal_reuse = account.apply(ledger::Withdrawal{.tx_id = 1, .amount = units(5)});
  assert(withdrawal_reuse.outcome == Outcome::kRejectedDuplicateTransactionId);
  assert(same(snapshot_of(account), before));

  assert(account.apply(ledger::Withdrawal{.tx_id = 2, .amount = units(5)}).ok());
  const auto withdrawal_again = account.apply(ledger::Withdrawal{.tx_id = 2, .amount = units(5)});
  assert(withdrawal_again.outcome == Outcome::kRejectedDuplicateTransactionId);
  assert(account.available() == units(5));

  // The duplicate check runs before the frozen check.
  assert(account.apply(ledger::Deposit{.tx_id = 3, .amount = units(1)}).ok());
  assert(account.apply(ledger::Dispute{.tx_id = 3}).ok());
  assert(account.apply(ledger::Chargeback{.tx_id = 3}).ok());
  assert(account.frozen());
  const auto frozen_reuse = account.apply(ledger::Withdrawal{.tx_id = 2, .amount = units(1)});
  assert(frozen_reuse.outcome == Outcome::kRejectedDuplicateTransactionId);
}

void test_account_invalid_disputes() {
  auto account = account_with_100();
  assert(account.apply(ledger::Withdrawal{.tx_id = 1, .amount = units(30)}).ok());

  const auto unknown = account.apply(ledger::Dispute{.tx_id = 99});
  assert(unknown.outcome == Outcome::kRejectedInvalidDispute);
  assert(unknown.reject_code == 3004);
  assert(unknown.tx_id == 99);

  const auto withdrawal_dispute = account.apply(ledger::Dispute{.tx_id = 1});
  assert(withdrawal_dispute.outcome == Outcome::kRejectedInvalidDispute);

  assert(account.apply(ledger::Dispute{.tx_id = 0}).ok());
  const auto twice = account.apply(ledger::Dispute{.tx_id = 0});
  assert(twice.outcome == Outcome::kRejectedInvalidDispute);
  assert(account.held() == units(100));

  // Disputing a partly spent deposit drives available below zero.
  assert(account.available() == units(-30));
  assert(account.total() == units(70));

  assert(account.apply(ledger::Resolve{.tx_id = 42}).outcome == Outcome::kRejectedUndisputedResolution);
  assert(account.apply(ledger::Chargeback{.tx_id = 42}).outcome == Outcome::kRejectedUndisputedChargeback);
  assert(account.apply(ledger::Resolve{.tx_id = 1}).outcome == Outcome::kRejectedUndisputedResolution);
}

void test_account_rejections_leave_state_unchanged() {
  auto account = account_with_100();
  assert(account.apply(ledger::Deposit{.tx_id = 1, .amount = units(20)}).ok());
  assert(account.apply(ledger::Dispute{.tx_id = 1}).ok());
  const auto before = snapshot_of(account);

  const ledger::Transaction rejected[] = {
      ledger::Deposit{.tx_id = 0, .amount = units(1)},
      ledger::Withdrawal{.tx_id = 1, .amount = units(1)},
      ledger::Withdrawal{.tx_id = 2, .amount = units(101)},
      ledger::Dispute{.tx_id = 1},
      ledger::Dispute{.tx_id = 7},
      ledger::Resolve{.tx_id = 0},
      ledger::Chargeback{.tx_id = 0},
  };
  for (const auto& tx : rejected) {
    assert(!account.apply(tx).ok());
    assert(same(snapshot_of(account), before));
  }
  assert(!account.has_history(2));
  assert(!account.has_history(7));
}

void test_account_amount_overflow() {
  const auto near_max = units(900'000'000'000'000);

  Account account;
  assert(account.apply(ledger::Deposit{.tx_id = 1, .amount = near_max}).ok());
  const auto before = snapshot_of(account);

  const auto second = account.apply(ledger::Deposit{.tx_id = 2, .amount = near_max});
  assert(second.outcome == Outcome::kRejectedAmountOverflow);
  assert(second.reject_code == 3007);
  assert(second.tx_id == 2);
  assert(same(snapshot_of(account), before));
  assert(account.available() == near_max);
  assert(!account.has_history(2));

  // available fits but available + held would not.
  assert(account.apply(ledger::Dispute{.tx_id = 1}).ok());
  const auto held_too = account.apply(ledger::Deposit{.tx_id = 3, .amount = near_max});
  assert(held_too.outcome == Outcome::kRejectedAmountOverflow);
  assert(account.available() == Amount{});
  assert(account.held() == near_max);
  assert(!account.has_history(3));
}

void test_account_dispute_overflow() {
  const auto near_max = units(900'000'000'000'000);

  Account account;
  assert(account.apply(ledger::Deposit{.tx_id = 1, .amount = near_max}).ok());
  assert(account.apply(ledger::Withdrawal{.tx_id = 2, .amount = near_max}).ok());
  assert(account.apply(ledger::Dispute{.tx_id = 1}).ok());
  assert(account.available() == -near_max);
  assert(account.held() == near_max);

  assert(account.apply(ledger::Deposit{.tx_id = 3, .amount = near_max}).ok());
  const auto before = snapshot_of(account);

  const auto dispute = account.apply(ledger::Dispute{.tx_id = 3});
  assert(dispute.outcome == Outcome::kRejectedAmountOverflow);
  assert(dispute.reject_code == 3007);
  assert(same(snapshot_of(account), before));
  assert(!account.is_disputed(3));

  // The first dispute is unaffected and still resolves.
  assert(account.apply(ledger::Resolve{.tx_id = 1}).ok());
  assert(account.available() == near_max);
  assert(account.held() == Amount{});
}

void test_account_replay_total() {
  std::mt19937 rng(20240521);
  std::uniform_int_distribution<std::int64_t> amount_dist(0, 5'000'000);
  std::bernoulli_distribution is_deposit(0.55);

  Account account;
  std::int64_t expected_scaled = 0;
  for (common::TransactionId tx_id = 1; tx_id <= 2'000; ++tx_id) {
    const auto amount = Amount::from_scaled(amount_dist(rng));
    if (is_deposit(rng)) {
      assert(account.apply(ledger::Deposit{.tx_id = tx_id, .amount = amount}).ok());
      expected_scaled += amount.scaled();
      continue;
    }

    const bool covered = amount.scaled() <= expected_scaled;
    const auto result = account.apply(ledger::Withdrawal{.tx_id = tx_id, .amount = amount});
    assert(result.ok() == covered);
    if (covered) {
      expected_scaled -= amount.scaled();
    } else {
      assert(result.outcome == Outcome::kRejectedInsufficientFunds);
    }
  }

  assert(account.total().scaled() == expected_scaled);
  assert(account.available() == account.total());
  assert(!account.available().is_negative());
}

}  // namespace clearledger::tests
