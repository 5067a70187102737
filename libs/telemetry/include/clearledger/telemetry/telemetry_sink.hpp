#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace clearledger {
namespace telemetry {

enum class Metric : std::uint8_t {
  kTransactionsApplied,
  kRejectedDuplicateTransactionId,
  kRejectedAccountFrozen,
  kRejectedInsufficientFunds,
  kRejectedInvalidDispute,
  kRejectedUndisputedResolution,
  kRejectedUndisputedChargeback,
  kRejectedAmountOverflow,
  kMalformedLines,
  kCount,
};

[[nodiscard]] std::string_view metric_name(Metric metric) noexcept;

// Streaming histogram with O(1) recording and O(bucket_count) percentile computation.
// Uses log2-scale buckets from 1ns to ~1s (30 buckets).
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

// Run counters and per-transaction apply latency. Owned by the caller and
// only touched from the thread driving the ledger.
class TelemetrySink {
 public:
  struct Counter {
    Metric metric{Metric::kTransactionsApplied};
    std::uint64_t value{0};
  };

  struct Summary {
    std::vector<Counter> counters;
    std::uint64_t latency_samples{0};
    double latency_mean_ns{0.0};
    double latency_p99_ns{0.0};
  };

  void increment(Metric metric, std::uint64_t delta = 1) noexcept;
  void record_latency(std::chrono::nanoseconds latency) noexcept;

  [[nodiscard]] std::uint64_t value(Metric metric) const noexcept;
  // Non-zero counters in Metric order, plus latency figures.
  [[nodiscard]] Summary summary() const;
  void reset() noexcept;

 private:
  static constexpr std::size_t kMetricCount = static_cast<std::size_t>(Metric::kCount);

  std::array<std::uint64_t, kMetricCount> counters_{};
  StreamingHistogram apply_latency_{};
};

}  // namespace telemetry
}  // namespace clearledger
