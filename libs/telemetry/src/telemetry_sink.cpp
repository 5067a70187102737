#include "clearledger/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace clearledger {
namespace telemetry {

std::string_view metric_name(Metric metric) noexcept {
  switch (metric) {
    case Metric::kTransactionsApplied: return "transactions_applied";
    case Metric::kRejectedDuplicateTransactionId: return "rejected_duplicate_transaction_id";
    case Metric::kRejectedAccountFrozen: return "rejected_account_frozen";
    case Metric::kRejectedInsufficientFunds: return "rejected_insufficient_funds";
    case Metric::kRejectedInvalidDispute: return "rejected_invalid_dispute";
    case Metric::kRejectedUndisputedResolution: return "rejected_undisputed_resolution";
    case Metric::kRejectedUndisputedChargeback: return "rejected_undisputed_chargeback";
    case Metric::kRejectedAmountOverflow: return "rejected_amount_overflow";
    case Metric::kMalformedLines: return "malformed_lines";
    case Metric::kCount: break;
  }
  return "unknown";
}

// StreamingHistogram implementation

std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx <= 1) {
    return 1;
  }
  return static_cast<std::int64_t>(3) << (idx - 2);  // 1.5 * 2^(idx-1)
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  max_ = 0;
}

double StreamingHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double StreamingHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }

  const auto target = static_cast<std::uint64_t>(static_cast<double>(count_) * p);
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }
  return static_cast<double>(max_);
}

// TelemetrySink implementation

void TelemetrySink::increment(Metric metric, std::uint64_t delta) noexcept {
  if (metric == Metric::kCount) {
    return;
  }
  counters_[static_cast<std::size_t>(metric)] += delta;
}

void TelemetrySink::record_latency(std::chrono::nanoseconds latency) noexcept {
  apply_latency_.record(latency.count());
}

std::uint64_t TelemetrySink::value(Metric metric) const noexcept {
  if (metric == Metric::kCount) {
    return 0;
  }
  return counters_[static_cast<std::size_t>(metric)];
}

TelemetrySink::Summary TelemetrySink::summary() const {
  Summary summary;
  for (std::size_t idx = 0; idx < kMetricCount; ++idx) {
    if (counters_[idx] == 0) {
      continue;
    }
    summary.counters.push_back(Counter{.metric = static_cast<Metric>(idx), .value = counters_[idx]});
  }
  summary.latency_samples = apply_latency_.count();
  summary.latency_mean_ns = apply_latency_.mean();
  summary.latency_p99_ns = apply_latency_.percentile(0.99);
  return summary;
}

void TelemetrySink::reset() noexcept {
  counters_.fill(0);
  apply_latency_.reset();
}

}  // namespace telemetry
}  // namespace clearledger
