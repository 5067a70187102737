#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace clearledger {
namespace common {

// Fixed-point money value with four fractional digits.
//
// The value is held as a signed count of 1/10'000 units. All arithmetic and
// comparison work on that integer; doubles and decimal text are only accepted
// or produced at the edges (parsing input, printing reports).
class Amount {
 public:
  static constexpr int kDecimalPlaces = 4;
  static constexpr std::int64_t kScale = 10'000;

  constexpr Amount() noexcept = default;

  [[nodiscard]] static constexpr Amount from_scaled(std::int64_t scaled) noexcept {
    Amount amount;
    amount.scaled_ = scaled;
    return amount;
  }

  // Rounds to the nearest representable value, half away from zero. Empty when
  // the input is NaN, infinite, or does not fit the backing integer once scaled.
  [[nodiscard]] static std::optional<Amount> from_double(double value) noexcept;

  // Exact parse of plain decimal text such as "12", "-0.5" or " 3.1415 ".
  // Digits past the fourth fractional place are rounded half away from zero.
  [[nodiscard]] static std::optional<Amount> parse(std::string_view text) noexcept;

  [[nodiscard]] constexpr std::int64_t scaled() const noexcept { return scaled_; }
  [[nodiscard]] double to_double() const noexcept;

  // Renders with exactly `decimal_places` fractional digits (clamped to 0..4).
  [[nodiscard]] std::string to_string(int decimal_places = kDecimalPlaces) const;

  [[nodiscard]] constexpr bool is_negative() const noexcept { return scaled_ < 0; }

  // Empty when the exact result does not fit the backing integer.
  [[nodiscard]] std::optional<Amount> checked_add(Amount rhs) const noexcept;
  [[nodiscard]] std::optional<Amount> checked_sub(Amount rhs) const noexcept;

  constexpr Amount operator-() const noexcept { return from_scaled(-scaled_); }

  constexpr Amount& operator+=(Amount rhs) noexcept {
    scaled_ += rhs.scaled_;
    return *this;
  }

  constexpr Amount& operator-=(Amount rhs) noexcept {
    scaled_ -= rhs.scaled_;
    return *this;
  }

  friend constexpr Amount operator+(Amount lhs, Amount rhs) noexcept { return lhs += rhs; }
  friend constexpr Amount operator-(Amount lhs, Amount rhs) noexcept { return lhs -= rhs; }

  friend constexpr bool operator==(Amount lhs, Amount rhs) noexcept { return lhs.scaled_ == rhs.scaled_; }
  friend constexpr bool operator!=(Amount lhs, Amount rhs) noexcept { return lhs.scaled_ != rhs.scaled_; }
  friend constexpr bool operator<(Amount lhs, Amount rhs) noexcept { return lhs.scaled_ < rhs.scaled_; }
  friend constexpr bool operator<=(Amount lhs, Amount rhs) noexcept { return lhs.scaled_ <= rhs.scaled_; }
  friend constexpr bool operator>(Amount lhs, Amount rhs) noexcept { return lhs.scaled_ > rhs.scaled_; }
  friend constexpr bool operator>=(Amount lhs, Amount rhs) noexcept { return lhs.scaled_ >= rhs.scaled_; }

 private:
  std::int64_t scaled_{0};
};

std::ostream& operator<<(std::ostream& os, Amount amount);

}  // namespace common
}  // namespace clearledger
