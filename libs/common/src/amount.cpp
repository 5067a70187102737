#include "clearledger/common/amount.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <ostream>

namespace clearledger {
namespace common {

namespace {

constexpr double kTwoPow63 = 9223372036854775808.0;
constexpr std::uint64_t kPositiveLimit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
constexpr std::uint64_t kNegativeLimit = kPositiveLimit + 1;

constexpr std::uint64_t pow10(int exponent) noexcept {
  std::uint64_t value = 1;
  for (int i = 0; i < exponent; ++i) {
    value *= 10;
  }
  return value;
}

bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

bool all_digits(std::string_view text) noexcept {
  return std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

std::optional<Amount> Amount::from_double(double value) noexcept {
  const double scaled = std::round(value * static_cast<double>(kScale));
  if (!std::isfinite(scaled) || scaled >= kTwoPow63 || scaled < -kTwoPow63) {
    return std::nullopt;
  }
  return from_scaled(static_cast<std::int64_t>(scaled));
}

std::optional<Amount> Amount::parse(std::string_view text) noexcept {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '+' || text.front() == '-') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  if (!all_digits(whole) || !all_digits(fraction)) {
    return std::nullopt;
  }

  const std::uint64_t limit = negative ? kNegativeLimit : kPositiveLimit;
  std::uint64_t magnitude = 0;
  for (const char c : whole) {
    const auto digit = static_cast<std::uint64_t>(c - '0');
    if (magnitude > (limit - digit) / 10) {
      return std::nullopt;
    }
    magnitude = magnitude * 10 + digit;
  }

  if (magnitude > limit / static_cast<std::uint64_t>(kScale)) {
    return std::nullopt;
  }
  magnitude *= static_cast<std::uint64_t>(kScale);

  std::uint64_t fractional = 0;
  std::uint64_t weight = static_cast<std::uint64_t>(kScale) / 10;
  for (std::size_t i = 0; i < fraction.size() && i < static_cast<std::size_t>(kDecimalPlaces); ++i) {
    fractional += static_cast<std::uint64_t>(fraction[i] - '0') * weight;
    weight /= 10;
  }
  if (fraction.size() > static_cast<std::size_t>(kDecimalPlaces) && fraction[kDecimalPlaces] >= '5') {
    ++fractional;
  }

  if (magnitude > limit - fractional) {
    return std::nullopt;
  }
  magnitude += fractional;

  return from_scaled(negative ? static_cast<std::int64_t>(0 - magnitude) : static_cast<std::int64_t>(magnitude));
}

std::optional<Amount> Amount::checked_add(Amount rhs) const noexcept {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if ((rhs.scaled_ > 0 && scaled_ > kMax - rhs.scaled_) || (rhs.scaled_ < 0 && scaled_ < kMin - rhs.scaled_)) {
    return std::nullopt;
  }
  return from_scaled(scaled_ + rhs.scaled_);
}

std::optional<Amount> Amount::checked_sub(Amount rhs) const noexcept {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if ((rhs.scaled_ < 0 && scaled_ > kMax + rhs.scaled_) || (rhs.scaled_ > 0 && scaled_ < kMin + rhs.scaled_)) {
    return std::nullopt;
  }
  return from_scaled(scaled_ - rhs.scaled_);
}

double Amount::to_double() const noexcept {
  return static_cast<double>(scaled_) / static_cast<double>(kScale);
}

std::string Amount::to_string(int decimal_places) const {
  const int places = std::clamp(decimal_places, 0, kDecimalPlaces);
  const std::uint64_t magnitude = scaled_ < 0 ? 0 - static_cast<std::uint64_t>(scaled_)
                                              : static_cast<std::uint64_t>(scaled_);
  const std::uint64_t divisor = pow10(kDecimalPlaces - places);
  const std::uint64_t rounded = (magnitude + divisor / 2) / divisor;
  const std::uint64_t unit = pow10(places);

  std::string out;
  if (scaled_ < 0 && rounded != 0) {
    out.push_back('-');
  }
  out += std::to_string(rounded / unit);
  if (places > 0) {
    const std::string digits = std::to_string(rounded % unit);
    out.push_back('.');
    out.append(static_cast<std::size_t>(places) - digits.size(), '0');
    out += digits;
  }
  return out;
}

std::ostream& operator<<(std::ostream& os, Amount amount) {
  return os << amount.to_string();
}

}  // namespace common
}  // namespace clearledger
