#include "clearledger/ingest/csv_reader.hpp"

#include <charconv>
#include <optional>
#include <system_error>
#include <utility>

namespace clearledger {
namespace ingest {

namespace {

constexpr char kDelimiter = ',';

std::string_view error_label(ParseErrorKind kind) noexcept {
  switch (kind) {
    case ParseErrorKind::kMissingTransactionType: return "Missing transaction type";
    case ParseErrorKind::kInvalidTransactionType: return "Invalid transaction type";
    case ParseErrorKind::kMissingClientId: return "Missing client id";
    case ParseErrorKind::kInvalidClientId: return "Invalid client id";
    case ParseErrorKind::kMissingTransactionId: return "Missing transaction id";
    case ParseErrorKind::kInvalidTransactionId: return "Invalid transaction id";
    case ParseErrorKind::kMissingAmount: return "Missing amount";
    case ParseErrorKind::kInvalidAmount: return "Invalid amount";
  }
  return "Invalid transaction";
}

std::string format_error(std::size_t line, ParseErrorKind kind, const std::string& token) {
  std::string message = "Invalid transaction on line " + std::to_string(line) + ": ";
  message += error_label(kind);
  if (!token.empty()) {
    message += " \"" + token + "\"";
  }
  return message;
}

std::string_view trim(std::string_view text) noexcept {
  constexpr std::string_view kSpace = " \t\r\n\v\f";
  const auto first = text.find_first_not_of(kSpace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kSpace);
  return text.substr(first, last - first + 1);
}

// Splits on commas, handing out trimmed fields one at a time.
class FieldCursor {
 public:
  explicit FieldCursor(std::string_view line) : rest_(line) {}

  std::optional<std::string_view> next() {
    if (exhausted_) {
      return std::nullopt;
    }
    const auto comma = rest_.find(kDelimiter);
    std::string_view field = rest_.substr(0, comma);
    if (comma == std::string_view::npos) {
      exhausted_ = true;
      rest_ = {};
    } else {
      rest_.remove_prefix(comma + 1);
    }
    return trim(field);
  }

 private:
  std::string_view rest_;
  bool exhausted_{false};
};

template <typename T>
std::optional<T> parse_unsigned(std::string_view token) {
  T value{};
  const auto* first = token.data();
  const auto* last = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (token.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

ParseError::ParseError(std::size_t line, ParseErrorKind kind, std::string token)
    : std::runtime_error(format_error(line, kind, token)),
      line_(line),
      kind_(kind),
      token_(std::move(token)) {}

ledger::ClientTransaction parse_transaction(std::string_view line, std::size_t line_number) {
  FieldCursor fields(line);

  const auto type = fields.next();
  if (!type || type->empty()) {
    throw ParseError(line_number, ParseErrorKind::kMissingTransactionType, {});
  }

  const auto client_token = fields.next();
  if (!client_token) {
    throw ParseError(line_number, ParseErrorKind::kMissingClientId, {});
  }
  const auto client = parse_unsigned<common::ClientId>(*client_token);
  if (!client) {
    throw ParseError(line_number, ParseErrorKind::kInvalidClientId, std::string(*client_token));
  }

  const auto tx_token = fields.next();
  if (!tx_token) {
    throw ParseError(line_number, ParseErrorKind::kMissingTransactionId, {});
  }
  const auto tx_id = parse_unsigned<common::TransactionId>(*tx_token);
  if (!tx_id) {
    throw ParseError(line_number, ParseErrorKind::kInvalidTransactionId, std::string(*tx_token));
  }

  auto amount = [&]() -> common::Amount {
    const auto token = fields.next();
    if (!token) {
      throw ParseError(line_number, ParseErrorKind::kMissingAmount, {});
    }
    const auto parsed = common::Amount::parse(*token);
    if (!parsed || parsed->is_negative()) {
      throw ParseError(line_number, ParseErrorKind::kInvalidAmount, std::string(*token));
    }
    return *parsed;
  };

  ledger::ClientTransaction out{.client = *client, .tx = {}};
  if (*type == "deposit") {
    out.tx = ledger::Deposit{.tx_id = *tx_id, .amount = amount()};
  } else if (*type == "withdrawal") {
    out.tx = ledger::Withdrawal{.tx_id = *tx_id, .amount = amount()};
  } else if (*type == "dispute") {
    out.tx = ledger::Dispute{.tx_id = *tx_id};
  } else if (*type == "resolve") {
    out.tx = ledger::Resolve{.tx_id = *tx_id};
  } else if (*type == "chargeback") {
    out.tx = ledger::Chargeback{.tx_id = *tx_id};
  } else {
    throw ParseError(line_number, ParseErrorKind::kInvalidTransactionType, std::string(*type));
  }
  return out;
}

CsvReader::CsvReader(std::istream& input) : CsvReader(input, Config{}) {}

CsvReader::CsvReader(std::istream& input, Config config) : input_(&input), config_(config) {}

bool CsvReader::next(ledger::ClientTransaction& out) {
  while (std::getline(*input_, line_)) {
    ++line_number_;
    const auto trimmed = trim(line_);
    if (trimmed.empty()) {
      continue;
    }
    if (config_.skip_header && line_number_ == 1) {
      FieldCursor fields(trimmed);
      if (fields.next() == std::string_view{"type"}) {
        continue;
      }
    }
    out = parse_transaction(trimmed, line_number_);
    return true;
  }

  if (input_->bad()) {
    throw std::runtime_error("Error reading line " + std::to_string(line_number_ + 1));
  }
  return false;
}

}  // namespace ingest
}  // namespace clearledger
