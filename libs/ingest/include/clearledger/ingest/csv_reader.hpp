#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "clearledger/ledger/transaction.hpp"

namespace clearledger {
namespace ingest {

enum class ParseErrorKind : std::uint8_t {
  kMissingTransactionType,
  kInvalidTransactionType,
  kMissingClientId,
  kInvalidClientId,
  kMissingTransactionId,
  kInvalidTransactionId,
  kMissingAmount,
  kInvalidAmount,
};

class ParseError : public std::runtime_error {
 public:
  ParseError(std::size_t line, ParseErrorKind kind, std::string token);

  [[nodiscard]] std::size_t line() const noexcept { return line_; }
  [[nodiscard]] ParseErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& token() const noexcept { return token_; }

 private:
  std::size_t line_;
  ParseErrorKind kind_;
  std::string token_;
};

// Parses one "type, client, tx[, amount]" record. Throws ParseError tagged
// with `line_number` when a field is missing or malformed.
[[nodiscard]] ledger::ClientTransaction parse_transaction(std::string_view line, std::size_t line_number);

class CsvReader {
 public:
  struct Config {
    bool skip_header{true};
  };

  explicit CsvReader(std::istream& input);
  CsvReader(std::istream& input, Config config);

  // Reads up to the next transaction, skipping blank lines and a leading
  // header. Returns false at end of input. Throws ParseError for a malformed
  // line (the line is consumed, so reading may continue) and
  // std::runtime_error when the stream fails.
  bool next(ledger::ClientTransaction& out);

  // 1-based number of the last line consumed.
  [[nodiscard]] std::size_t line_number() const noexcept { return line_number_; }

 private:
  std::istream* input_;
  Config config_{};
  std::size_t line_number_{0};
  std::string line_{};
};

}  // namespace ingest
}  // namespace clearledger
