#pragma once

#include <flightledger/schema/hash_algorithm.hpp>
#include <flightledger/schema/ledger_error_code.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace flightledger::common {

/// Base of every error the engine raises to its caller.
///
/// Tamper findings are never errors; they are FAIL verification reports.
class ledger_error : public std::runtime_error {
 public:
  ledger_error(flightledger::schema::ledger_error_code code,
               const std::string& message);

  flightledger::schema::ledger_error_code code() const noexcept {
    return code_;
  }

 private:
  flightledger::schema::ledger_error_code code_;
};

/// A log entry, digest or checkpoint history that cannot be processed.
class malformed_input_error final : public ledger_error {
 public:
  explicit malformed_input_error(const std::string& message,
                                 std::optional<uint64_t> index = std::nullopt);

  /// Sequence index of the offending entry, when one is known.
  std::optional<uint64_t> index() const noexcept { return index_; }

 private:
  std::optional<uint64_t> index_;
};

/// Producer-side ordering bug: out-of-order append, index gap, a digest
/// requested over an inconsistent entry count, or a checkpoint of an empty
/// chain.
class sequence_error final : public ledger_error {
 public:
  explicit sequence_error(const std::string& message);
  sequence_error(const std::string& message,
                 uint64_t expected_index,
                 uint64_t actual_index);

  /// Both empty when the violation is not about a particular index.
  std::optional<uint64_t> expected_index() const noexcept {
    return expected_index_;
  }
  std::optional<uint64_t> actual_index() const noexcept {
    return actual_index_;
  }

 private:
  std::optional<uint64_t> expected_index_;
  std::optional<uint64_t> actual_index_;
};

/// Expected material was produced under a different hash function.
class algorithm_mismatch_error final : public ledger_error {
 public:
  algorithm_mismatch_error(flightledger::schema::hash_algorithm expected,
                           flightledger::schema::hash_algorithm actual);

  flightledger::schema::hash_algorithm expected() const noexcept {
    return expected_;
  }
  flightledger::schema::hash_algorithm actual() const noexcept {
    return actual_;
  }

 private:
  flightledger::schema::hash_algorithm expected_;
  flightledger::schema::hash_algorithm actual_;
};

class configuration_error final : public ledger_error {
 public:
  explicit configuration_error(const std::string& message);
};

}  // namespace flightledger::common
