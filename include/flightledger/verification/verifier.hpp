#pragma once

#include <flightledger/schema/checkpoint.hpp>
#include <flightledger/schema/hash_algorithm.hpp>
#include <flightledger/schema/log_entry.hpp>
#include <flightledger/schema/mission_digest.hpp>
#include <flightledger/schema/verification_report.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace flightledger::verification {

enum class run_state : uint8_t {
  start = 0,
  recomputing = 1,
  matched = 2,
  diverged = 3,
  done = 4,
};

/// One verification pass, advanced a single transition per `step()`.
///
/// Start -> Recomputing(i) -> Matched(i) -> Recomputing(i+1) ... and
/// Diverged(i) -> Done, or Matched(last) -> Done. Each Recomputing step
/// rehashes one candidate entry. Callers may stop stepping at any time; the
/// report is only final once `done()`.
///
/// The run borrows the candidate entries; they must outlive it.
class verification_run final {
 public:
  verification_run(
      flightledger::schema::hash_algorithm algorithm,
      std::span<const flightledger::schema::log_entry_t> candidate,
      uint64_t start_index,
      const flightledger::schema::hash32_t& seed_chain_hash,
      std::vector<flightledger::schema::checkpoint_t> targets,
      std::optional<flightledger::schema::mission_digest_t> digest);

  run_state step();
  bool done() const { return state_ == run_state::done; }
  run_state state() const { return state_; }

  /// Chain index of the next entry to recompute.
  uint64_t position() const { return position_; }
  const flightledger::schema::verification_report_t& report() const {
    return report_;
  }

 private:
  void recompute_next();
  void finish();
  uint64_t consumed() const { return position_ - start_index_; }

  flightledger::schema::hash_algorithm algorithm_;
  std::span<const flightledger::schema::log_entry_t> candidate_;
  uint64_t start_index_{};
  uint64_t position_{};
  flightledger::schema::hash32_t chain_hash_{};
  std::vector<flightledger::schema::checkpoint_t> targets_;
  std::size_t next_target_{};
  std::optional<flightledger::schema::mission_digest_t> digest_;
  run_state state_{run_state::start};
  flightledger::schema::verification_report_t report_;
};

/// Recomputes a candidate log and compares it against expected material.
///
/// Stateless apart from the hash algorithm; a single instance may serve
/// concurrent verifications over immutable histories.
///
/// Every entry point throws `common::algorithm_mismatch_error` when expected
/// material names a different algorithm and `common::malformed_input_error`
/// when the expected history is malformed or a candidate entry cannot be
/// canonicalized. Tampering is reported as a FAIL, never thrown.
class verifier final {
 public:
  explicit verifier(flightledger::schema::hash_algorithm algorithm =
                        flightledger::schema::kDefaultHashAlgorithm);

  flightledger::schema::verification_report_t verify(
      std::span<const flightledger::schema::log_entry_t> candidate,
      const flightledger::schema::mission_digest_t& expected) const;

  flightledger::schema::verification_report_t verify(
      std::span<const flightledger::schema::log_entry_t> candidate,
      const std::vector<flightledger::schema::checkpoint_t>& expected) const;

  /// Verify only the entries after a trusted checkpoint. `suffix[0]` is the
  /// entry at `anchor.index + 1`.
  flightledger::schema::verification_report_t verify_from(
      const flightledger::schema::checkpoint_t& anchor,
      std::span<const flightledger::schema::log_entry_t> suffix,
      const std::vector<flightledger::schema::checkpoint_t>& expected) const;

  verification_run begin(
      std::span<const flightledger::schema::log_entry_t> candidate,
      const flightledger::schema::mission_digest_t& expected) const;

  verification_run begin(
      std::span<const flightledger::schema::log_entry_t> candidate,
      const std::vector<flightledger::schema::checkpoint_t>& expected) const;

  verification_run begin_from(
      const flightledger::schema::checkpoint_t& anchor,
      std::span<const flightledger::schema::log_entry_t> suffix,
      const std::vector<flightledger::schema::checkpoint_t>& expected) const;

  flightledger::schema::hash_algorithm algorithm() const { return algorithm_; }

 private:
  void require_algorithm(flightledger::schema::hash_algorithm actual) const;

  flightledger::schema::hash_algorithm algorithm_;
};

/// Drive `run` until it reaches Done and return its report.
flightledger::schema::verification_report_t run_to_completion(
    verification_run& run);

}  // namespace flightledger::verification
