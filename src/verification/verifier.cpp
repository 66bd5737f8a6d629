#include <flightledger/chain/canonicalizer.hpp>
#include <flightledger/chain/digest.hpp>
#include <flightledger/chain/entry_hasher.hpp>
#include <flightledger/common/error.hpp>
#include <flightledger/verification/verifier.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>

using namespace flightledger::schema;

namespace flightledger::verification {

namespace {

void require_strictly_increasing(const std::vector<checkpoint_t>& history) {
  for (std::size_t i = 1; i < history.size(); ++i) {
    if (history[i].index <= history[i - 1].index) {
      throw flightledger::common::malformed_input_error{fmt::format(
          "checkpoint history is not strictly increasing: index {} follows {}",
          history[i].index, history[i - 1].index)};
    }
  }
}

}  // namespace

verification_run::verification_run(hash_algorithm algorithm,
                                   std::span<const log_entry_t> candidate,
                                   const uint64_t start_index,
                                   const hash32_t& seed_chain_hash,
                                   std::vector<checkpoint_t> targets,
                                   std::optional<mission_digest_t> digest)
    : algorithm_{algorithm},
      candidate_{candidate},
      start_index_{start_index},
      position_{start_index},
      chain_hash_{seed_chain_hash},
      targets_{std::move(targets)},
      digest_{std::move(digest)} {
  report_.recomputed_digest = seed_chain_hash;
  report_.expected_digest = seed_chain_hash;
}

run_state verification_run::step() {
  switch (state_) {
    case run_state::start:
      spdlog::debug(
          "Verifying {} candidate entries from index {} against {} expected "
          "checkpoints",
          candidate_.size(), start_index_, targets_.size());
      if (targets_.empty()) {
        finish();
      } else {
        state_ = run_state::recomputing;
      }
      break;
    case run_state::recomputing:
      recompute_next();
      break;
    case run_state::matched:
      if (next_target_ == targets_.size()) {
        finish();
      } else {
        state_ = run_state::recomputing;
      }
      break;
    case run_state::diverged:
      finish();
      break;
    case run_state::done:
      break;
  }
  return state_;
}

void verification_run::recompute_next() {
  const auto& target = targets_[next_target_];
  if (consumed() >= candidate_.size()) {
    report_.divergence = divergence_kind::missing_entries;
    report_.first_divergence_index = position_;
    report_.checkpoints.push_back(
        checkpoint_outcome_t{.index = target.index,
                             .expected_chain_hash = target.chain_hash,
                             .recomputed_chain_hash = std::nullopt,
                             .status = checkpoint_status::missing_entry});
    state_ = run_state::diverged;
    return;
  }

  const auto& entry = candidate_[consumed()];
  const auto entry_hash = flightledger::chain::hash_entry(
      algorithm_, flightledger::chain::canonicalize(entry));
  chain_hash_ = flightledger::chain::link_hash(algorithm_, entry_hash,
                                               chain_hash_, position_);
  const auto index = position_++;
  if (index != target.index) {
    state_ = run_state::recomputing;
    return;
  }

  auto outcome = checkpoint_outcome_t{.index = target.index,
                                      .expected_chain_hash = target.chain_hash,
                                      .recomputed_chain_hash = chain_hash_};
  if (chain_hash_ == target.chain_hash) {
    outcome.status = checkpoint_status::matched;
    report_.last_matched_index = index;
    ++next_target_;
    state_ = run_state::matched;
  } else {
    outcome.status = checkpoint_status::mismatched;
    report_.divergence = divergence_kind::content_mismatch;
    report_.first_divergence_index = index;
    state_ = run_state::diverged;
  }
  report_.checkpoints.push_back(outcome);
}

void verification_run::finish() {
  const auto passed = !report_.first_divergence_index.has_value();
  report_.result =
      passed ? verification_result::pass : verification_result::fail;
  report_.checked_entry_count = consumed();
  report_.uncovered_suffix_length = passed ? candidate_.size() - consumed() : 0;

  if (digest_.has_value()) {
    auto recomputed = mission_digest_t{.mission_id = digest_->mission_id,
                                       .algorithm = algorithm_,
                                       .final_chain_hash = chain_hash_,
                                       .entry_count = position_,
                                       .created_at = digest_->created_at};
    report_.recomputed_digest =
        flightledger::chain::compute_commitment(recomputed);
    report_.expected_digest = digest_->digest;
  } else {
    report_.recomputed_digest = chain_hash_;
    if (!targets_.empty()) {
      const auto decisive = passed ? targets_.size() - 1 : next_target_;
      report_.expected_digest = targets_[decisive].chain_hash;
    }
  }

  if (passed) {
    spdlog::info(
        "Verification PASS: {} entries recomputed, {} uncovered suffix "
        "entries",
        report_.checked_entry_count, report_.uncovered_suffix_length);
  } else {
    spdlog::warn(
        "Verification FAIL: {} at index {} (last matched checkpoint: {})",
        to_string(report_.divergence), *report_.first_divergence_index,
        report_.last_matched_index.has_value()
            ? std::to_string(*report_.last_matched_index)
            : std::string{"none"});
  }
  state_ = run_state::done;
}

verifier::verifier(const hash_algorithm algorithm) : algorithm_{algorithm} {}

void verifier::require_algorithm(const hash_algorithm actual) const {
  if (actual != algorithm_) {
    spdlog::error("Refusing to verify {} material with a {} verifier",
                  to_string(actual), to_string(algorithm_));
    throw flightledger::common::algorithm_mismatch_error{algorithm_, actual};
  }
}

verification_run verifier::begin(std::span<const log_entry_t> candidate,
                                 const mission_digest_t& expected) const {
  require_algorithm(expected.algorithm);
  if (flightledger::chain::compute_commitment(expected) != expected.digest) {
    throw flightledger::common::malformed_input_error{fmt::format(
        "mission digest for '{}' does not match its own fields",
        expected.mission_id)};
  }
  if (expected.entry_count == 0 &&
      expected.final_chain_hash != flightledger::chain::genesis_chain_hash()) {
    throw flightledger::common::malformed_input_error{
        "empty mission digest must commit to the genesis chain hash"};
  }

  auto targets = std::vector<checkpoint_t>{};
  if (expected.entry_count > 0) {
    targets.push_back(checkpoint_t{.index = expected.entry_count - 1,
                                   .chain_hash = expected.final_chain_hash,
                                   .timestamp = expected.created_at,
                                   .algorithm = expected.algorithm});
  }
  return verification_run{algorithm_,
                          candidate,
                          0,
                          flightledger::chain::genesis_chain_hash(),
                          std::move(targets),
                          expected};
}

verification_run verifier::begin(
    std::span<const log_entry_t> candidate,
    const std::vector<checkpoint_t>& expected) const {
  for (const auto& checkpoint : expected) {
    require_algorithm(checkpoint.algorithm);
  }
  require_strictly_increasing(expected);
  return verification_run{algorithm_,
                          candidate,
                          0,
                          flightledger::chain::genesis_chain_hash(),
                          expected,
                          std::nullopt};
}

verification_run verifier::begin_from(
    const checkpoint_t& anchor,
    std::span<const log_entry_t> suffix,
    const std::vector<checkpoint_t>& expected) const {
  require_algorithm(anchor.algorithm);
  for (const auto& checkpoint : expected) {
    require_algorithm(checkpoint.algorithm);
  }
  require_strictly_increasing(expected);

  auto targets = std::vector<checkpoint_t>{};
  for (const auto& checkpoint : expected) {
    if (checkpoint.index < anchor.index) {
      continue;
    }
    if (checkpoint.index == anchor.index) {
      if (checkpoint.chain_hash != anchor.chain_hash) {
        throw flightledger::common::malformed_input_error{fmt::format(
            "anchor checkpoint at index {} disagrees with the expected history",
            anchor.index)};
      }
      continue;
    }
    targets.push_back(checkpoint);
  }
  return verification_run{algorithm_,         suffix,
                          anchor.index + 1,   anchor.chain_hash,
                          std::move(targets), std::nullopt};
}

verification_report_t verifier::verify(std::span<const log_entry_t> candidate,
                                       const mission_digest_t& expected) const {
  auto run = begin(candidate, expected);
  return run_to_completion(run);
}

verification_report_t verifier::verify(
    std::span<const log_entry_t> candidate,
    const std::vector<checkpoint_t>& expected) const {
  auto run = begin(candidate, expected);
  return run_to_completion(run);
}

verification_report_t verifier::verify_from(
    const checkpoint_t& anchor,
    std::span<const log_entry_t> suffix,
    const std::vector<checkpoint_t>& expected) const {
  auto run = begin_from(anchor, suffix, expected);
  return run_to_completion(run);
}

verification_report_t run_to_completion(verification_run& run) {
  while (!run.done()) {
    run.step();
  }
  return run.report();
}

}  // namespace flightledger::verification
