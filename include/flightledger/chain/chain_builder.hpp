#pragma once

#include <flightledger/schema/chain_link.hpp>
#include <flightledger/schema/checkpoint.hpp>
#include <flightledger/schema/hash_algorithm.hpp>
#include <flightledger/schema/log_entry.hpp>
#include <flightledger/schema/mission_digest.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flightledger::chain {

/// Link one entry onto `prev` (or onto genesis when `prev` is empty).
///
/// `entry.index` must be `prev->index + 1`, or 0 without a predecessor. A
/// lower index is an out-of-order append and a higher one leaves a gap; both
/// throw `common::sequence_error`. Canonicalization failures surface as
/// `common::malformed_input_error`.
flightledger::schema::chain_link_t append(
    flightledger::schema::hash_algorithm algorithm,
    const std::optional<flightledger::schema::chain_link_t>& prev,
    const flightledger::schema::log_entry_t& entry);

/// Read-only snapshot of a link as a trust anchor.
flightledger::schema::checkpoint_t make_checkpoint(
    flightledger::schema::hash_algorithm algorithm,
    const flightledger::schema::chain_link_t& link,
    flightledger::schema::timestamp_milliseconds_t timestamp);

/// Checkpoint indices for a mission uploaded in `batches` cumulative batches.
///
/// Each value is the last entry index of a batch; the remainder of
/// `total_entries / batches` goes to the earliest batches. `batches` of 0 or
/// above `total_entries` yields one checkpoint per entry.
std::vector<uint64_t> plan_checkpoints(uint64_t total_entries,
                                       uint64_t batches);

/// Append-only hash chain of a single mission.
///
/// Owns the arena of links indexed by sequence index. Not synchronized: one
/// producer drives a builder at a time.
class chain_builder final {
 public:
  /// `checkpoint_interval` records a checkpoint after every N-th entry;
  /// 0 leaves checkpointing entirely to the caller.
  explicit chain_builder(
      flightledger::schema::mission_id_t mission_id,
      flightledger::schema::hash_algorithm algorithm =
          flightledger::schema::kDefaultHashAlgorithm,
      uint64_t checkpoint_interval = 0);

  const flightledger::schema::chain_link_t& append(
      const flightledger::schema::log_entry_t& entry);

  /// Snapshot of the current tip stamped with the tip entry's timestamp.
  /// Throws `common::sequence_error` before the first append.
  flightledger::schema::checkpoint_t checkpoint() const;

  /// Digest over every entry appended so far; valid mid-mission.
  flightledger::schema::mission_digest_t finalize(
      flightledger::schema::timestamp_milliseconds_t created_at) const;

  std::optional<flightledger::schema::chain_link_t> tip() const;
  const std::vector<flightledger::schema::chain_link_t>& links() const {
    return links_;
  }
  const std::vector<flightledger::schema::checkpoint_t>& checkpoints() const {
    return checkpoints_;
  }
  uint64_t size() const { return links_.size(); }
  bool empty() const { return links_.empty(); }
  const flightledger::schema::mission_id_t& mission_id() const {
    return mission_id_;
  }
  flightledger::schema::hash_algorithm algorithm() const { return algorithm_; }

 private:
  flightledger::schema::mission_id_t mission_id_;
  flightledger::schema::hash_algorithm algorithm_;
  uint64_t checkpoint_interval_{};
  flightledger::schema::timestamp_milliseconds_t tip_timestamp_{};
  std::vector<flightledger::schema::chain_link_t> links_;
  std::vector<flightledger::schema::checkpoint_t> checkpoints_;
};

}  // namespace flightledger::chain
