#include <flightledger/chain/canonicalizer.hpp>
#include <flightledger/chain/chain_builder.hpp>
#include <flightledger/chain/digest.hpp>
#include <flightledger/chain/entry_hasher.hpp>
#include <flightledger/common/error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

using namespace flightledger::schema;

namespace flightledger::chain {

chain_link_t append(const hash_algorithm algorithm,
                    const std::optional<chain_link_t>& prev,
                    const log_entry_t& entry) {
  const auto expected_index = prev.has_value() ? prev->index + 1 : 0;
  if (entry.index < expected_index) {
    throw flightledger::common::sequence_error{
        "append out of order: the chain is append-only", expected_index,
        entry.index};
  }
  if (entry.index > expected_index) {
    throw flightledger::common::sequence_error{"gap in entry indices",
                                               expected_index, entry.index};
  }

  auto link = chain_link_t{};
  link.index = entry.index;
  link.entry_hash = hash_entry(algorithm, canonicalize(entry));
  link.prev_chain_hash =
      prev.has_value() ? prev->chain_hash : genesis_chain_hash();
  link.chain_hash = link_hash(algorithm, link.entry_hash,
                              link.prev_chain_hash, link.index);
  return link;
}

checkpoint_t make_checkpoint(const hash_algorithm algorithm,
                             const chain_link_t& link,
                             const timestamp_milliseconds_t timestamp) {
  return checkpoint_t{.version = 1,
                      .index = link.index,
                      .chain_hash = link.chain_hash,
                      .timestamp = timestamp,
                      .algorithm = algorithm};
}

std::vector<uint64_t> plan_checkpoints(const uint64_t total_entries,
                                       uint64_t batches) {
  auto plan = std::vector<uint64_t>{};
  if (total_entries == 0) {
    return plan;
  }
  if (batches == 0 || batches > total_entries) {
    batches = total_entries;
  }

  const auto base = total_entries / batches;
  const auto remainder = total_entries % batches;
  plan.reserve(batches);
  auto covered = uint64_t{0};
  for (uint64_t i = 0; i < batches; ++i) {
    covered += base + (i < remainder ? 1 : 0);
    plan.push_back(covered - 1);
  }
  return plan;
}

chain_builder::chain_builder(mission_id_t mission_id,
                             const hash_algorithm algorithm,
                             const uint64_t checkpoint_interval)
    : mission_id_{std::move(mission_id)},
      algorithm_{algorithm},
      checkpoint_interval_{checkpoint_interval} {
  spdlog::debug("Starting chain for mission '{}' with {} (checkpoint every {})",
                mission_id_, to_string(algorithm_), checkpoint_interval_);
}

const chain_link_t& chain_builder::append(const log_entry_t& entry) {
  auto link = flightledger::chain::append(algorithm_, tip(), entry);
  links_.push_back(link);
  tip_timestamp_ = entry.timestamp;

  if (checkpoint_interval_ != 0 &&
      ((link.index + 1) % checkpoint_interval_) == 0) {
    checkpoints_.push_back(make_checkpoint(algorithm_, link, entry.timestamp));
    spdlog::debug("Mission '{}' checkpoint at index {}", mission_id_,
                  link.index);
  }
  return links_.back();
}

checkpoint_t chain_builder::checkpoint() const {
  if (links_.empty()) {
    throw flightledger::common::sequence_error{fmt::format(
        "mission '{}' has no entries to checkpoint", mission_id_)};
  }
  return make_checkpoint(algorithm_, links_.back(), tip_timestamp_);
}

mission_digest_t chain_builder::finalize(
    const timestamp_milliseconds_t created_at) const {
  auto digest = flightledger::chain::finalize(algorithm_, mission_id_, tip(),
                                              links_.size(), created_at);
  spdlog::info("Mission '{}' digest over {} entries: {}", mission_id_,
               digest.entry_count, to_hex(digest.digest));
  return digest;
}

std::optional<chain_link_t> chain_builder::tip() const {
  if (links_.empty()) {
    return std::nullopt;
  }
  return links_.back();
}

}  // namespace flightledger::chain
