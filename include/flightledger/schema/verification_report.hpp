#pragma once

#include <flightledger/schema/primitives.hpp>
#include <flightledger/schema/verification_result.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: verification report.
// Integrity workflow: sole artifact handed to the reporting collaborator.
// Built fresh by every verification call and never persisted by the engine.
namespace flightledger::schema {

template <uint16_t Version>
struct checkpoint_outcome;

/// One row per expected checkpoint that the run reached.
template <>
struct checkpoint_outcome<1> final {
  uint16_t version{1};
  uint64_t index{};
  hash32_t expected_chain_hash{};
  std::optional<hash32_t> recomputed_chain_hash;
  checkpoint_status status{checkpoint_status::matched};
};

using checkpoint_outcome_t = checkpoint_outcome<1>;

template <uint16_t Version>
struct verification_report;

template <>
struct verification_report<1> final {
  uint16_t version{1};
  verification_result result{verification_result::fail};
  std::optional<uint64_t> first_divergence_index;
  // Highest expected index confirmed before the divergence; with sparse
  // checkpoints the tampering lies in (last_matched_index, divergence].
  std::optional<uint64_t> last_matched_index;
  divergence_kind divergence{divergence_kind::none};
  hash32_t recomputed_digest{};
  hash32_t expected_digest{};
  uint64_t checked_entry_count{};
  uint64_t uncovered_suffix_length{};
  std::vector<checkpoint_outcome_t> checkpoints;
};

using verification_report_t = verification_report<1>;

}  // namespace flightledger::schema
