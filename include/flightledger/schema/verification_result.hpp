#pragma once

#include <array>
#include <flightledger/schema/enum_string.hpp>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: verification result.
// Integrity workflow: outcome taxonomy of a verification run. A FAIL is the
// normal tamper finding, not an error.
namespace flightledger::schema {

enum class verification_result : uint8_t {
  pass = 0,
  fail = 1,
};

enum class divergence_kind : uint8_t {
  none = 0,
  content_mismatch = 1,
  missing_entries = 2,
};

enum class checkpoint_status : uint8_t {
  matched = 0,
  mismatched = 1,
  missing_entry = 2,
};

inline constexpr auto kVerificationResultMappings = std::array{
    std::pair<std::string_view, verification_result>{
        "PASS", verification_result::pass},
    std::pair<std::string_view, verification_result>{
        "FAIL", verification_result::fail},
};

inline constexpr auto kDivergenceKindMappings = std::array{
    std::pair<std::string_view, divergence_kind>{"none",
                                                 divergence_kind::none},
    std::pair<std::string_view, divergence_kind>{
        "content_mismatch", divergence_kind::content_mismatch},
    std::pair<std::string_view, divergence_kind>{
        "missing_entries", divergence_kind::missing_entries},
};

inline constexpr auto kCheckpointStatusMappings = std::array{
    std::pair<std::string_view, checkpoint_status>{"ok",
                                                   checkpoint_status::matched},
    std::pair<std::string_view, checkpoint_status>{
        "mismatch", checkpoint_status::mismatched},
    std::pair<std::string_view, checkpoint_status>{
        "missing_entry", checkpoint_status::missing_entry},
};

inline constexpr std::string_view to_string(const verification_result value) {
  return to_string(value, kVerificationResultMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const divergence_kind value) {
  return to_string(value, kDivergenceKindMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const checkpoint_status value) {
  return to_string(value, kCheckpointStatusMappings).value_or("unknown");
}

}  // namespace flightledger::schema
