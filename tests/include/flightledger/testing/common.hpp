#pragma once

#include <flightledger/chain/chain_builder.hpp>
#include <flightledger/schema/log_entry.hpp>
#include <flightledger/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace flightledger::testing {

inline constexpr auto kMissionId = std::string_view{"mission-alpha"};
inline constexpr auto kMissionStart =
    flightledger::schema::timestamp_milliseconds_t{1700000000000};

inline flightledger::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = flightledger::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// A telemetry sample shaped like the flight controller's GPS records.
inline flightledger::schema::log_entry_t make_entry(const uint64_t index) {
  auto entry = flightledger::schema::log_entry_t{};
  entry.index = index;
  entry.timestamp = kMissionStart + (index * 100);
  entry.entry_type = "GPS";
  entry.fields["lat"] = 47.3977 + (static_cast<double>(index) * 0.0001);
  entry.fields["lon"] = 8.5456;
  entry.fields["alt"] = static_cast<int64_t>(488 + index);
  entry.fields["sats"] = static_cast<uint64_t>(12);
  entry.fields["status"] = "3D_FIX";
  return entry;
}

inline std::vector<flightledger::schema::log_entry_t> make_log(
    const uint64_t count) {
  auto log = std::vector<flightledger::schema::log_entry_t>{};
  log.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    log.push_back(make_entry(i));
  }
  return log;
}

/// Chain with a checkpoint after every entry.
inline flightledger::chain::chain_builder build_chain(
    const std::vector<flightledger::schema::log_entry_t>& log,
    const flightledger::schema::hash_algorithm algorithm =
        flightledger::schema::kDefaultHashAlgorithm,
    const uint64_t checkpoint_interval = 1) {
  auto builder = flightledger::chain::chain_builder{
      std::string{kMissionId}, algorithm, checkpoint_interval};
  for (const auto& entry : log) {
    builder.append(entry);
  }
  return builder;
}

inline std::filesystem::path make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (std::string{prefix} + "_" +
          std::to_string(static_cast<unsigned long long>(now)));
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace flightledger::testing
