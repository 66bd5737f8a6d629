#pragma once

#include <flightledger/schema/hash_algorithm.hpp>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>

namespace flightledger::config {

struct ledger_options final {
  flightledger::schema::hash_algorithm algorithm{
      flightledger::schema::kDefaultHashAlgorithm};
  uint64_t checkpoint_interval{1};
  std::string log_level{"info"};
  // Empty keeps logging on stdout only.
  std::string log_file;
};

/// Parse INI-style options:
///
///   hash_algorithm = sha256
///   checkpoint_interval = 16
///   [log]
///   level = debug
///   file = /var/log/flightledger.log
///
/// Missing keys keep their defaults. Unknown keys, algorithm names or log
/// levels throw `common::configuration_error`.
ledger_options load_options(std::istream& input);

ledger_options load_options_file(const std::filesystem::path& path);

}  // namespace flightledger::config
