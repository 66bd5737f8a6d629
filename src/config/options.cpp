#include <flightledger/common/error.hpp>
#include <flightledger/config/options.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>

#include <cstdint>
#include <fstream>
#include <string>

using namespace flightledger::schema;

namespace po = boost::program_options;

namespace flightledger::config {

ledger_options load_options(std::istream& input) {
  auto options = ledger_options{};
  auto algorithm = std::string{to_string(options.algorithm)};
  auto checkpoint_interval = static_cast<int64_t>(options.checkpoint_interval);

  auto description = po::options_description{"flightledger"};
  description.add_options()(
      "hash_algorithm",
      po::value<std::string>(&algorithm)->default_value(algorithm),
      "hash function for entries, links and digests (blake3-256, sha256)")(
      "checkpoint_interval",
      po::value<int64_t>(&checkpoint_interval)
          ->default_value(checkpoint_interval),
      "record a checkpoint after every N entries; 0 disables")(
      "log.level",
      po::value<std::string>(&options.log_level)
          ->default_value(options.log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log.file", po::value<std::string>(&options.log_file),
      "optional log file in addition to stdout");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(input, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    throw flightledger::common::configuration_error{
        fmt::format("invalid configuration: {}", ex.what())};
  }

  auto parsed_algorithm = try_hash_algorithm_from_string(algorithm);
  if (!parsed_algorithm.has_value()) {
    throw flightledger::common::configuration_error{
        fmt::format("unknown hash_algorithm '{}'", algorithm)};
  }
  options.algorithm = *parsed_algorithm;

  if (checkpoint_interval < 0) {
    throw flightledger::common::configuration_error{fmt::format(
        "checkpoint_interval must not be negative, got {}",
        checkpoint_interval)};
  }
  options.checkpoint_interval = static_cast<uint64_t>(checkpoint_interval);

  if (spdlog::level::from_str(options.log_level) == spdlog::level::off &&
      options.log_level != "off") {
    throw flightledger::common::configuration_error{
        fmt::format("unknown log.level '{}'", options.log_level)};
  }
  return options;
}

ledger_options load_options_file(const std::filesystem::path& path) {
  auto input = std::ifstream{path};
  if (!input.is_open()) {
    throw flightledger::common::configuration_error{
        fmt::format("cannot open configuration file '{}'", path.string())};
  }
  spdlog::debug("Loading options from {}", path.string());
  return load_options(input);
}

}  // namespace flightledger::config
