#include <flightledger/common/error.hpp>
#include <flightledger/config/options.hpp>
#include <flightledger/testing/common.hpp>
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

TEST(options, empty_input_keeps_defaults) {
  auto input = std::istringstream{""};
  auto options = flightledger::config::load_options(input);
  EXPECT_EQ(options.algorithm, flightledger::schema::hash_algorithm::blake3_256);
  EXPECT_EQ(options.checkpoint_interval, 1u);
  EXPECT_EQ(options.log_level, "info");
  EXPECT_TRUE(options.log_file.empty());
}

TEST(options, parses_every_key) {
  auto input = std::istringstream{
      "hash_algorithm = sha256\n"
      "checkpoint_interval = 16\n"
      "[log]\n"
      "level = debug\n"
      "file = /tmp/flightledger.log\n"};
  auto options = flightledger::config::load_options(input);
  EXPECT_EQ(options.algorithm, flightledger::schema::hash_algorithm::sha256);
  EXPECT_EQ(options.checkpoint_interval, 16u);
  EXPECT_EQ(options.log_level, "debug");
  EXPECT_EQ(options.log_file, "/tmp/flightledger.log");
}

TEST(options, dotted_keys_match_sections) {
  auto input = std::istringstream{"log.level = warn\n"};
  auto options = flightledger::config::load_options(input);
  EXPECT_EQ(options.log_level, "warn");
}

TEST(options, rejects_unknown_key) {
  auto input = std::istringstream{"retries = 3\n"};
  EXPECT_THROW(flightledger::config::load_options(input),
               flightledger::common::configuration_error);
}

TEST(options, rejects_unknown_algorithm) {
  auto input = std::istringstream{"hash_algorithm = md5\n"};
  try {
    flightledger::config::load_options(input);
    FAIL() << "expected configuration_error";
  } catch (const flightledger::common::configuration_error& ex) {
    EXPECT_EQ(ex.code(),
              flightledger::schema::ledger_error_code::invalid_configuration);
  }
}

TEST(options, rejects_bad_interval_and_level) {
  auto negative = std::istringstream{"checkpoint_interval = -4\n"};
  EXPECT_THROW(flightledger::config::load_options(negative),
               flightledger::common::configuration_error);

  auto text = std::istringstream{"checkpoint_interval = often\n"};
  EXPECT_THROW(flightledger::config::load_options(text),
               flightledger::common::configuration_error);

  auto level = std::istringstream{"log.level = chatty\n"};
  EXPECT_THROW(flightledger::config::load_options(level),
               flightledger::common::configuration_error);

  auto off = std::istringstream{"log.level = off\n"};
  EXPECT_EQ(flightledger::config::load_options(off).log_level, "off");
}

TEST(options, loads_from_file) {
  auto path = flightledger::testing::make_temp_path("flightledger_options");
  {
    auto out = std::ofstream{path};
    out << "checkpoint_interval = 0\n";
  }
  auto options = flightledger::config::load_options_file(path);
  EXPECT_EQ(options.checkpoint_interval, 0u);
  flightledger::testing::remove_path(path);
}

TEST(options, missing_file_is_a_configuration_error) {
  auto path = flightledger::testing::make_temp_path("flightledger_missing");
  EXPECT_THROW(flightledger::config::load_options_file(path),
               flightledger::common::configuration_error);
}
