#include <flightledger/chain/canonicalizer.hpp>
#include <flightledger/chain/chain_builder.hpp>
#include <flightledger/chain/entry_hasher.hpp>
#include <flightledger/common/error.hpp>
#include <flightledger/testing/common.hpp>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr auto kAlgorithm = flightledger::schema::hash_algorithm::blake3_256;

}  // namespace

TEST(chain_builder, first_link_chains_from_genesis) {
  auto entry = flightledger::testing::make_entry(0);
  auto link = flightledger::chain::append(kAlgorithm, std::nullopt, entry);

  EXPECT_EQ(link.index, 0u);
  EXPECT_EQ(link.prev_chain_hash, flightledger::chain::genesis_chain_hash());
  EXPECT_EQ(link.entry_hash,
            flightledger::chain::hash_entry(
                kAlgorithm, flightledger::chain::canonicalize(entry)));
  EXPECT_EQ(link.chain_hash,
            flightledger::chain::link_hash(kAlgorithm, link.entry_hash,
                                           link.prev_chain_hash, 0));
}

TEST(chain_builder, each_link_commits_to_its_predecessor) {
  auto log = flightledger::testing::make_log(4);
  auto builder = flightledger::testing::build_chain(log);
  const auto& links = builder.links();
  ASSERT_EQ(links.size(), 4u);
  for (std::size_t i = 1; i < links.size(); ++i) {
    EXPECT_EQ(links[i].prev_chain_hash, links[i - 1].chain_hash);
    EXPECT_EQ(links[i].index, i);
  }
}

TEST(chain_builder, rejects_out_of_order_append) {
  auto log = flightledger::testing::make_log(3);
  auto builder = flightledger::testing::build_chain(log);
  try {
    builder.append(flightledger::testing::make_entry(1));
    FAIL() << "expected sequence_error";
  } catch (const flightledger::common::sequence_error& ex) {
    EXPECT_EQ(ex.expected_index(), 3u);
    EXPECT_EQ(ex.actual_index(), 1u);
    EXPECT_EQ(ex.code(),
              flightledger::schema::ledger_error_code::sequence_violation);
  }
  EXPECT_EQ(builder.size(), 3u);
}

TEST(chain_builder, rejects_gap_in_indices) {
  auto builder = flightledger::chain::chain_builder{"mission-gap"};
  builder.append(flightledger::testing::make_entry(0));
  EXPECT_THROW(builder.append(flightledger::testing::make_entry(2)),
               flightledger::common::sequence_error);
  EXPECT_EQ(builder.size(), 1u);
}

TEST(chain_builder, first_entry_must_have_index_zero) {
  EXPECT_THROW(flightledger::chain::append(kAlgorithm, std::nullopt,
                                           flightledger::testing::make_entry(1)),
               flightledger::common::sequence_error);
}

TEST(chain_builder, malformed_entry_leaves_chain_untouched) {
  auto builder = flightledger::chain::chain_builder{"mission-bad"};
  builder.append(flightledger::testing::make_entry(0));
  auto bad = flightledger::testing::make_entry(1);
  bad.entry_type.clear();
  EXPECT_THROW(builder.append(bad), flightledger::common::malformed_input_error);
  EXPECT_EQ(builder.size(), 1u);
  EXPECT_NO_THROW(builder.append(flightledger::testing::make_entry(1)));
}

TEST(chain_builder, chain_hash_depends_on_history) {
  auto log = flightledger::testing::make_log(3);
  auto untouched = flightledger::testing::build_chain(log);

  auto edited_log = log;
  edited_log[0].fields["alt"] = static_cast<int64_t>(1);
  auto edited = flightledger::testing::build_chain(edited_log);

  // Entry 2 is identical, its chain hash is not.
  EXPECT_EQ(untouched.links()[2].entry_hash, edited.links()[2].entry_hash);
  EXPECT_NE(untouched.links()[2].chain_hash, edited.links()[2].chain_hash);
}

TEST(chain_builder, algorithms_produce_different_chains) {
  auto log = flightledger::testing::make_log(2);
  auto blake = flightledger::testing::build_chain(
      log, flightledger::schema::hash_algorithm::blake3_256);
  auto sha = flightledger::testing::build_chain(
      log, flightledger::schema::hash_algorithm::sha256);
  EXPECT_NE(blake.tip()->chain_hash, sha.tip()->chain_hash);
  EXPECT_EQ(sha.checkpoints().back().algorithm,
            flightledger::schema::hash_algorithm::sha256);
}

TEST(chain_builder, records_checkpoints_at_interval) {
  auto log = flightledger::testing::make_log(10);
  auto builder = flightledger::testing::build_chain(log, kAlgorithm, 4);
  const auto& checkpoints = builder.checkpoints();
  ASSERT_EQ(checkpoints.size(), 2u);
  EXPECT_EQ(checkpoints[0].index, 3u);
  EXPECT_EQ(checkpoints[0].chain_hash, builder.links()[3].chain_hash);
  EXPECT_EQ(checkpoints[0].timestamp, log[3].timestamp);
  EXPECT_EQ(checkpoints[1].index, 7u);
}

TEST(chain_builder, automatic_checkpoints_stay_below_info) {
  auto captured = std::ostringstream{};
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
  auto capture =
      std::make_shared<spdlog::logger>("chain_builder_capture", sink);
  capture->set_pattern("%l %v");
  capture->set_level(spdlog::level::info);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(capture);

  auto log = flightledger::testing::make_log(4);
  auto builder = flightledger::testing::build_chain(log);
  builder.finalize(1700000999000);
  capture->flush();
  spdlog::set_default_logger(previous);

  EXPECT_EQ(builder.checkpoints().size(), 4u);
  EXPECT_EQ(captured.str().find("checkpoint at index"), std::string::npos);
  EXPECT_NE(captured.str().find("digest over 4 entries"), std::string::npos);
}

TEST(chain_builder, zero_interval_disables_automatic_checkpoints) {
  auto log = flightledger::testing::make_log(5);
  auto builder = flightledger::testing::build_chain(log, kAlgorithm, 0);
  EXPECT_TRUE(builder.checkpoints().empty());

  auto explicit_checkpoint = builder.checkpoint();
  EXPECT_EQ(explicit_checkpoint.index, 4u);
  EXPECT_EQ(explicit_checkpoint.chain_hash, builder.tip()->chain_hash);
  EXPECT_EQ(explicit_checkpoint.timestamp, log[4].timestamp);
  EXPECT_EQ(explicit_checkpoint.algorithm, kAlgorithm);
}

TEST(chain_builder, checkpoint_requires_an_entry) {
  auto builder = flightledger::chain::chain_builder{"mission-empty"};
  EXPECT_TRUE(builder.empty());
  EXPECT_FALSE(builder.tip().has_value());
  try {
    builder.checkpoint();
    FAIL() << "expected sequence_error";
  } catch (const flightledger::common::sequence_error& ex) {
    EXPECT_FALSE(ex.expected_index().has_value());
    EXPECT_FALSE(ex.actual_index().has_value());
    EXPECT_EQ(std::string{ex.what()},
              "mission 'mission-empty' has no entries to checkpoint");
  }
}

TEST(chain_builder, free_and_stateful_append_agree) {
  auto log = flightledger::testing::make_log(3);
  auto builder = flightledger::testing::build_chain(log);

  auto prev = std::optional<flightledger::schema::chain_link_t>{};
  for (const auto& entry : log) {
    prev = flightledger::chain::append(kAlgorithm, prev, entry);
  }
  EXPECT_EQ(prev->chain_hash, builder.tip()->chain_hash);
}

TEST(chain_builder, plan_checkpoints_spreads_remainder_over_first_batches) {
  EXPECT_EQ(flightledger::chain::plan_checkpoints(100, 10),
            (std::vector<uint64_t>{9, 19, 29, 39, 49, 59, 69, 79, 89, 99}));
  EXPECT_EQ(flightledger::chain::plan_checkpoints(10, 3),
            (std::vector<uint64_t>{3, 6, 9}));
  EXPECT_EQ(flightledger::chain::plan_checkpoints(3, 0),
            (std::vector<uint64_t>{0, 1, 2}));
  EXPECT_EQ(flightledger::chain::plan_checkpoints(2, 5),
            (std::vector<uint64_t>{0, 1}));
  EXPECT_TRUE(flightledger::chain::plan_checkpoints(0, 4).empty());
}
