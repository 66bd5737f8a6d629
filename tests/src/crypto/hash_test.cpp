#include <flightledger/blake3/hash.hpp>
#include <flightledger/chain/entry_hasher.hpp>
#include <flightledger/crypto/sha256.hpp>
#include <gtest/gtest.h>

#include <string_view>

TEST(hash, blake3_of_empty_input_matches_reference) {
  auto hash = flightledger::blake3::hash(std::string_view{});
  EXPECT_EQ(flightledger::schema::to_hex(hash),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(hash, sha256_of_abc_matches_reference) {
  ASSERT_TRUE(flightledger::crypto::sha256_available());
  auto hash = flightledger::crypto::sha256(
      flightledger::schema::make_bytes_view(std::string_view{"abc"}));
  EXPECT_EQ(flightledger::schema::to_hex(hash),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(hash, hash_bytes_dispatches_on_algorithm) {
  auto input = flightledger::schema::make_bytes_view(std::string_view{"abc"});
  EXPECT_EQ(flightledger::chain::hash_bytes(
                flightledger::schema::hash_algorithm::sha256, input),
            flightledger::crypto::sha256(input));
  EXPECT_EQ(flightledger::chain::hash_bytes(
                flightledger::schema::hash_algorithm::blake3_256, input),
            flightledger::blake3::hash(input));
}

TEST(hash, genesis_chain_hash_is_all_zero) {
  EXPECT_EQ(flightledger::chain::genesis_chain_hash(),
            flightledger::schema::make_zero_hash());
}

TEST(hash, link_hash_binds_every_input) {
  const auto alg = flightledger::schema::hash_algorithm::blake3_256;
  auto entry = flightledger::blake3::hash(std::string_view{"entry"});
  auto prev = flightledger::blake3::hash(std::string_view{"prev"});
  auto base = flightledger::chain::link_hash(alg, entry, prev, 7);

  EXPECT_EQ(base, flightledger::chain::link_hash(alg, entry, prev, 7));
  EXPECT_NE(base, flightledger::chain::link_hash(alg, entry, prev, 8));
  EXPECT_NE(base, flightledger::chain::link_hash(alg, prev, entry, 7));
  EXPECT_NE(base, flightledger::chain::link_hash(
                      flightledger::schema::hash_algorithm::sha256, entry,
                      prev, 7));
}
