#include <flightledger/chain/digest.hpp>
#include <flightledger/chain/entry_hasher.hpp>
#include <flightledger/common/error.hpp>
#include <flightledger/schema/encoding/scale/encoder.hpp>

#include <string>
#include <tuple>
#include <utility>

using namespace flightledger::schema;

namespace flightledger::chain {

mission_digest_t finalize(const hash_algorithm algorithm,
                          mission_id_t mission_id,
                          const std::optional<chain_link_t>& final_link,
                          const uint64_t entry_count,
                          const timestamp_milliseconds_t created_at) {
  const auto expected_count = final_link.has_value() ? final_link->index + 1 : 0;
  if (entry_count != expected_count) {
    throw flightledger::common::sequence_error{
        "entry count does not match the final link", expected_count,
        entry_count};
  }

  auto digest = mission_digest_t{};
  digest.mission_id = std::move(mission_id);
  digest.algorithm = algorithm;
  digest.final_chain_hash =
      final_link.has_value() ? final_link->chain_hash : genesis_chain_hash();
  digest.entry_count = entry_count;
  digest.created_at = created_at;
  digest.digest = compute_commitment(digest);
  return digest;
}

hash32_t compute_commitment(const mission_digest_t& digest) {
  auto encoder = flightledger::schema::encoding::scale_encoder_t{};
  auto material = encoder.encode(std::tuple{
      digest.version, digest.mission_id,
      static_cast<uint16_t>(digest.algorithm), digest.final_chain_hash,
      digest.entry_count, digest.created_at});
  return hash_bytes(digest.algorithm, make_bytes_view(material));
}

}  // namespace flightledger::chain
