#include <flightledger/blake3/hash.hpp>
#include <flightledger/chain/entry_hasher.hpp>
#include <flightledger/common/critical.hpp>
#include <flightledger/crypto/sha256.hpp>
#include <flightledger/schema/encoding/scale/encoder.hpp>

#include <iterator>

using namespace flightledger::schema;

namespace flightledger::chain {

hash32_t hash_bytes(const hash_algorithm algorithm, const bytes_view_t& bytes) {
  switch (algorithm) {
    case hash_algorithm::blake3_256:
      return flightledger::blake3::hash(bytes);
    case hash_algorithm::sha256:
      return flightledger::crypto::sha256(bytes);
  }
  flightledger::common::critical("unsupported hash algorithm id {}",
                                 static_cast<uint16_t>(algorithm));
}

hash32_t hash_entry(const hash_algorithm algorithm,
                    const canonical_entry_t& canonical) {
  return hash_bytes(algorithm, make_bytes_view(canonical.bytes));
}

hash32_t genesis_chain_hash() {
  return make_zero_hash();
}

hash32_t link_hash(const hash_algorithm algorithm,
                   const hash32_t& entry_hash,
                   const hash32_t& prev_chain_hash,
                   const uint64_t index) {
  auto material = bytes_t{};
  material.reserve(entry_hash.size() + prev_chain_hash.size() + 8);
  material.insert(std::end(material), std::begin(entry_hash),
                  std::end(entry_hash));
  material.insert(std::end(material), std::begin(prev_chain_hash),
                  std::end(prev_chain_hash));

  auto encoder = flightledger::schema::encoding::scale_encoder_t{};
  encoder.encode(index, material);
  return hash_bytes(algorithm, make_bytes_view(material));
}

}  // namespace flightledger::chain
