#include <blake3.h>
#include <flightledger/blake3/hash.hpp>

namespace flightledger::blake3 {

namespace {

flightledger::schema::hash32_t digest(const void* data, const size_t size) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<schema::hash32_t>);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = flightledger::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

flightledger::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

flightledger::schema::hash32_t hash(
    const flightledger::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace flightledger::blake3
