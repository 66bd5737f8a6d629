#include <algorithm>
#include <flightledger/chain/canonical_writer.hpp>
#include <iterator>

namespace flightledger::chain {

canonical_writer& canonical_writer::write_string(const std::string_view& str) {
  write(static_cast<uint32_t>(str.size()));
  std::ranges::copy(str, std::back_inserter(data));
  return *this;
}

canonical_writer& canonical_writer::write_bytes(
    const flightledger::schema::bytes_view_t& bytes) {
  write(static_cast<uint32_t>(bytes.size()));
  return write_raw(bytes);
}

canonical_writer& canonical_writer::write_raw(
    const flightledger::schema::bytes_view_t& bytes) {
  std::ranges::copy(bytes, std::back_inserter(data));
  return *this;
}

}  // namespace flightledger::chain
