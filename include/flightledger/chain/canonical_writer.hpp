#pragma once
#include <flightledger/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace flightledger::chain {

/// Append-only byte sink for the canonical entry layout.
///
/// Integers are written little-endian at their full width; strings and byte
/// runs carry a u32 length prefix. Callers validate lengths beforehand.
struct canonical_writer final {
  flightledger::schema::bytes_t data;

  canonical_writer& write_string(const std::string_view& str);
  canonical_writer& write_bytes(const flightledger::schema::bytes_view_t& bytes);
  canonical_writer& write_raw(const flightledger::schema::bytes_view_t& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  canonical_writer& write(T value) {
    using unsigned_t = std::make_unsigned_t<T>;
    auto bits = static_cast<unsigned_t>(value);
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((bits >> (i * 8)) & 0xFFu));
    }
    return *this;
  }
};

}  // namespace flightledger::chain
