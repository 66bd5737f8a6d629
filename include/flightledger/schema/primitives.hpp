#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flightledger::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;
using mission_id_t = std::string;

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const hash32_t& hash);
bytes_view_t make_bytes_view(const std::string_view& bytes);

/// std::nullopt unless `hex` decodes to exactly 32 bytes.
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Lowercase hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

/// Accepts an optional `0x`/`0X` prefix and either letter case.
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace flightledger::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
