#pragma once
#include <flightledger/schema/primitives.hpp>
#include <string_view>

namespace flightledger::blake3 {

flightledger::schema::hash32_t hash(const std::string_view& str);
flightledger::schema::hash32_t hash(
    const flightledger::schema::bytes_view_t& bytes);

}  // namespace flightledger::blake3
