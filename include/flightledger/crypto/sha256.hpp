#pragma once

#include <flightledger/schema/primitives.hpp>

namespace flightledger::crypto {

/// True when the linked OpenSSL provides SHA-256.
bool sha256_available();

flightledger::schema::hash32_t sha256(
    const flightledger::schema::bytes_view_t& bytes);

}  // namespace flightledger::crypto
