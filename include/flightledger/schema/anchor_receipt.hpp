#pragma once

#include <flightledger/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: anchor receipt.
// Integrity workflow: acknowledgement returned by the external ledger after a
// mission digest was published. `ledger_reference` is opaque to the engine
// (transaction hash, block reference, ...).
namespace flightledger::schema {

template <uint16_t Version>
struct anchor_receipt;

template <>
struct anchor_receipt<1> final {
  uint16_t version{1};
  mission_id_t mission_id;
  hash32_t digest{};
  std::string ledger_reference;
  timestamp_milliseconds_t anchored_at{};
};

using anchor_receipt_t = anchor_receipt<1>;

}  // namespace flightledger::schema
