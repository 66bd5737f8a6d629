#pragma once

#include <flightledger/schema/anchor_receipt.hpp>
#include <flightledger/schema/mission_digest.hpp>
#include <functional>

namespace flightledger::anchoring {

/// Capability that publishes a digest to an external immutable record.
using anchor_t = std::function<flightledger::schema::anchor_receipt_t(
    const flightledger::schema::mission_digest_t&)>;

/// Hand `digest` to `anchor` exactly once.
///
/// Throws `common::ledger_error` (`anchor_rejected`) when no anchor is
/// configured or the receipt does not echo the mission id and digest.
/// Exceptions raised by the anchor itself propagate unchanged.
flightledger::schema::anchor_receipt_t publish(
    const anchor_t& anchor,
    const flightledger::schema::mission_digest_t& digest);

}  // namespace flightledger::anchoring
