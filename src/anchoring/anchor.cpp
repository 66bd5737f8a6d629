#include <flightledger/anchoring/anchor.hpp>
#include <flightledger/common/error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace flightledger::schema;

namespace flightledger::anchoring {

anchor_receipt_t publish(const anchor_t& anchor,
                         const mission_digest_t& digest) {
  if (!anchor) {
    throw flightledger::common::ledger_error{
        ledger_error_code::anchor_rejected,
        fmt::format("no anchor configured for mission '{}'",
                    digest.mission_id)};
  }

  spdlog::debug("Anchoring mission '{}' digest {}", digest.mission_id,
                to_hex(digest.digest));
  auto receipt = anchor(digest);
  if (receipt.mission_id != digest.mission_id ||
      receipt.digest != digest.digest) {
    spdlog::warn("Anchor receipt for mission '{}' does not echo digest {}",
                 digest.mission_id, to_hex(digest.digest));
    throw flightledger::common::ledger_error{
        ledger_error_code::anchor_rejected,
        fmt::format("anchor receipt for mission '{}' does not match the "
                    "published digest",
                    digest.mission_id)};
  }

  spdlog::info("Anchored mission '{}' digest {} as '{}'", digest.mission_id,
               to_hex(digest.digest), receipt.ledger_reference);
  return receipt;
}

}  // namespace flightledger::anchoring
