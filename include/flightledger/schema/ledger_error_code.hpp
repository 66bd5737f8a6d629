#pragma once

#include <cstdint>

namespace flightledger::schema {

enum class ledger_error_code : uint32_t {
  malformed_input = 1,
  sequence_violation = 2,
  algorithm_mismatch = 3,
  invalid_configuration = 4,
  anchor_rejected = 5,
};

}  // namespace flightledger::schema
