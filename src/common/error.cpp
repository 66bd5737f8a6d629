#include <flightledger/common/error.hpp>

#include <fmt/format.h>

using namespace flightledger::schema;

namespace flightledger::common {

ledger_error::ledger_error(ledger_error_code code, const std::string& message)
    : std::runtime_error{message}, code_{code} {}

malformed_input_error::malformed_input_error(const std::string& message,
                                             std::optional<uint64_t> index)
    : ledger_error{ledger_error_code::malformed_input,
                   index.has_value()
                       ? fmt::format("entry {}: {}", *index, message)
                       : message},
      index_{index} {}

sequence_error::sequence_error(const std::string& message)
    : ledger_error{ledger_error_code::sequence_violation, message} {}

sequence_error::sequence_error(const std::string& message,
                               uint64_t expected_index,
                               uint64_t actual_index)
    : ledger_error{ledger_error_code::sequence_violation,
                   fmt::format("{} (expected index {}, got {})", message,
                               expected_index, actual_index)},
      expected_index_{expected_index},
      actual_index_{actual_index} {}

algorithm_mismatch_error::algorithm_mismatch_error(hash_algorithm expected,
                                                   hash_algorithm actual)
    : ledger_error{ledger_error_code::algorithm_mismatch,
                   fmt::format("hash algorithm mismatch: verifier uses {}, "
                               "expected material uses {}",
                               to_string(expected), to_string(actual))},
      expected_{expected},
      actual_{actual} {}

configuration_error::configuration_error(const std::string& message)
    : ledger_error{ledger_error_code::invalid_configuration, message} {}

}  // namespace flightledger::common
