#pragma once

#include <flightledger/schema/canonical_entry.hpp>
#include <flightledger/schema/field_value.hpp>
#include <flightledger/schema/log_entry.hpp>
#include <cstddef>

namespace flightledger::chain {

/// Deepest list/structure nesting accepted inside a field value.
inline constexpr std::size_t kMaxFieldDepth = 64;

/// Serialize a log entry into its canonical byte form.
///
/// Pure function of the entry. Top-level fields and nested structure members
/// are emitted in byte-wise lexicographic name order, numbers at fixed width
/// (little-endian, IEEE-754 binary64 for doubles with -0.0 folded into +0.0),
/// strings as validated UTF-8 without any case or locale transformation.
///
/// Throws `common::malformed_input_error` when the entry cannot be represented
/// canonically: empty entry type or field name, invalid UTF-8, NaN, duplicate
/// structure member, oversized length, or nesting beyond `kMaxFieldDepth`.
flightledger::schema::canonical_entry_t canonicalize(
    const flightledger::schema::log_entry_t& entry);

/// Canonical bytes of a single value, as embedded in an entry.
flightledger::schema::bytes_t canonicalize_value(
    const flightledger::schema::field_value& value);

bool is_valid_utf8(std::string_view text);

}  // namespace flightledger::chain
