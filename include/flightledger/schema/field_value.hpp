#pragma once

#include <flightledger/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// Schema type: field value.
// Integrity workflow: closed set of telemetry value shapes so canonical
// encoding is exhaustive. Nested structures are name/value members whose
// input order is irrelevant to the canonical form.
namespace flightledger::schema {

struct null_value_t final {
  bool operator==(const null_value_t&) const = default;
};

struct field_member;
struct field_value;

using field_list_t = std::vector<field_value>;
using field_structure_t = std::vector<field_member>;

struct field_value final {
  using storage_t = std::variant<null_value_t,
                                 bool,
                                 int64_t,
                                 uint64_t,
                                 double,
                                 std::string,
                                 bytes_t,
                                 field_list_t,
                                 field_structure_t>;

  storage_t value;

  field_value();
  field_value(null_value_t v);
  field_value(bool v);
  field_value(int v);
  field_value(int64_t v);
  field_value(uint64_t v);
  field_value(double v);
  field_value(std::string v);
  field_value(const char* v);
  field_value(bytes_t v);
  field_value(field_list_t v);
  field_value(field_structure_t v);
};

struct field_member final {
  std::string name;
  field_value value;
};

inline field_value::field_value() : value{null_value_t{}} {}
inline field_value::field_value(null_value_t v) : value{v} {}
inline field_value::field_value(bool v) : value{v} {}
inline field_value::field_value(int v) : value{static_cast<int64_t>(v)} {}
inline field_value::field_value(int64_t v) : value{v} {}
inline field_value::field_value(uint64_t v) : value{v} {}
inline field_value::field_value(double v) : value{v} {}
inline field_value::field_value(std::string v) : value{std::move(v)} {}
inline field_value::field_value(const char* v) : value{std::string{v}} {}
inline field_value::field_value(bytes_t v) : value{std::move(v)} {}
inline field_value::field_value(field_list_t v) : value{std::move(v)} {}
inline field_value::field_value(field_structure_t v) : value{std::move(v)} {}

}  // namespace flightledger::schema
