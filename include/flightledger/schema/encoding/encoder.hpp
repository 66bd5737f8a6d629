#pragma once
#include <flightledger/schema/primitives.hpp>
#include <optional>

namespace flightledger::schema::encoding {

// The wire library is a build time choice: callers name it through a tag
// type (e.g. `encoder<scale_encoder_tag>`) and never touch the library API
// directly. Hot swapping is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  flightledger::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, flightledger::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const flightledger::schema::bytes_view_t& bytes);
};

}  // namespace flightledger::schema::encoding
