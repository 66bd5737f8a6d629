#pragma once
#include <flightledger/common/critical.hpp>
#include <flightledger/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace flightledger::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  flightledger::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, flightledger::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const flightledger::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
flightledger::schema::bytes_t encoder<scale_encoder_tag>::encode(
    const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    flightledger::common::critical("failed to encode SCALE object: {}",
                                   encoded.error().message());
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        flightledger::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const flightledger::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace flightledger::schema::encoding
