#pragma once
#include <flightledger/schema/checkpoint.hpp>
#include <optional>
#include <vector>

namespace flightledger::schema::encoding::scale {

flightledger::schema::bytes_t encode(const checkpoint<1>& o);
flightledger::schema::bytes_t encode(const std::vector<checkpoint<1>>& o);

std::optional<checkpoint<1>> try_decode_checkpoint(
    const flightledger::schema::bytes_view_t& bytes);
std::optional<std::vector<checkpoint<1>>> try_decode_checkpoint_history(
    const flightledger::schema::bytes_view_t& bytes);

}  // namespace flightledger::schema::encoding::scale
