#pragma once

#include <flightledger/config/options.hpp>
#include <memory>
#include <spdlog/logger.h>

namespace flightledger::logging {

inline constexpr auto kLoggerName = "flightledger";
inline constexpr auto kLogPattern = "%H:%M:%S.%e [%^%l%$] [%n] %v";

/// Install the `flightledger` async logger as the spdlog default.
///
/// Colored stdout, plus a basic file sink when `options.log_file` is set.
/// Calling it again replaces the previous logger.
std::shared_ptr<spdlog::logger> configure(
    const flightledger::config::ledger_options& options);

}  // namespace flightledger::logging
