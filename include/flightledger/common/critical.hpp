#pragma once

#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace flightledger::common {

/// Log a broken internal invariant, flush every sink and terminate.
///
/// Reserved for states no caller input can produce; rejected input is always
/// reported through `ledger_error`.
template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::terminate();
}

}  // namespace flightledger::common
