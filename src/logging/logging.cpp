#include <flightledger/common/error.hpp>
#include <flightledger/logging/logging.hpp>

#include <fmt/format.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace flightledger::logging {

std::shared_ptr<spdlog::logger> configure(
    const flightledger::config::ledger_options& options) {
  if (!spdlog::thread_pool()) {
    spdlog::init_thread_pool(8192, 1);
  }

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!options.log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          options.log_file, false));
    } catch (const spdlog::spdlog_ex& ex) {
      throw flightledger::common::configuration_error{fmt::format(
          "cannot open log file '{}': {}", options.log_file, ex.what())};
    }
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::async_logger>(
      kLoggerName, std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_pattern(kLogPattern);
  logger->set_level(spdlog::level::from_str(options.log_level));
  spdlog::set_default_logger(logger);
  return logger;
}

}  // namespace flightledger::logging
