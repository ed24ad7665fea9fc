#include <ledger/common/logging.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace ledger::common {

bool configure_logging(const spdlog::level::level_enum level,
                       const std::optional<std::string>& log_file,
                       std::string& error) {
  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (log_file.has_value()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file.value(), false));
    } catch (const spdlog::spdlog_ex& ex) {
      error = ex.what();
      return false;
    }
  }

  spdlog::init_thread_pool(8192, 1);
  auto logger = std::make_shared<spdlog::async_logger>(
      "ledger", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  return true;
}

}  // namespace ledger::common
