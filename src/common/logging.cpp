#include <bootforge/common/logging.hpp>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <utility>
#include <vector>

namespace bootforge::common {

std::shared_ptr<spdlog::logger> make_file_tee_logger(
    const std::string& name,
    const std::filesystem::path& file,
    bootforge::schema::error_t& error) {
  auto sinks = std::vector<spdlog::sink_ptr>{};
  auto current = spdlog::default_logger();
  if (current) {
    sinks = current->sinks();
  }

  auto file_sink = std::shared_ptr<spdlog::sinks::basic_file_sink_mt>{};
  try {
    file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), true);
  } catch (const spdlog::spdlog_ex& e) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::io_error, e.what());
    return nullptr;
  }
  // UTC timestamps in the bundle log; console sinks keep their own format.
  file_sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(
      std::string{kLogFilePattern}, spdlog::pattern_time_type::utc));
  sinks.push_back(file_sink);

  auto logger =
      std::make_shared<spdlog::logger>(name, std::begin(sinks), std::end(sinks));
  logger->set_level(current ? current->level() : spdlog::level::info);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

scoped_default_logger::scoped_default_logger(
    std::shared_ptr<spdlog::logger> logger)
    : previous_{spdlog::default_logger()} {
  if (logger) {
    spdlog::set_default_logger(std::move(logger));
    swapped_ = true;
  }
}

scoped_default_logger::~scoped_default_logger() {
  if (!swapped_) {
    return;
  }
  spdlog::default_logger()->flush();
  spdlog::set_default_logger(previous_);
}

}  // namespace bootforge::common
