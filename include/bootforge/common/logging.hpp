#pragma once
#include <bootforge/schema/error_code.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string>

namespace bootforge::common {

inline constexpr auto kLogFilePattern =
    std::string_view{"%Y-%m-%dT%H:%M:%S.%eZ [%l] [%n] %v"};

/// Logger sharing the current default logger's sinks plus a truncating file
/// sink at `file`. Returns nullptr (and fills `error`) when the file cannot
/// be opened.
std::shared_ptr<spdlog::logger> make_file_tee_logger(
    const std::string& name,
    const std::filesystem::path& file,
    bootforge::schema::error_t& error);

/// Makes `logger` the spdlog default for the lifetime of the scope.
class scoped_default_logger final {
 public:
  explicit scoped_default_logger(std::shared_ptr<spdlog::logger> logger);
  ~scoped_default_logger();

  scoped_default_logger(const scoped_default_logger&) = delete;
  scoped_default_logger& operator=(const scoped_default_logger&) = delete;

 private:
  std::shared_ptr<spdlog::logger> previous_;
  bool swapped_{false};
};

}  // namespace bootforge::common
