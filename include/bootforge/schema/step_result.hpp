#pragma once
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <bootforge/schema/step_status.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bootforge::schema {

template <uint16_t Version>
struct step_result;

template <>
struct step_result<1> final {
  std::string id;
  std::string action;
  step_status_t status{step_status_t::not_run};
  std::optional<timestamp_utc_t> started_at_utc;
  std::optional<timestamp_utc_t> finished_at_utc;
  duration_milliseconds_t duration_ms{};
  std::string message;
  std::optional<error_code_t> error;
  // Paths relative to the report bundle root.
  std::vector<std::string> artifacts;
};

using step_result_t = step_result<1>;

}  // namespace bootforge::schema
