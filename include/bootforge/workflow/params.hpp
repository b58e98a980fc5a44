#pragma once
#include <bootforge/schema/enum_string.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/workflow.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bootforge::workflow {

enum class param_type_t : uint8_t { string = 0, boolean = 1, positive_integer = 2 };

inline constexpr auto kParamTypeMappings = std::array{
    std::pair<std::string_view, param_type_t>{"string", param_type_t::string},
    std::pair<std::string_view, param_type_t>{"boolean", param_type_t::boolean},
    std::pair<std::string_view, param_type_t>{"positive integer",
                                              param_type_t::positive_integer}};

inline constexpr std::string_view to_string(const param_type_t value) {
  return bootforge::schema::to_string(value, kParamTypeMappings)
      .value_or("unknown");
}

struct param_spec final {
  std::string name;
  param_type_t type{param_type_t::string};
};

/// Check `params` against an action's declared parameters.
///
/// Fails with `invalid_step_params` for a missing required parameter, an
/// undeclared parameter, or a value of the wrong type. Strings must be
/// non-empty.
bool validate_params(std::string_view step_id,
                     const bootforge::schema::step_params_t& params,
                     const std::vector<param_spec>& required,
                     const std::vector<param_spec>& optional,
                     bootforge::schema::error_t& error);

// Accessors for validated parameters.
std::optional<std::string> string_param(
    const bootforge::schema::step_params_t& params,
    std::string_view name);
bool bool_param(const bootforge::schema::step_params_t& params,
                std::string_view name,
                bool fallback);
std::optional<uint64_t> uint_param(
    const bootforge::schema::step_params_t& params,
    std::string_view name);

}  // namespace bootforge::workflow
