#pragma once
#include <bootforge/schema/primitives.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace bootforge::schema {

inline constexpr auto kWorkflowSchemaVersion = std::string_view{"1.0.0"};

/// Step parameters keep the document's JSON values so each action can check
/// its own parameter types.
using step_params_t = nlohmann::json;

template <uint16_t Version>
struct workflow_step;

template <>
struct workflow_step<1> final {
  std::string id;
  // Kept as written so an unknown action survives parsing and is rejected
  // by the registry with a precise error.
  std::string action;
  step_params_t params = step_params_t::object();
};

using workflow_step_t = workflow_step<1>;

template <uint16_t Version>
struct workflow;

template <>
struct workflow<1> final {
  std::string schema_version{kWorkflowSchemaVersion};
  std::string name;
  std::vector<workflow_step_t> steps;
};

using workflow_t = workflow<1>;

}  // namespace bootforge::schema
