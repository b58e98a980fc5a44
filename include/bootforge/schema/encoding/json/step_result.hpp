#pragma once
#include <bootforge/schema/step_result.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const step_result<1>& o);
void from_json(const nlohmann::json& document, step_result<1>& o);

}  // namespace bootforge::schema
