#pragma once
#include <bootforge/schema/workflow.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const workflow_step<1>& o);
void from_json(const nlohmann::json& document, workflow_step<1>& o);

void to_json(nlohmann::json& document, const workflow<1>& o);
void from_json(const nlohmann::json& document, workflow<1>& o);

}  // namespace bootforge::schema
