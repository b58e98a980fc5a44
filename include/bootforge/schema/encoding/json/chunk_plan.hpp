#pragma once
#include <bootforge/schema/chunk_plan.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const chunk_plan<1>& o);
void from_json(const nlohmann::json& document, chunk_plan<1>& o);

}  // namespace bootforge::schema
