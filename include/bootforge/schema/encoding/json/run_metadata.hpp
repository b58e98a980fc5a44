#pragma once
#include <bootforge/schema/run_metadata.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const run_metadata<1>& o);
void from_json(const nlohmann::json& document, run_metadata<1>& o);

}  // namespace bootforge::schema
