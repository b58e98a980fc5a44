#pragma once
#include <bootforge/schema/partition.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const partition<1>& o);
void from_json(const nlohmann::json& document, partition<1>& o);

}  // namespace bootforge::schema
