#pragma once
#include <bootforge/schema/host_info.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const host_info<1>& o);
void from_json(const nlohmann::json& document, host_info<1>& o);

}  // namespace bootforge::schema
