#pragma once
#include <bootforge/schema/device_graph.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const device_graph<1>& o);
void from_json(const nlohmann::json& document, device_graph<1>& o);

}  // namespace bootforge::schema
