#pragma once
#include <bootforge/schema/disk.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const disk<1>& o);
void from_json(const nlohmann::json& document, disk<1>& o);

}  // namespace bootforge::schema
