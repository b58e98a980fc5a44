#pragma once
#include <bootforge/schema/pack_manifest.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const pack_manifest<1>& o);
void from_json(const nlohmann::json& document, pack_manifest<1>& o);

}  // namespace bootforge::schema
