#pragma once
#include <bootforge/schema/report_manifest.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const report_manifest<1>& o);
void from_json(const nlohmann::json& document, report_manifest<1>& o);

}  // namespace bootforge::schema
