#pragma once
#include <bootforge/schema/token_record.hpp>
#include <nlohmann/json.hpp>

namespace bootforge::schema {

void to_json(nlohmann::json& document, const token_record<1>& o);
void from_json(const nlohmann::json& document, token_record<1>& o);

}  // namespace bootforge::schema
