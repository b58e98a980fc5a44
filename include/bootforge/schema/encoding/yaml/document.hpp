#pragma once
#include <bootforge/schema/error_code.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace bootforge::schema::encoding::yaml {

/// Parse YAML text into the JSON document model.
///
/// Plain scalars are typed the YAML 1.2 core-schema way (null, bool,
/// integer, float, otherwise string); quoted scalars always stay strings.
/// Aliases are expanded. Multi-document streams are rejected.
std::optional<nlohmann::json> try_parse(std::string_view text,
                                        bootforge::schema::error_t& error);

}  // namespace bootforge::schema::encoding::yaml
