#pragma once
#include <bootforge/schema/error_code.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bootforge::schema {

struct semantic_version final {
  uint32_t major{};
  uint32_t minor{};
  uint32_t patch{};
};

std::optional<semantic_version> try_parse_version(std::string_view value);

/// Accept `actual` when it shares the major version of `supported`.
///
/// Minor and patch bumps only add fields, so any of them is readable.
bool check_schema_version(std::string_view document,
                          std::string_view supported,
                          std::string_view actual,
                          error_t& error);

}  // namespace bootforge::schema
