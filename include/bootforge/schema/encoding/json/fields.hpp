#pragma once
#include <bootforge/schema/enum_string.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

// Field helpers shared by the per-type JSON codecs. Decoding failures throw
// and are turned into `invalid_document` errors by the JSON encoder.
namespace bootforge::schema::encoding::json {

[[noreturn]] inline void throw_invalid_field(const std::string_view field,
                                             const std::string_view reason) {
  throw std::invalid_argument{"field '" + std::string{field} +
                              "': " + std::string{reason}};
}

template <typename Enum>
Enum enum_field(const nlohmann::json& document, const std::string_view field) {
  const auto& value = document.at(std::string{field});
  if (!value.is_string()) {
    throw_invalid_field(field, "expected a string");
  }
  auto parsed = try_from_string<Enum>(value.get_ref<const std::string&>());
  if (!parsed) {
    throw_invalid_field(field, "unknown value '" +
                                   value.get<std::string>() + "'");
  }
  return *parsed;
}

template <typename T>
std::optional<T> optional_field(const nlohmann::json& document,
                                const std::string_view field) {
  auto it = document.find(std::string{field});
  if (it == document.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

template <typename T>
void put_optional(nlohmann::json& document,
                  const std::string_view field,
                  const std::optional<T>& value) {
  if (value) {
    document[std::string{field}] = *value;
  } else {
    document[std::string{field}] = nullptr;
  }
}

}  // namespace bootforge::schema::encoding::json
