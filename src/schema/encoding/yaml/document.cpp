#include <bootforge/schema/encoding/yaml/document.hpp>

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdint>
#include <string>

namespace bootforge::schema::encoding::yaml {

namespace {

bool is_null_scalar(const std::string& value) {
  return value.empty() || value == "~" || value == "null" || value == "Null" ||
         value == "NULL";
}

std::optional<bool> try_bool_scalar(const std::string& value) {
  if (value == "true" || value == "True" || value == "TRUE") {
    return true;
  }
  if (value == "false" || value == "False" || value == "FALSE") {
    return false;
  }
  return std::nullopt;
}

template <typename T>
std::optional<T> try_number_scalar(const std::string& value) {
  auto number = T{};
  const auto* first = value.data();
  const auto* last = value.data() + value.size();
  if (first != last && *first == '+') {
    ++first;
  }
  auto [ptr, ec] = std::from_chars(first, last, number);
  if (ec != std::errc{} || ptr != last || first == last) {
    return std::nullopt;
  }
  return number;
}

nlohmann::json convert_scalar(const YAML::Node& node) {
  const auto& value = node.Scalar();
  // "!" marks a quoted scalar; only plain scalars are resolved.
  if (node.Tag() == "!") {
    return value;
  }
  if (is_null_scalar(value)) {
    return nullptr;
  }
  if (auto flag = try_bool_scalar(value)) {
    return *flag;
  }
  if (auto unsigned_value = try_number_scalar<uint64_t>(value)) {
    return *unsigned_value;
  }
  if (auto signed_value = try_number_scalar<int64_t>(value)) {
    return *signed_value;
  }
  if (value.find_first_of(".eE") != std::string::npos) {
    if (auto real = try_number_scalar<double>(value)) {
      return *real;
    }
  }
  return value;
}

nlohmann::json convert(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return nullptr;
    case YAML::NodeType::Scalar:
      return convert_scalar(node);
    case YAML::NodeType::Sequence: {
      auto array = nlohmann::json::array();
      for (const auto& element : node) {
        array.push_back(convert(element));
      }
      return array;
    }
    case YAML::NodeType::Map: {
      auto object = nlohmann::json::object();
      for (const auto& entry : node) {
        object[entry.first.as<std::string>()] = convert(entry.second);
      }
      return object;
    }
  }
  return nullptr;
}

}  // namespace

std::optional<nlohmann::json> try_parse(const std::string_view text,
                                        bootforge::schema::error_t& error) {
  try {
    auto documents = YAML::LoadAll(std::string{text});
    if (documents.size() != 1) {
      error = bootforge::schema::make_error(
          bootforge::schema::error_code_t::invalid_document,
          "expected exactly one YAML document, found " +
              std::to_string(documents.size()));
      return std::nullopt;
    }
    return convert(documents.front());
  } catch (const YAML::Exception& e) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::invalid_document,
        std::string{"malformed YAML document: "} + e.what());
    return std::nullopt;
  }
}

}  // namespace bootforge::schema::encoding::yaml
