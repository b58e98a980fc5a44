#include <bootforge/schema/schema_version.hpp>

#include <charconv>
#include <string>

namespace bootforge::schema {

namespace {

std::optional<uint32_t> parse_component(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto value = uint32_t{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<semantic_version> try_parse_version(std::string_view value) {
  // Pre-release and build suffixes do not take part in compatibility.
  if (auto suffix = value.find_first_of("-+"); suffix != std::string_view::npos) {
    value = value.substr(0, suffix);
  }
  const auto first_dot = value.find('.');
  if (first_dot == std::string_view::npos) {
    return std::nullopt;
  }
  const auto second_dot = value.find('.', first_dot + 1);
  if (second_dot == std::string_view::npos) {
    return std::nullopt;
  }
  auto major = parse_component(value.substr(0, first_dot));
  auto minor =
      parse_component(value.substr(first_dot + 1, second_dot - first_dot - 1));
  auto patch = parse_component(value.substr(second_dot + 1));
  if (!major || !minor || !patch) {
    return std::nullopt;
  }
  return semantic_version{.major = *major, .minor = *minor, .patch = *patch};
}

bool check_schema_version(const std::string_view document,
                          const std::string_view supported,
                          const std::string_view actual,
                          error_t& error) {
  auto expected = try_parse_version(supported);
  auto parsed = try_parse_version(actual);
  if (!parsed) {
    error = make_error(error_code_t::schema_version_mismatch,
                       std::string{document} + " schema_version '" +
                           std::string{actual} + "' is not semver");
    return false;
  }
  if (!expected || expected->major != parsed->major) {
    error = make_error(error_code_t::schema_version_mismatch,
                       std::string{document} + " schema_version " +
                           std::string{actual} + " is incompatible with " +
                           std::string{supported});
    return false;
  }
  return true;
}

}  // namespace bootforge::schema
