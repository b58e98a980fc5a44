#include <bootforge/workflow/params.hpp>

#include <algorithm>

namespace bootforge::workflow {

namespace {

bool matches(const nlohmann::json& value, const param_type_t type) {
  switch (type) {
    case param_type_t::string:
      return value.is_string() && !value.get_ref<const std::string&>().empty();
    case param_type_t::boolean:
      return value.is_boolean();
    case param_type_t::positive_integer:
      if (value.is_number_unsigned()) {
        return value.get<uint64_t>() > 0;
      }
      return value.is_number_integer() && value.get<int64_t>() > 0;
  }
  return false;
}

const param_spec* find_spec(const std::vector<param_spec>& specs,
                            const std::string_view name) {
  auto it = std::find_if(std::begin(specs), std::end(specs),
                         [&](const auto& spec) { return spec.name == name; });
  return it == std::end(specs) ? nullptr : &*it;
}

}  // namespace

bool validate_params(const std::string_view step_id,
                     const bootforge::schema::step_params_t& params,
                     const std::vector<param_spec>& required,
                     const std::vector<param_spec>& optional,
                     bootforge::schema::error_t& error) {
  auto fail = [&](std::string message) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::invalid_step_params,
        "step '" + std::string{step_id} + "': " + std::move(message));
    return false;
  };

  if (!params.is_object()) {
    return fail("params must be a mapping");
  }
  for (const auto& spec : required) {
    if (!params.contains(spec.name)) {
      return fail("missing required parameter '" + spec.name + "'");
    }
  }
  for (const auto& [name, value] : params.items()) {
    const auto* spec = find_spec(required, name);
    if (!spec) {
      spec = find_spec(optional, name);
    }
    if (!spec) {
      return fail("unknown parameter '" + name + "'");
    }
    if (!matches(value, spec->type)) {
      return fail("parameter '" + name + "' must be a " +
                  std::string{to_string(spec->type)});
    }
  }
  return true;
}

std::optional<std::string> string_param(
    const bootforge::schema::step_params_t& params,
    const std::string_view name) {
  auto it = params.find(std::string{name});
  if (it == params.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

bool bool_param(const bootforge::schema::step_params_t& params,
                const std::string_view name,
                const bool fallback) {
  auto it = params.find(std::string{name});
  if (it == params.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

std::optional<uint64_t> uint_param(
    const bootforge::schema::step_params_t& params,
    const std::string_view name) {
  auto it = params.find(std::string{name});
  if (it == params.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  if (!it->is_number_unsigned() && it->get<int64_t>() < 0) {
    return std::nullopt;
  }
  return it->get<uint64_t>();
}

}  // namespace bootforge::workflow
