#include <bootforge/workflow/actions/actions.hpp>

#include <bootforge/report/manager.hpp>

#include <nlohmann/json.hpp>

namespace bootforge::workflow::actions {

namespace {

using bootforge::schema::error_code_t;

nlohmann::json describe(const std::filesystem::path& path,
                        const bootforge::report::verify_result& result) {
  auto document = nlohmann::json::object();
  document["report_path"] = path.string();
  document["ok"] = result.ok;
  document["files_checked"] = result.files_checked;
  document["signature_checked"] = result.signature_checked;
  if (result.offending_file) {
    document["offending_file"] = *result.offending_file;
  }
  if (!result.ok) {
    document["error"] = bootforge::schema::to_string(result.error.code);
    document["message"] = result.error.message;
  }
  return document;
}

step_outcome verify(const bootforge::schema::step_params_t& params,
                    step_context& context) {
  auto path = std::filesystem::path{*string_param(params, "report_path")};
  const auto& key = context.options.signing_key;
  if (bool_param(params, "require_signature", false) && !key) {
    return make_failure(bootforge::schema::make_error(
        error_code_t::integrity_violation,
        "a signed bundle is required but no signing key was supplied"));
  }

  auto document = nlohmann::json::object();
  auto failure = std::optional<bootforge::schema::error_t>{};
  auto checked = std::size_t{0};
  if (bool_param(params, "tree", false)) {
    auto result = bootforge::report::verify_tree(path, key);
    auto reports = nlohmann::json::array();
    for (const auto& [bundle, verified] : result.reports) {
      reports.push_back(describe(bundle, verified));
    }
    document["reports"] = std::move(reports);
    document["ok"] = result.ok;
    checked = result.reports.size();
    if (!result.ok) {
      failure = result.error;
    }
  } else {
    auto result = bootforge::report::verify_report(path, key);
    document = describe(path, result);
    checked = 1;
    if (!result.ok) {
      failure = result.error;
      if (result.offending_file) {
        failure->message += " (" + *result.offending_file + ")";
      }
    }
  }

  auto text = document.dump(2);
  text.push_back('\n');
  auto error = bootforge::schema::error_t{};
  auto artifact = context.bundle.write_artifact(
      context.step.id + "/verification.json",
      bootforge::schema::make_bytes_view(text), error);
  if (!artifact) {
    return make_failure(std::move(error));
  }
  if (failure) {
    auto outcome = make_failure(std::move(*failure));
    outcome.artifacts.push_back(*artifact);
    return outcome;
  }
  return make_success(
      "verified " + std::to_string(checked) + " bundle(s) at " + path.string(),
      {*artifact});
}

}  // namespace

action_descriptor make_report_verify() {
  return action_descriptor{
      .kind = bootforge::schema::action_kind_t::report_verify,
      .destructive = false,
      .required = {{.name = "report_path", .type = param_type_t::string}},
      .optional = {{.name = "require_signature", .type = param_type_t::boolean},
                   {.name = "tree", .type = param_type_t::boolean}},
      .handler = verify};
}

}  // namespace bootforge::workflow::actions
