#include <bootforge/workflow/actions/actions.hpp>

#include <bootforge/workflow/actions/staging.hpp>

#include <array>
#include <string_view>

namespace bootforge::workflow::actions {

namespace {

using bootforge::schema::error_code_t;

constexpr auto kInstallerImages =
    std::array<std::string_view, 2>{"BaseSystem.dmg", "SharedSupport.dmg"};

bool has_installer_image(const std::filesystem::path& source) {
  auto ec = std::error_code{};
  auto it = std::filesystem::recursive_directory_iterator{source, ec};
  for (auto end = std::filesystem::recursive_directory_iterator{};
       !ec && it != end; it.increment(ec)) {
    auto name = it->path().filename().string();
    for (const auto& image : kInstallerImages) {
      if (name == image && it->is_regular_file(ec)) {
        return true;
      }
    }
  }
  return false;
}

step_outcome build(const bootforge::schema::step_params_t& params,
                   step_context& context) {
  auto error = bootforge::schema::error_t{};
  auto source = std::filesystem::path{*string_param(params, "source_path")};
  if (!has_installer_image(source)) {
    return make_failure(bootforge::schema::make_error(
        error_code_t::invalid_step_params,
        source.string() + " holds neither BaseSystem.dmg nor SharedSupport.dmg"));
  }
  auto root = staging_root(params, error);
  if (!root) {
    return make_failure(std::move(error));
  }
  context.bundle.logger()->info("staging macOS installer {} onto {}",
                                source.string(), root->string());
  auto staged =
      stage_tree(source, *root, context.cancel, std::nullopt, error);
  if (!staged) {
    return make_failure(std::move(error));
  }
  return finish_staging(context, *staged, "staged.sha256",
                        "staged " + std::to_string(staged->size()) +
                            " macOS installer files onto " + root->string());
}

}  // namespace

action_descriptor make_installer_usb_build_macos() {
  return action_descriptor{
      .kind = bootforge::schema::action_kind_t::installer_usb_build_macos,
      .destructive = true,
      .required = {{.name = "source_path", .type = param_type_t::string},
                   {.name = "target_mount", .type = param_type_t::string}},
      .optional = {{.name = "target_disk_id", .type = param_type_t::string}},
      .handler = build};
}

}  // namespace bootforge::workflow::actions
