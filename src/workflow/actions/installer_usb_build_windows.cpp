#include <bootforge/workflow/actions/actions.hpp>

#include <bootforge/workflow/actions/staging.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace bootforge::workflow::actions {

namespace {

using bootforge::schema::error_code_t;

constexpr auto kInstallImages =
    std::array<std::string_view, 2>{"sources/install.wim", "sources/install.esd"};
constexpr auto kFatNames =
    std::array<std::string_view, 4>{"vfat", "fat", "fat32", "msdos"};

bool is_fat(std::string fs) {
  std::transform(std::begin(fs), std::end(fs), std::begin(fs),
                 [](unsigned char c) { return std::tolower(c); });
  return std::find(std::begin(kFatNames), std::end(kFatNames), fs) !=
         std::end(kFatNames);
}

step_outcome build(const bootforge::schema::step_params_t& params,
                   step_context& context) {
  auto error = bootforge::schema::error_t{};
  auto source = std::filesystem::path{*string_param(params, "source_path")};
  auto ec = std::error_code{};
  auto has_image = std::any_of(
      std::begin(kInstallImages), std::end(kInstallImages),
      [&](const auto& image) {
        return std::filesystem::is_regular_file(source / image, ec);
      });
  if (!has_image) {
    return make_failure(bootforge::schema::make_error(
        error_code_t::invalid_step_params,
        source.string() +
            " has no sources/install.wim or sources/install.esd"));
  }

  auto root = staging_root(params, error);
  if (!root) {
    return make_failure(std::move(error));
  }
  auto fs = mounted_filesystem(context, *root);
  auto limit = std::optional<uint64_t>{};
  if (fs && is_fat(*fs)) {
    limit = kFatMaxFileBytes;
  }
  context.bundle.logger()->info("staging Windows installer {} onto {} ({})",
                                source.string(), root->string(),
                                fs.value_or("unknown filesystem"));
  auto staged = stage_tree(source, *root, context.cancel, limit, error);
  if (!staged) {
    return make_failure(std::move(error));
  }
  return finish_staging(context, *staged, "staged.sha256",
                        "staged " + std::to_string(staged->size()) +
                            " Windows installer files onto " + root->string());
}

}  // namespace

action_descriptor make_installer_usb_build_windows() {
  return action_descriptor{
      .kind = bootforge::schema::action_kind_t::installer_usb_build_windows,
      .destructive = true,
      .required = {{.name = "source_path", .type = param_type_t::string},
                   {.name = "target_mount", .type = param_type_t::string}},
      .optional = {{.name = "target_disk_id", .type = param_type_t::string}},
      .handler = build};
}

}  // namespace bootforge::workflow::actions
