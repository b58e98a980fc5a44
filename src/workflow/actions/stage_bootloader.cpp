#include <bootforge/workflow/actions/actions.hpp>

#include <bootforge/workflow/actions/staging.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace bootforge::workflow::actions {

namespace {

using bootforge::schema::error_code_t;

// Removable-media default boot paths per UEFI architecture.
constexpr auto kDefaultLoaders = std::array<std::string_view, 3>{
    "BOOTX64.EFI", "BOOTAA64.EFI", "BOOTIA32.EFI"};

std::string upper(std::string value) {
  std::transform(std::begin(value), std::end(value), std::begin(value),
                 [](unsigned char c) { return std::toupper(c); });
  return value;
}

// FAT is case-insensitive, so packages may spell the path in any case.
std::vector<std::string> find_loaders(const std::filesystem::path& source) {
  auto loaders = std::vector<std::string>{};
  auto ec = std::error_code{};
  auto it = std::filesystem::recursive_directory_iterator{source, ec};
  for (auto end = std::filesystem::recursive_directory_iterator{};
       !ec && it != end; it.increment(ec)) {
    auto file_ec = std::error_code{};
    if (!it->is_regular_file(file_ec)) {
      continue;
    }
    auto relative = upper(
        std::filesystem::relative(it->path(), source, file_ec).generic_string());
    for (const auto& loader : kDefaultLoaders) {
      if (relative == "EFI/BOOT/" + std::string{loader}) {
        loaders.emplace_back(loader);
      }
    }
  }
  std::sort(std::begin(loaders), std::end(loaders));
  return loaders;
}

step_outcome stage(const bootforge::schema::step_params_t& params,
                   step_context& context) {
  auto error = bootforge::schema::error_t{};
  auto source = std::filesystem::path{*string_param(params, "source_path")};
  auto loaders = find_loaders(source);
  if (loaders.empty()) {
    return make_failure(bootforge::schema::make_error(
        error_code_t::invalid_step_params,
        source.string() + " has no EFI/BOOT/BOOTX64.EFI, BOOTAA64.EFI or "
                          "BOOTIA32.EFI"));
  }
  auto root = staging_root(params, error);
  if (!root) {
    return make_failure(std::move(error));
  }
  auto fs = mounted_filesystem(context, *root);
  auto limit = std::optional<uint64_t>{};
  if (fs && (upper(*fs) == "VFAT" || upper(*fs).starts_with("FAT"))) {
    limit = kFatMaxFileBytes;
  }
  auto names = std::string{};
  for (const auto& loader : loaders) {
    names += names.empty() ? loader : ", " + loader;
  }
  context.bundle.logger()->info("staging EFI loaders {} onto {}", names,
                                root->string());
  auto staged = stage_tree(source, *root, context.cancel, limit, error);
  if (!staged) {
    return make_failure(std::move(error));
  }
  return finish_staging(context, *staged, "bootloader.sha256",
                        "staged bootloader (" + std::to_string(loaders.size()) +
                            " architectures) onto " + root->string());
}

}  // namespace

action_descriptor make_stage_bootloader() {
  return action_descriptor{
      .kind = bootforge::schema::action_kind_t::stage_bootloader,
      .destructive = true,
      .required = {{.name = "source_path", .type = param_type_t::string},
                   {.name = "target_mount", .type = param_type_t::string}},
      .optional = {{.name = "target_disk_id", .type = param_type_t::string}},
      .handler = stage};
}

}  // namespace bootforge::workflow::actions
