#include <bootforge/pack/pack.hpp>

#include <bootforge/crypto/sha256.hpp>
#include <bootforge/report/archive.hpp>
#include <bootforge/report/manager.hpp>
#include <bootforge/schema/encoding/document.hpp>
#include <bootforge/schema/schema_version.hpp>
#include <bootforge/workflow/loader.hpp>

#include <spdlog/spdlog.h>

#include <map>

namespace bootforge::pack {

namespace {

using bootforge::schema::error_code_t;

bool is_contained(const std::string& value) {
  auto path = std::filesystem::path{value};
  if (path.empty() || path.is_absolute() || path.has_root_name()) {
    return false;
  }
  for (const auto& part : path) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

std::vector<bootforge::report::archive_entry> pack_files(const loaded_pack& pack) {
  auto files = std::map<std::string, std::filesystem::path>{};
  files.emplace(pack.manifest_path.filename().generic_string(),
                pack.manifest_path);
  for (const auto& [relative, _] : pack.workflows) {
    auto name = std::filesystem::path{relative}.lexically_normal().generic_string();
    files.emplace(name, pack.base_directory / relative);
  }
  if (pack.manifest.assets) {
    auto assets = pack.base_directory / *pack.manifest.assets;
    for (auto& entry :
         bootforge::report::collect_tree(assets, pack.base_directory)) {
      files.emplace(entry.name, entry.source);
    }
  }
  auto entries = std::vector<bootforge::report::archive_entry>{};
  for (auto& [name, source] : files) {
    entries.push_back(bootforge::report::archive_entry{.name = name,
                                                       .source = source});
  }
  return entries;
}

}  // namespace

std::optional<loaded_pack> load_pack(
    const std::filesystem::path& manifest_path,
    const bootforge::workflow::action_registry& registry,
    bootforge::schema::error_t& error) {
  auto manifest = bootforge::schema::encoding::read_typed_document<
      bootforge::schema::pack_manifest_t>(manifest_path, error);
  if (!manifest) {
    error.message = manifest_path.string() + ": " + error.message;
    return std::nullopt;
  }
  if (!bootforge::schema::check_schema_version(
          "pack manifest", bootforge::schema::kPackSchemaVersion,
          manifest->schema_version, error)) {
    return std::nullopt;
  }
  if (manifest->name.empty() || manifest->version.empty()) {
    error = bootforge::schema::make_error(
        error_code_t::invalid_document, "pack needs a name and a version");
    return std::nullopt;
  }
  if (manifest->workflows.empty()) {
    error = bootforge::schema::make_error(
        error_code_t::invalid_document,
        "pack '" + manifest->name + "' lists no workflows");
    return std::nullopt;
  }

  auto pack = loaded_pack{};
  pack.manifest_path = manifest_path;
  pack.base_directory = manifest_path.parent_path();
  if (pack.base_directory.empty()) {
    pack.base_directory = ".";
  }

  for (const auto& relative : manifest->workflows) {
    if (!is_contained(relative)) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_document,
          "workflow path escapes the pack: " + relative);
      return std::nullopt;
    }
    auto workflow =
        bootforge::workflow::load_workflow(pack.base_directory / relative, error);
    if (!workflow) {
      return std::nullopt;
    }
    if (!bootforge::workflow::validate_workflow(*workflow, registry, error)) {
      error.message = relative + ": " + error.message;
      return std::nullopt;
    }
    pack.workflows.emplace_back(relative, std::move(*workflow));
  }

  if (manifest->assets) {
    auto ec = std::error_code{};
    if (!is_contained(*manifest->assets)) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_document,
          "assets path escapes the pack: " + *manifest->assets);
      return std::nullopt;
    }
    if (!std::filesystem::exists(pack.base_directory / *manifest->assets, ec)) {
      error = bootforge::schema::make_error(
          error_code_t::not_found, "pack assets missing: " + *manifest->assets);
      return std::nullopt;
    }
  }

  pack.manifest = std::move(*manifest);
  spdlog::info("pack '{}' {} loaded: {} workflows", pack.manifest.name,
               pack.manifest.version, pack.workflows.size());
  return pack;
}

pack_run_result run_pack(const loaded_pack& pack,
                         bootforge::workflow::workflow_engine& engine,
                         const bootforge::common::cancel_signal& cancel) {
  auto result = pack_run_result{};
  result.status = bootforge::schema::run_status_t::succeeded;
  for (const auto& [relative, workflow] : pack.workflows) {
    spdlog::info("pack '{}': running {}", pack.manifest.name, relative);
    auto run = engine.run(workflow, cancel);
    auto status = run.status;
    auto error = run.error;
    result.runs.push_back(std::move(run));
    if (status != bootforge::schema::run_status_t::succeeded) {
      result.status = status;
      result.error = error;
      result.error.message = relative + ": " + result.error.message;
      break;
    }
  }
  return result;
}

std::filesystem::path signature_path(
    const std::filesystem::path& manifest_path) {
  auto path = manifest_path;
  path.replace_extension(".sig");
  return path;
}

std::optional<std::string> content_listing(const loaded_pack& pack,
                                           bootforge::schema::error_t& error) {
  auto listing = std::string{};
  for (const auto& entry : pack_files(pack)) {
    auto digest = bootforge::crypto::sha256_file(entry.source, error);
    if (!digest) {
      return std::nullopt;
    }
    listing += entry.name;
    listing += "  ";
    listing += bootforge::schema::to_hex(*digest);
    listing += '\n';
  }
  return listing;
}

std::optional<std::filesystem::path> sign_pack(
    const loaded_pack& pack,
    const bootforge::schema::bytes_t& key,
    bootforge::schema::error_t& error) {
  auto listing = content_listing(pack, error);
  if (!listing) {
    return std::nullopt;
  }
  auto signature = bootforge::report::make_signature(
      key, bootforge::schema::make_bytes_view(*listing));
  auto path = signature_path(pack.manifest_path);
  if (!bootforge::schema::encoding::write_file(
          path, bootforge::schema::make_bytes_view(signature), error)) {
    return std::nullopt;
  }
  spdlog::info("pack '{}' signed: {}", pack.manifest.name, path.string());
  return path;
}

bool verify_pack(const loaded_pack& pack,
                 const bootforge::schema::bytes_t& key,
                 bootforge::schema::error_t& error) {
  auto path = signature_path(pack.manifest_path);
  auto stored = bootforge::schema::encoding::read_file(path, error);
  if (!stored) {
    error = bootforge::schema::make_error(error_code_t::integrity_violation,
                                          "pack signature not found: " +
                                              path.string());
    return false;
  }
  auto listing = content_listing(pack, error);
  if (!listing) {
    error.code = error_code_t::integrity_violation;
    return false;
  }
  if (!bootforge::report::signature_matches(
          bootforge::schema::make_string_view(*stored), key,
          bootforge::schema::make_bytes_view(*listing))) {
    error = bootforge::schema::make_error(
        error_code_t::integrity_violation,
        "pack '" + pack.manifest.name + "' does not match its signature");
    return false;
  }
  return true;
}

bool export_pack(const loaded_pack& pack,
                 const std::filesystem::path& output,
                 bootforge::schema::error_t& error) {
  auto entries = pack_files(pack);
  auto signature = signature_path(pack.manifest_path);
  auto ec = std::error_code{};
  if (std::filesystem::exists(signature, ec)) {
    entries.push_back(bootforge::report::archive_entry{
        .name = signature.filename().generic_string(), .source = signature});
  }
  if (!bootforge::report::write_tar_gz(output, entries, error)) {
    return false;
  }
  spdlog::info("pack '{}' exported to {} ({} files)", pack.manifest.name,
               output.string(), entries.size());
  return true;
}

}  // namespace bootforge::pack
