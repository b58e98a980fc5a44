#pragma once
#include <bootforge/common/cancellation.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/pack_manifest.hpp>
#include <bootforge/schema/primitives.hpp>
#include <bootforge/schema/step_status.hpp>
#include <bootforge/schema/workflow.hpp>
#include <bootforge/workflow/engine.hpp>
#include <bootforge/workflow/registry.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bootforge::pack {

/// A pack manifest with every workflow it names loaded and validated.
struct loaded_pack final {
  std::filesystem::path manifest_path;
  // Directory the manifest's relative paths resolve against.
  std::filesystem::path base_directory;
  bootforge::schema::pack_manifest_t manifest;
  // (path relative to base_directory, document) in manifest order.
  std::vector<std::pair<std::string, bootforge::schema::workflow_t>> workflows;
};

/// Load a pack manifest (JSON or YAML by extension) and validate it and each
/// of its workflows. Paths must stay inside the manifest's directory.
std::optional<loaded_pack> load_pack(
    const std::filesystem::path& manifest_path,
    const bootforge::workflow::action_registry& registry,
    bootforge::schema::error_t& error);

struct pack_run_result final {
  bootforge::schema::run_status_t status{
      bootforge::schema::run_status_t::failed};
  std::vector<bootforge::workflow::run_result> runs;
  bootforge::schema::error_t error;
};

/// Run the pack's workflows in manifest order, stopping after the first one
/// that does not succeed.
pack_run_result run_pack(const loaded_pack& pack,
                         bootforge::workflow::workflow_engine& engine,
                         const bootforge::common::cancel_signal& cancel);

/// `<manifest>` with its extension replaced by `.sig`.
std::filesystem::path signature_path(const std::filesystem::path& manifest_path);

/// Canonical `<relpath>  <sha256 hex>` lines, sorted by path, covering the
/// manifest, every workflow and every asset file. This is the signed text.
std::optional<std::string> content_listing(const loaded_pack& pack,
                                           bootforge::schema::error_t& error);

/// Write the hex HMAC-SHA256 of `content_listing` to `signature_path`.
std::optional<std::filesystem::path> sign_pack(
    const loaded_pack& pack,
    const bootforge::schema::bytes_t& key,
    bootforge::schema::error_t& error);

/// Recompute the signature and compare it in constant time. Any mismatch,
/// including a missing signature file, is an `integrity_violation`.
bool verify_pack(const loaded_pack& pack,
                 const bootforge::schema::bytes_t& key,
                 bootforge::schema::error_t& error);

/// Archive manifest, workflows, assets and signature (if present) as
/// `.tar.gz`, named relative to the manifest's directory.
bool export_pack(const loaded_pack& pack,
                 const std::filesystem::path& output,
                 bootforge::schema::error_t& error);

}  // namespace bootforge::pack
