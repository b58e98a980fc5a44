#pragma once
#include <bootforge/common/cancellation.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/workflow/action.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bootforge::workflow::actions {

// FAT32 cannot hold a file of 4 GiB or more.
inline constexpr auto kFatMaxFileBytes = (uint64_t{1} << 32) - 1;

struct staged_file final {
  std::string relative;
  uint64_t size_bytes{};
  bootforge::schema::hash32_t digest{};
};

/// Copy every regular file below `source` into `target`, keeping relative
/// paths, then re-read each copy and compare digests.
///
/// Files larger than `max_file_bytes` are refused before anything is
/// written. Symbolic links and special files in `source` are refused.
/// Fails with `integrity_violation` when a copy reads back differently.
std::optional<std::vector<staged_file>> stage_tree(
    const std::filesystem::path& source,
    const std::filesystem::path& target,
    const bootforge::common::cancel_signal& cancel,
    const std::optional<uint64_t>& max_file_bytes,
    bootforge::schema::error_t& error);

/// `sha256sum`-style listing: `<hex>  <relative path>` per line.
std::string digest_listing(const std::vector<staged_file>& files);

/// Filesystem of the partition mounted at `mount` on the authorized disk.
std::optional<std::string> mounted_filesystem(
    const step_context& context,
    const std::filesystem::path& mount);

/// Resolve `target_mount` to an existing directory for staging.
std::optional<std::filesystem::path> staging_root(
    const bootforge::schema::step_params_t& params,
    bootforge::schema::error_t& error);

/// Record the listing as `<step id>/<name>` and wrap the outcome.
step_outcome finish_staging(step_context& context,
                            const std::vector<staged_file>& files,
                            std::string_view artifact_name,
                            std::string message);

}  // namespace bootforge::workflow::actions
