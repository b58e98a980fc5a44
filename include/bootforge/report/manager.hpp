#pragma once
#include <bootforge/schema/device_graph.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <bootforge/schema/report_manifest.hpp>
#include <bootforge/schema/run_metadata.hpp>
#include <bootforge/schema/step_result.hpp>
#include <bootforge/schema/step_status.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bootforge::report {

inline constexpr auto kDeviceGraphFile = std::string_view{"device_graph.json"};
inline constexpr auto kRunFile = std::string_view{"run.json"};
inline constexpr auto kLogFile = std::string_view{"logs.txt"};
inline constexpr auto kManifestFile = std::string_view{"manifest.json"};
inline constexpr auto kSignatureFile = std::string_view{"manifest.sig"};
inline constexpr auto kArtifactsDirectory = std::string_view{"artifacts"};

/// Evidence bundle for one workflow run, rooted at `<reports_dir>/<run_id>`.
///
/// The bundle is append-only while the run executes: artifacts are added,
/// step results appended (each append rewrites `run.json`). `finalize`
/// flushes the run log, hashes every file into `manifest.json` and, when a
/// key is given, writes `manifest.sig`. After that the bundle is immutable
/// and any further mutation is a programming error.
class report_bundle final {
 public:
  /// Create the bundle directory and write `device_graph.json`, the initial
  /// `run.json` and an empty `logs.txt`.
  static std::optional<report_bundle> create(
      const std::filesystem::path& reports_dir,
      const bootforge::schema::device_graph_t& graph,
      const std::string& workflow_name,
      bootforge::schema::error_t& error);

  report_bundle(const report_bundle&) = delete;
  report_bundle& operator=(const report_bundle&) = delete;
  report_bundle(report_bundle&&) = default;
  report_bundle& operator=(report_bundle&&) = default;
  ~report_bundle();

  const std::string& run_id() const;
  const std::filesystem::path& root() const;
  const bootforge::schema::run_metadata_t& metadata() const;
  bool finalized() const;

  /// Logger teeing into `logs.txt`. Falls back to the default logger once
  /// the bundle is finalized.
  std::shared_ptr<spdlog::logger> logger() const;

  /// Write `artifacts/<name>` and return its bundle-relative path.
  ///
  /// Names must be relative, without `..`, and not already present.
  std::optional<std::string> write_artifact(
      std::string_view name,
      const bootforge::schema::bytes_view_t& bytes,
      bootforge::schema::error_t& error);

  bool append_step(const bootforge::schema::step_result_t& step,
                   bootforge::schema::error_t& error);

  std::optional<bootforge::schema::report_manifest_t> finalize(
      bootforge::schema::run_status_t status,
      const std::optional<bootforge::schema::bytes_t>& signing_key,
      bootforge::schema::error_t& error);

 private:
  report_bundle(std::filesystem::path root,
                bootforge::schema::run_metadata_t metadata,
                std::shared_ptr<spdlog::logger> logger);

  bool write_run_metadata(bootforge::schema::error_t& error);
  void ensure_open() const;

  std::filesystem::path root_;
  bootforge::schema::run_metadata_t metadata_;
  std::shared_ptr<spdlog::logger> logger_;
  bool finalized_{false};
};

struct verify_result final {
  bool ok{false};
  bootforge::schema::error_t error;
  // Bundle-relative path of the first file that failed, if any.
  std::optional<std::string> offending_file;
  std::size_t files_checked{};
  bool signature_checked{false};
};

/// Recompute every digest in `manifest.json` and, with a key, the HMAC in
/// `manifest.sig`. Failures are `integrity_violation` naming the file.
verify_result verify_report(
    const std::filesystem::path& root,
    const std::optional<bootforge::schema::bytes_t>& signing_key);

struct tree_verify_result final {
  bool ok{false};
  std::vector<std::pair<std::filesystem::path, verify_result>> reports;
  bootforge::schema::error_t error;
};

/// Verify every bundle (directory holding `manifest.json`) below `root`.
/// Succeeds iff at least one bundle was found and all of them verify.
tree_verify_result verify_tree(
    const std::filesystem::path& root,
    const std::optional<bootforge::schema::bytes_t>& signing_key);

/// Package a bundle as `.tar.gz`, members named `<run_id>/<relpath>`.
bool export_report(const std::filesystem::path& root,
                   const std::filesystem::path& output,
                   bootforge::schema::error_t& error);

/// Hex HMAC-SHA256 text as stored in signature files.
std::string make_signature(const bootforge::schema::bytes_t& key,
                           const bootforge::schema::bytes_view_t& message);

/// Compare a stored signature text against the expected HMAC in constant
/// time. Surrounding whitespace and hex case are ignored.
bool signature_matches(const std::string_view& stored,
                       const bootforge::schema::bytes_t& key,
                       const bootforge::schema::bytes_view_t& message);

}  // namespace bootforge::report
