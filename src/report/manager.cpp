#include <bootforge/report/manager.hpp>

#include <bootforge/common/critical.hpp>
#include <bootforge/common/logging.hpp>
#include <bootforge/crypto/hmac.hpp>
#include <bootforge/crypto/sha256.hpp>
#include <bootforge/report/archive.hpp>
#include <bootforge/schema/encoding/document.hpp>
#include <bootforge/schema/encoding/json/encoder.hpp>
#include <bootforge/schema/schema_version.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

namespace bootforge::report {

namespace {

using bootforge::schema::error_code_t;

bool is_reserved(const std::string& relative) {
  return relative == kManifestFile || relative == kSignatureFile;
}

// Bundle-relative paths must stay inside the bundle.
bool is_contained(const std::filesystem::path& relative) {
  if (relative.empty() || relative.is_absolute() || relative.has_root_name()) {
    return false;
  }
  for (const auto& part : relative) {
    if (part == ".." || part == "." || part.empty()) {
      return false;
    }
  }
  return true;
}

// Every non-directory entry below `root` except the manifest pair.
std::optional<std::vector<std::string>> list_bundle_files(
    const std::filesystem::path& root,
    bootforge::schema::error_t& error) {
  auto ec = std::error_code{};
  auto it = std::filesystem::recursive_directory_iterator{root, ec};
  if (ec) {
    error = bootforge::schema::make_error(
        error_code_t::not_found, "cannot read bundle " + root.string());
    return std::nullopt;
  }
  auto files = std::vector<std::string>{};
  for (auto end = std::filesystem::recursive_directory_iterator{}; it != end;
       it.increment(ec)) {
    if (ec) {
      error = bootforge::schema::make_error(
          error_code_t::io_error, "failed walking " + root.string() + ": " +
                                      ec.message());
      return std::nullopt;
    }
    auto status = it->symlink_status(ec);
    if (std::filesystem::is_directory(status)) {
      continue;
    }
    auto relative =
        std::filesystem::relative(it->path(), root, ec).generic_string();
    if (!is_reserved(relative)) {
      files.push_back(std::move(relative));
    }
  }
  std::sort(std::begin(files), std::end(files));
  return files;
}

verify_result violation(std::string file, std::string message) {
  auto result = verify_result{};
  result.error = bootforge::schema::make_error(error_code_t::integrity_violation,
                                               std::move(message));
  result.offending_file = std::move(file);
  return result;
}

}  // namespace

std::string make_signature(const bootforge::schema::bytes_t& key,
                           const bootforge::schema::bytes_view_t& message) {
  return bootforge::schema::to_hex(bootforge::crypto::hmac_sha256(
      bootforge::schema::make_bytes_view(key), message));
}

bool signature_matches(const std::string_view& stored,
                       const bootforge::schema::bytes_t& key,
                       const bootforge::schema::bytes_view_t& message) {
  auto text = stored;
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  auto decoded = bootforge::schema::try_from_hex(text);
  if (!decoded) {
    return false;
  }
  auto expected = bootforge::crypto::hmac_sha256(
      bootforge::schema::make_bytes_view(key), message);
  return bootforge::crypto::constant_time_equal(
      bootforge::schema::make_bytes_view(*decoded),
      bootforge::schema::bytes_view_t{expected});
}

report_bundle::report_bundle(std::filesystem::path root,
                             bootforge::schema::run_metadata_t metadata,
                             std::shared_ptr<spdlog::logger> logger)
    : root_{std::move(root)},
      metadata_{std::move(metadata)},
      logger_{std::move(logger)} {}

report_bundle::~report_bundle() {
  if (logger_) {
    logger_->flush();
  }
}

std::optional<report_bundle> report_bundle::create(
    const std::filesystem::path& reports_dir,
    const bootforge::schema::device_graph_t& graph,
    const std::string& workflow_name,
    bootforge::schema::error_t& error) {
  auto ec = std::error_code{};
  std::filesystem::create_directories(reports_dir, ec);
  if (ec) {
    error = bootforge::schema::make_error(
        error_code_t::io_error,
        "cannot create reports directory " + reports_dir.string() + ": " +
            ec.message());
    return std::nullopt;
  }

  auto metadata = bootforge::schema::run_metadata_t{};
  metadata.run_id = bootforge::schema::make_uuid();
  metadata.workflow_name = workflow_name;
  metadata.device_graph_schema_version = graph.schema_version;
  metadata.created_at_utc = bootforge::schema::now_utc_rfc3339();

  auto root = reports_dir / metadata.run_id;
  if (!std::filesystem::create_directory(root, ec) || ec) {
    error = bootforge::schema::make_error(
        error_code_t::io_error, "cannot create bundle " + root.string());
    return std::nullopt;
  }

  auto codec = bootforge::schema::encoding::encoder<
      bootforge::schema::encoding::json_encoder_tag>{};
  auto graph_bytes = codec.encode(graph);
  if (!bootforge::schema::encoding::write_file(
          root / kDeviceGraphFile,
          bootforge::schema::make_bytes_view(graph_bytes), error)) {
    return std::nullopt;
  }

  auto logger = bootforge::common::make_file_tee_logger(
      "run-" + metadata.run_id.substr(0, 8), root / kLogFile, error);
  if (!logger) {
    return std::nullopt;
  }

  auto bundle = report_bundle{std::move(root), std::move(metadata),
                              std::move(logger)};
  if (!bundle.write_run_metadata(error)) {
    return std::nullopt;
  }
  bundle.logger_->info("evidence bundle {} opened for workflow '{}'",
                       bundle.run_id(), workflow_name);
  return bundle;
}

const std::string& report_bundle::run_id() const {
  return metadata_.run_id;
}

const std::filesystem::path& report_bundle::root() const {
  return root_;
}

const bootforge::schema::run_metadata_t& report_bundle::metadata() const {
  return metadata_;
}

bool report_bundle::finalized() const {
  return finalized_;
}

std::shared_ptr<spdlog::logger> report_bundle::logger() const {
  if (!logger_) {
    return spdlog::default_logger();
  }
  return logger_;
}

void report_bundle::ensure_open() const {
  if (finalized_) {
    bootforge::common::critical("evidence bundle {} is finalized",
                                metadata_.run_id);
  }
}

bool report_bundle::write_run_metadata(bootforge::schema::error_t& error) {
  auto codec = bootforge::schema::encoding::encoder<
      bootforge::schema::encoding::json_encoder_tag>{};
  auto bytes = codec.encode(metadata_);
  return bootforge::schema::encoding::write_file(
      root_ / kRunFile, bootforge::schema::make_bytes_view(bytes), error);
}

std::optional<std::string> report_bundle::write_artifact(
    std::string_view name,
    const bootforge::schema::bytes_view_t& bytes,
    bootforge::schema::error_t& error) {
  ensure_open();
  auto relative = std::filesystem::path{name};
  if (!is_contained(relative)) {
    error = bootforge::schema::make_error(
        error_code_t::invalid_argument,
        "artifact name must be a plain relative path: " + std::string{name});
    return std::nullopt;
  }
  auto target = root_ / kArtifactsDirectory / relative;
  auto ec = std::error_code{};
  if (std::filesystem::exists(target, ec)) {
    error = bootforge::schema::make_error(
        error_code_t::invalid_argument,
        "artifact already recorded: " + std::string{name});
    return std::nullopt;
  }
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    error = bootforge::schema::make_error(
        error_code_t::io_error, "cannot create " +
                                    target.parent_path().string() + ": " +
                                    ec.message());
    return std::nullopt;
  }
  if (!bootforge::schema::encoding::write_file(target, bytes, error)) {
    return std::nullopt;
  }
  return (std::filesystem::path{kArtifactsDirectory} / relative)
      .generic_string();
}

bool report_bundle::append_step(const bootforge::schema::step_result_t& step,
                                bootforge::schema::error_t& error) {
  ensure_open();
  metadata_.steps.push_back(step);
  return write_run_metadata(error);
}

std::optional<bootforge::schema::report_manifest_t> report_bundle::finalize(
    const bootforge::schema::run_status_t status,
    const std::optional<bootforge::schema::bytes_t>& signing_key,
    bootforge::schema::error_t& error) {
  ensure_open();
  metadata_.status = status;
  metadata_.finished_at_utc = bootforge::schema::now_utc_rfc3339();
  if (!write_run_metadata(error)) {
    return std::nullopt;
  }

  logger_->info("run {} finished with status {}", metadata_.run_id,
                bootforge::schema::to_string(status));
  logger_->flush();
  logger_.reset();
  finalized_ = true;

  auto files = list_bundle_files(root_, error);
  if (!files) {
    return std::nullopt;
  }
  auto manifest = bootforge::schema::report_manifest_t{};
  manifest.run_id = metadata_.run_id;
  for (const auto& file : *files) {
    auto digest = bootforge::crypto::sha256_file(root_ / file, error);
    if (!digest) {
      return std::nullopt;
    }
    manifest.files.emplace(file, bootforge::schema::to_hex(*digest));
  }

  auto codec = bootforge::schema::encoding::encoder<
      bootforge::schema::encoding::json_encoder_tag>{};
  auto manifest_bytes = codec.encode(manifest);
  if (!bootforge::schema::encoding::write_file(
          root_ / kManifestFile,
          bootforge::schema::make_bytes_view(manifest_bytes), error)) {
    return std::nullopt;
  }
  if (signing_key) {
    auto signature = make_signature(
        *signing_key, bootforge::schema::make_bytes_view(manifest_bytes));
    if (!bootforge::schema::encoding::write_file(
            root_ / kSignatureFile,
            bootforge::schema::make_bytes_view(signature), error)) {
      return std::nullopt;
    }
  }
  spdlog::info("evidence bundle {} sealed ({} files{})", metadata_.run_id,
               manifest.files.size(), signing_key ? ", signed" : "");
  return manifest;
}

verify_result verify_report(
    const std::filesystem::path& root,
    const std::optional<bootforge::schema::bytes_t>& signing_key) {
  auto error = bootforge::schema::error_t{};
  auto manifest_bytes =
      bootforge::schema::encoding::read_file(root / kManifestFile, error);
  if (!manifest_bytes) {
    return violation(std::string{kManifestFile},
                     "manifest unreadable: " + error.message);
  }
  auto codec = bootforge::schema::encoding::encoder<
      bootforge::schema::encoding::json_encoder_tag>{};
  auto manifest = codec.try_decode<bootforge::schema::report_manifest_t>(
      bootforge::schema::make_bytes_view(*manifest_bytes), error);
  if (!manifest) {
    return violation(std::string{kManifestFile},
                     "manifest malformed: " + error.message);
  }
  if (!bootforge::schema::check_schema_version(
          "report manifest", bootforge::schema::kReportSchemaVersion,
          manifest->schema_version, error)) {
    auto result = verify_result{};
    result.error = error;
    result.offending_file = std::string{kManifestFile};
    return result;
  }

  auto result = verify_result{};
  for (const auto& [file, expected] : manifest->files) {
    auto relative = std::filesystem::path{file};
    if (!is_contained(relative) || is_reserved(file)) {
      return violation(file, "manifest entry escapes the bundle: " + file);
    }
    auto digest = bootforge::crypto::sha256_file(root / relative, error);
    if (!digest) {
      return violation(file, "listed file missing or unreadable: " + file);
    }
    auto actual = bootforge::schema::to_hex(*digest);
    auto lowered = expected;
    std::transform(std::begin(lowered), std::end(lowered), std::begin(lowered),
                   [](unsigned char c) { return std::tolower(c); });
    if (actual != lowered) {
      return violation(file, "digest mismatch for " + file);
    }
    ++result.files_checked;
  }

  auto present = list_bundle_files(root, error);
  if (!present) {
    return violation(".", error.message);
  }
  for (const auto& file : *present) {
    if (!manifest->files.contains(file)) {
      return violation(file, "file not listed in manifest: " + file);
    }
  }

  auto signature_path = root / kSignatureFile;
  auto ec = std::error_code{};
  auto signed_bundle = std::filesystem::exists(signature_path, ec);
  if (signing_key && !signed_bundle) {
    return violation(std::string{kSignatureFile},
                     "bundle is unsigned but a signing key was supplied");
  }
  if (!signing_key && signed_bundle) {
    return violation(std::string{kSignatureFile},
                     "bundle is signed but no signing key was supplied");
  }
  if (signing_key) {
    auto stored = bootforge::schema::encoding::read_file(signature_path, error);
    if (!stored ||
        !signature_matches(bootforge::schema::make_string_view(*stored),
                           *signing_key,
                           bootforge::schema::make_bytes_view(*manifest_bytes))) {
      return violation(std::string{kSignatureFile},
                       "manifest signature does not match");
    }
    result.signature_checked = true;
  }

  result.ok = true;
  return result;
}

tree_verify_result verify_tree(
    const std::filesystem::path& root,
    const std::optional<bootforge::schema::bytes_t>& signing_key) {
  auto result = tree_verify_result{};
  auto bundles = std::vector<std::filesystem::path>{};
  auto ec = std::error_code{};
  if (std::filesystem::exists(root / kManifestFile, ec)) {
    bundles.push_back(root);
  } else {
    auto it = std::filesystem::recursive_directory_iterator{root, ec};
    if (ec) {
      result.error = bootforge::schema::make_error(
          error_code_t::not_found, "cannot read " + root.string());
      return result;
    }
    for (auto end = std::filesystem::recursive_directory_iterator{}; it != end;
         it.increment(ec)) {
      if (ec) {
        result.error = bootforge::schema::make_error(
            error_code_t::io_error, "failed walking " + root.string());
        return result;
      }
      auto entry_ec = std::error_code{};
      if (!it->is_directory(entry_ec) ||
          !std::filesystem::exists(it->path() / kManifestFile, entry_ec)) {
        continue;
      }
      bundles.push_back(it->path());
      // A bundle's artifacts are never bundles of their own.
      it.disable_recursion_pending();
    }
  }
  std::sort(std::begin(bundles), std::end(bundles));

  if (bundles.empty()) {
    result.error = bootforge::schema::make_error(
        error_code_t::not_found, "no evidence bundles below " + root.string());
    return result;
  }

  result.ok = true;
  for (const auto& bundle : bundles) {
    auto verified = verify_report(bundle, signing_key);
    if (!verified.ok) {
      spdlog::warn("bundle {} failed verification: {}", bundle.string(),
                   verified.error.message);
      if (result.ok) {
        result.error = verified.error;
      }
      result.ok = false;
    }
    result.reports.emplace_back(bundle, std::move(verified));
  }
  return result;
}

bool export_report(const std::filesystem::path& root,
                   const std::filesystem::path& output,
                   bootforge::schema::error_t& error) {
  auto ec = std::error_code{};
  auto directory = std::filesystem::absolute(root, ec).lexically_normal();
  if (!directory.has_filename()) {
    directory = directory.parent_path();
  }
  if (!std::filesystem::exists(directory / kManifestFile, ec)) {
    error = bootforge::schema::make_error(
        error_code_t::invalid_argument,
        directory.string() + " is not a finalized evidence bundle");
    return false;
  }
  auto target = std::filesystem::absolute(output, ec).lexically_normal();
  auto inside = target.lexically_relative(directory);
  if (!inside.empty() && *std::begin(inside) != "..") {
    error = bootforge::schema::make_error(
        error_code_t::invalid_argument,
        "export target must lie outside the bundle");
    return false;
  }

  auto entries = collect_tree(directory, directory.parent_path());
  if (!write_tar_gz(target, entries, error)) {
    return false;
  }
  spdlog::info("exported {} ({} files) to {}", directory.string(),
               entries.size(), target.string());
  return true;
}

}  // namespace bootforge::report
