#include <bootforge/workflow/actions/staging.hpp>

#include <bootforge/common/posix_io.hpp>
#include <bootforge/common/unique_fd.hpp>
#include <bootforge/crypto/sha256.hpp>
#include <bootforge/imaging/engine.hpp>
#include <bootforge/imaging/reader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace bootforge::workflow::actions {

namespace {

using bootforge::schema::error_code_t;

constexpr auto kStagingChunkBytes = uint64_t{4} * bootforge::schema::kMebibyte;

std::string trim_separators(std::string value) {
  while (value.size() > 1 && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

struct source_file final {
  std::filesystem::path path;
  std::string relative;
  uint64_t size_bytes{};
};

std::optional<std::vector<source_file>> list_source(
    const std::filesystem::path& source,
    bootforge::schema::error_t& error) {
  auto ec = std::error_code{};
  if (!std::filesystem::is_directory(source, ec)) {
    error = bootforge::schema::make_error(
        error_code_t::not_found, source.string() + " is not a directory");
    return std::nullopt;
  }
  auto files = std::vector<source_file>{};
  auto it = std::filesystem::recursive_directory_iterator{source, ec};
  for (auto end = std::filesystem::recursive_directory_iterator{}; it != end;
       it.increment(ec)) {
    if (ec) {
      error = bootforge::schema::make_error(
          error_code_t::io_error,
          "failed walking " + source.string() + ": " + ec.message());
      return std::nullopt;
    }
    auto status = it->symlink_status(ec);
    if (std::filesystem::is_directory(status)) {
      continue;
    }
    auto relative =
        std::filesystem::relative(it->path(), source, ec).generic_string();
    if (!std::filesystem::is_regular_file(status)) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_argument,
          "refusing to stage non-regular file " + relative);
      return std::nullopt;
    }
    files.push_back(source_file{.path = it->path(),
                                .relative = std::move(relative),
                                .size_bytes = it->file_size(ec)});
  }
  std::sort(std::begin(files), std::end(files),
            [](const auto& lhs, const auto& rhs) {
              return lhs.relative < rhs.relative;
            });
  return files;
}

std::optional<bootforge::schema::hash32_t> copy_file(
    const source_file& file,
    const std::filesystem::path& destination,
    const bootforge::common::cancel_signal& cancel,
    bootforge::schema::error_t& error) {
  auto reader = bootforge::imaging::disk_reader::open(file.path, error);
  if (!reader) {
    return std::nullopt;
  }
  auto fd = bootforge::common::unique_fd{
      ::open(destination.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
             0644)};
  if (!fd) {
    error = bootforge::common::make_errno_error(errno, destination.string());
    return std::nullopt;
  }

  auto plan = bootforge::imaging::plan_chunks(reader->size_bytes(),
                                              kStagingChunkBytes, error);
  if (!plan) {
    return std::nullopt;
  }
  auto options = bootforge::imaging::stream_options{};
  options.cancel = &cancel;
  auto sink = [&](uint64_t offset, const bootforge::schema::bytes_view_t& bytes,
                  bootforge::schema::error_t& sink_error) {
    auto written =
        bootforge::common::pwrite_all(fd.get(), bytes.data(), bytes.size(), offset);
    if (written < 0 || static_cast<std::size_t>(written) != bytes.size()) {
      sink_error =
          bootforge::common::make_errno_error(errno, destination.string());
      return false;
    }
    return true;
  };
  auto copied =
      bootforge::imaging::copy_stream(*reader, *plan, sink, options, error);
  if (!copied) {
    return std::nullopt;
  }
  if (::fsync(fd.get()) != 0) {
    error = bootforge::common::make_errno_error(errno, destination.string());
    return std::nullopt;
  }
  return copied->digest;
}

}  // namespace

std::optional<std::vector<staged_file>> stage_tree(
    const std::filesystem::path& source,
    const std::filesystem::path& target,
    const bootforge::common::cancel_signal& cancel,
    const std::optional<uint64_t>& max_file_bytes,
    bootforge::schema::error_t& error) {
  auto files = list_source(source, error);
  if (!files) {
    return std::nullopt;
  }
  if (max_file_bytes) {
    for (const auto& file : *files) {
      if (file.size_bytes > *max_file_bytes) {
        error = bootforge::schema::make_error(
            error_code_t::invalid_argument,
            file.relative + " is too large for the target filesystem");
        return std::nullopt;
      }
    }
  }

  auto staged = std::vector<staged_file>{};
  staged.reserve(files->size());
  for (const auto& file : *files) {
    if (cancel.cancelled()) {
      error = bootforge::schema::make_error(error_code_t::cancelled,
                                            "staging cancelled");
      return std::nullopt;
    }
    auto destination = target / file.relative;
    auto ec = std::error_code{};
    std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec) {
      error = bootforge::schema::make_error(
          bootforge::common::error_code_from_errno(ec.value()),
          "cannot create " + destination.parent_path().string());
      return std::nullopt;
    }
    auto digest = copy_file(file, destination, cancel, error);
    if (!digest) {
      return std::nullopt;
    }
    auto readback = bootforge::crypto::sha256_file(destination, error);
    if (!readback) {
      return std::nullopt;
    }
    if (*readback != *digest) {
      error = bootforge::schema::make_error(
          error_code_t::integrity_violation,
          "staged copy of " + file.relative + " reads back differently");
      return std::nullopt;
    }
    spdlog::debug("staged {} ({} bytes)", file.relative, file.size_bytes);
    staged.push_back(staged_file{.relative = file.relative,
                                 .size_bytes = file.size_bytes,
                                 .digest = *digest});
  }
  return staged;
}

std::string digest_listing(const std::vector<staged_file>& files) {
  auto listing = std::string{};
  for (const auto& file : files) {
    listing += bootforge::schema::to_hex(file.digest);
    listing += "  ";
    listing += file.relative;
    listing += '\n';
  }
  return listing;
}

std::optional<std::string> mounted_filesystem(
    const step_context& context,
    const std::filesystem::path& mount) {
  if (context.grant == nullptr) {
    return std::nullopt;
  }
  auto wanted = trim_separators(mount.string());
  for (const auto& partition : context.grant->disk().partitions) {
    for (const auto& mount_point : partition.mount_points) {
      if (trim_separators(mount_point) == wanted) {
        return partition.fs;
      }
    }
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> staging_root(
    const bootforge::schema::step_params_t& params,
    bootforge::schema::error_t& error) {
  auto mount = string_param(params, "target_mount");
  if (!mount) {
    error = bootforge::schema::make_error(error_code_t::invalid_step_params,
                                          "target_mount is required");
    return std::nullopt;
  }
  auto root = std::filesystem::path{*mount};
  auto ec = std::error_code{};
  if (!std::filesystem::is_directory(root, ec)) {
    error = bootforge::schema::make_error(
        error_code_t::not_found, "target mount " + *mount + " is not a directory");
    return std::nullopt;
  }
  return root;
}

step_outcome finish_staging(step_context& context,
                            const std::vector<staged_file>& files,
                            const std::string_view artifact_name,
                            std::string message) {
  auto listing = digest_listing(files);
  auto error = bootforge::schema::error_t{};
  auto artifact = context.bundle.write_artifact(
      context.step.id + "/" + std::string{artifact_name},
      bootforge::schema::make_bytes_view(listing), error);
  if (!artifact) {
    return make_failure(std::move(error));
  }
  return make_success(std::move(message), {*artifact});
}

}  // namespace bootforge::workflow::actions
