#include <bootforge/common/posix_io.hpp>
#include <bootforge/crypto/sha256.hpp>
#include <bootforge/imaging/engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <limits>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace bootforge::imaging {

namespace {

using bootforge::schema::error_code_t;

bool is_cancelled(const stream_options& options) {
  return options.cancel != nullptr && options.cancel->cancelled();
}

}  // namespace

std::optional<disk_reader> open_read_only(
    const bootforge::host::host_provider& provider,
    const bootforge::schema::disk_id_t& disk_id,
    bootforge::schema::error_t& error) {
  auto path = provider.device_path(disk_id);
  if (!path) {
    error = bootforge::schema::make_error(
        error_code_t::not_found, "no device node for disk '" + disk_id + "'");
    return std::nullopt;
  }
  return disk_reader::open(*path, error);
}

std::optional<bootforge::schema::chunk_plan_t> plan_chunks(
    const uint64_t size_bytes,
    const uint64_t chunk_size_bytes,
    bootforge::schema::error_t& error) {
  if (chunk_size_bytes == 0) {
    error = bootforge::schema::make_error(error_code_t::invalid_argument,
                                          "chunk size must be positive");
    return std::nullopt;
  }
  auto chunk_count = size_bytes / chunk_size_bytes +
                     (size_bytes % chunk_size_bytes == 0 ? 0 : 1);
  return bootforge::schema::chunk_plan_t{.chunk_size_bytes = chunk_size_bytes,
                                         .total_size_bytes = size_bytes,
                                         .chunk_count = chunk_count};
}

bootforge::schema::chunk_plan_t plan_chunks(const uint64_t size_bytes) {
  auto error = bootforge::schema::error_t{};
  return *plan_chunks(size_bytes, bootforge::schema::kDefaultChunkSizeBytes,
                      error);
}

uint64_t chunk_offset(const bootforge::schema::chunk_plan_t& plan,
                      const uint64_t index) {
  return index * plan.chunk_size_bytes;
}

uint64_t chunk_length(const bootforge::schema::chunk_plan_t& plan,
                      const uint64_t index) {
  auto offset = chunk_offset(plan, index);
  if (offset >= plan.total_size_bytes) {
    return 0;
  }
  return std::min(plan.chunk_size_bytes, plan.total_size_bytes - offset);
}

std::optional<stream_digest> copy_stream(
    const disk_reader& reader,
    const bootforge::schema::chunk_plan_t& plan,
    const chunk_sink_t& sink,
    const stream_options& options,
    bootforge::schema::error_t& error) {
  if (plan.chunk_size_bytes == 0) {
    error = bootforge::schema::make_error(error_code_t::invalid_argument,
                                          "chunk plan has a zero chunk size");
    return std::nullopt;
  }
  if (plan.total_size_bytes > reader.size_bytes()) {
    error = bootforge::schema::make_error(
        error_code_t::invalid_argument,
        "chunk plan covers " + std::to_string(plan.total_size_bytes) +
            " bytes but " + reader.path().string() + " holds " +
            std::to_string(reader.size_bytes()));
    return std::nullopt;
  }

  auto hasher = bootforge::crypto::sha256_hasher{};
  auto result = stream_digest{};
  auto buffer = bootforge::schema::bytes_t(static_cast<std::size_t>(
      std::min(plan.chunk_size_bytes, std::max<uint64_t>(plan.total_size_bytes, 1))));

  for (auto index = uint64_t{0}; index < plan.chunk_count; ++index) {
    if (is_cancelled(options)) {
      spdlog::info("stream over {} cancelled at {} of {} bytes",
                   reader.path().string(), result.bytes_processed,
                   plan.total_size_bytes);
      error = bootforge::schema::make_error(
          error_code_t::cancelled,
          "cancelled after " + std::to_string(result.bytes_processed) +
              " bytes");
      return std::nullopt;
    }

    auto offset = chunk_offset(plan, index);
    auto length = static_cast<std::size_t>(chunk_length(plan, index));
    auto chunk = std::span<uint8_t>{buffer.data(), length};
    if (!reader.read_at(offset, chunk, error)) {
      return std::nullopt;
    }
    auto view = bootforge::schema::bytes_view_t{chunk.data(), chunk.size()};
    hasher.update(view);
    if (options.per_chunk_digests) {
      result.chunk_digests.push_back(bootforge::crypto::sha256(view));
    }
    if (sink && !sink(offset, view, error)) {
      return std::nullopt;
    }

    result.bytes_processed += length;
    if (options.progress) {
      options.progress(result.bytes_processed, plan.total_size_bytes);
    }
  }

  result.digest = hasher.finish();
  return result;
}

std::optional<stream_digest> hash_stream(
    const disk_reader& reader,
    const bootforge::schema::chunk_plan_t& plan,
    const stream_options& options,
    bootforge::schema::error_t& error) {
  return copy_stream(reader, plan, chunk_sink_t{}, options, error);
}

std::optional<bootforge::schema::bytes_t> read_exact(
    const disk_reader& reader,
    const uint64_t offset,
    const uint64_t length,
    bootforge::schema::error_t& error) {
  if (offset > reader.size_bytes() || length > reader.size_bytes() - offset) {
    error = bootforge::schema::make_error(
        error_code_t::io_error,
        "range [" + std::to_string(offset) + ", +" + std::to_string(length) +
            ") exceeds " + std::to_string(reader.size_bytes()) + " bytes");
    return std::nullopt;
  }
  if (length > std::numeric_limits<std::size_t>::max()) {
    error = bootforge::schema::make_error(error_code_t::io_error,
                                          "read length too large");
    return std::nullopt;
  }
  auto bytes = bootforge::schema::bytes_t(static_cast<std::size_t>(length));
  if (!reader.read_at(offset, bytes, error)) {
    return std::nullopt;
  }
  return bytes;
}

std::optional<stream_digest> copy_to_disk(
    const disk_reader& reader,
    const bootforge::schema::chunk_plan_t& plan,
    disk_writer& writer,
    const stream_options& options,
    bootforge::schema::error_t& error) {
  if (plan.total_size_bytes > writer.size_bytes()) {
    error = bootforge::schema::make_error(
        error_code_t::invalid_argument,
        reader.path().string() + " (" + std::to_string(plan.total_size_bytes) +
            " bytes) does not fit on " + writer.path().string() + " (" +
            std::to_string(writer.size_bytes()) + " bytes)");
    return std::nullopt;
  }
  auto sink = [&writer](uint64_t offset,
                        const bootforge::schema::bytes_view_t& bytes,
                        bootforge::schema::error_t& sink_error) {
    return writer.write_at(offset, bytes, sink_error);
  };
  auto result = copy_stream(reader, plan, sink, options, error);
  if (!result) {
    // Whatever reached the device stays there; it is reported, not undone.
    return std::nullopt;
  }
  if (!writer.sync(error)) {
    return std::nullopt;
  }
  return result;
}

std::optional<stream_digest> copy_to_file(
    const disk_reader& reader,
    const bootforge::schema::chunk_plan_t& plan,
    const std::filesystem::path& path,
    const stream_options& options,
    bootforge::schema::error_t& error) {
  auto fd = bootforge::common::unique_fd{
      ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644)};
  if (!fd) {
    error = bootforge::common::make_errno_error(errno, "create " + path.string());
    return std::nullopt;
  }
  auto sink = [&fd, &path](uint64_t offset,
                           const bootforge::schema::bytes_view_t& bytes,
                           bootforge::schema::error_t& sink_error) {
    auto count = bootforge::common::pwrite_all(fd.get(), bytes.data(),
                                               bytes.size(), offset);
    if (count < 0 || static_cast<std::size_t>(count) != bytes.size()) {
      sink_error = bootforge::common::make_errno_error(
          count < 0 ? errno : EIO, "write " + path.string());
      sink_error.code = error_code_t::io_error;
      return false;
    }
    return true;
  };
  auto result = copy_stream(reader, plan, sink, options, error);
  if (!result) {
    return std::nullopt;
  }
  if (::fsync(fd.get()) != 0) {
    error = bootforge::common::make_errno_error(errno, "fsync " + path.string());
    error.code = error_code_t::io_error;
    return std::nullopt;
  }
  return result;
}

}  // namespace bootforge::imaging
