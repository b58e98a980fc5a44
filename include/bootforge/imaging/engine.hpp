#pragma once
#include <bootforge/common/cancellation.hpp>
#include <bootforge/host/provider.hpp>
#include <bootforge/imaging/reader.hpp>
#include <bootforge/imaging/writer.hpp>
#include <bootforge/schema/chunk_plan.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace bootforge::imaging {

/// Called after every chunk with the running byte count and the plan total.
/// `bytes_processed` never decreases.
using progress_callback_t =
    std::function<void(uint64_t bytes_processed, uint64_t total_bytes)>;

/// Receives every chunk in ascending offset order.
using chunk_sink_t =
    std::function<bool(uint64_t offset,
                       const bootforge::schema::bytes_view_t& bytes,
                       bootforge::schema::error_t& error)>;

struct stream_options final {
  bool per_chunk_digests{false};
  progress_callback_t progress;
  // Checked before every chunk read; may be null.
  const bootforge::common::cancel_signal* cancel{nullptr};
};

struct stream_digest final {
  bootforge::schema::hash32_t digest{};
  uint64_t bytes_processed{};
  std::vector<bootforge::schema::hash32_t> chunk_digests;
};

/// Open the node behind `disk_id` for reading only.
///
/// Fails with `not_found`, `access_denied` or `device_busy`.
std::optional<disk_reader> open_read_only(
    const bootforge::host::host_provider& provider,
    const bootforge::schema::disk_id_t& disk_id,
    bootforge::schema::error_t& error);

/// Split `size_bytes` into `chunk_size_bytes` pieces; the last may be short.
///
/// Fails with `invalid_argument` for a zero chunk size.
std::optional<bootforge::schema::chunk_plan_t> plan_chunks(
    uint64_t size_bytes,
    uint64_t chunk_size_bytes,
    bootforge::schema::error_t& error);

/// Plan with the default 8 MiB chunk size.
bootforge::schema::chunk_plan_t plan_chunks(uint64_t size_bytes);

uint64_t chunk_offset(const bootforge::schema::chunk_plan_t& plan,
                      uint64_t index);
uint64_t chunk_length(const bootforge::schema::chunk_plan_t& plan,
                      uint64_t index);

/// SHA-256 over `[0, plan.total_size_bytes)` of `reader`.
///
/// The digest is one continuous hash in ascending offset order, identical to
/// hashing the same bytes in a single pass whatever the chunk size. On
/// cancellation fails with `cancelled` and returns nothing; partial digest
/// state is discarded.
std::optional<stream_digest> hash_stream(
    const disk_reader& reader,
    const bootforge::schema::chunk_plan_t& plan,
    const stream_options& options,
    bootforge::schema::error_t& error);

/// Read `length` bytes at `offset`. The range must lie inside the reader;
/// otherwise, and on any read failure, fails with `io_error`.
std::optional<bootforge::schema::bytes_t> read_exact(
    const disk_reader& reader,
    uint64_t offset,
    uint64_t length,
    bootforge::schema::error_t& error);

/// Stream `reader` into `sink` chunk by chunk while hashing the bytes.
std::optional<stream_digest> copy_stream(
    const disk_reader& reader,
    const bootforge::schema::chunk_plan_t& plan,
    const chunk_sink_t& sink,
    const stream_options& options,
    bootforge::schema::error_t& error);

/// `copy_stream` into an authorized disk, followed by `fdatasync`.
std::optional<stream_digest> copy_to_disk(
    const disk_reader& reader,
    const bootforge::schema::chunk_plan_t& plan,
    disk_writer& writer,
    const stream_options& options,
    bootforge::schema::error_t& error);

/// `copy_stream` into a newly created regular file, followed by `fsync`.
/// An existing file at `path` is an error.
std::optional<stream_digest> copy_to_file(
    const disk_reader& reader,
    const bootforge::schema::chunk_plan_t& plan,
    const std::filesystem::path& path,
    const stream_options& options,
    bootforge::schema::error_t& error);

}  // namespace bootforge::imaging
