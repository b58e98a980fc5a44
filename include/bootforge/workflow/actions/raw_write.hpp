#pragma once
#include <bootforge/imaging/reader.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/workflow/action.hpp>
#include <cstdint>
#include <optional>

namespace bootforge::workflow::actions {

struct raw_write_result final {
  uint64_t bytes_written{};
  bootforge::schema::hash32_t source_digest{};
  std::optional<bootforge::schema::hash32_t> readback_digest;
};

/// Write `image` over the start of the authorized disk, then optionally read
/// the written range back and compare digests (`integrity_violation`).
std::optional<raw_write_result> write_image(
    step_context& context,
    const bootforge::imaging::disk_reader& image,
    uint64_t chunk_size_bytes,
    bool verify,
    bootforge::schema::error_t& error);

/// Artifact body shared by the raw-writing actions.
bootforge::schema::bytes_t describe_raw_write(
    const step_context& context,
    const bootforge::imaging::disk_reader& image,
    const raw_write_result& result);

}  // namespace bootforge::workflow::actions
