#pragma once
#include <bootforge/common/unique_fd.hpp>
#include <bootforge/host/provider.hpp>
#include <bootforge/safety/gate.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace bootforge::imaging {

/// Write handle on a disk. Only obtainable with a gate authorization for the
/// same disk; the authorization must outlive the writer.
class disk_writer final {
 public:
  disk_writer(disk_writer&&) noexcept = default;
  disk_writer& operator=(disk_writer&&) noexcept = default;
  disk_writer(const disk_writer&) = delete;
  disk_writer& operator=(const disk_writer&) = delete;

  uint64_t size_bytes() const { return size_bytes_; }
  const std::filesystem::path& path() const { return path_; }

  bool write_at(uint64_t offset,
                const bootforge::schema::bytes_view_t& bytes,
                bootforge::schema::error_t& error);

  /// Flush written data to the device (`fdatasync`).
  bool sync(bootforge::schema::error_t& error);

 private:
  friend std::optional<disk_writer> open_for_write(
      const bootforge::host::host_provider& provider,
      const bootforge::safety::authorization& grant,
      bootforge::schema::error_t& error);

  disk_writer(bootforge::common::unique_fd fd,
              uint64_t size_bytes,
              std::filesystem::path path);

  bootforge::common::unique_fd fd_;
  uint64_t size_bytes_{};
  std::filesystem::path path_;
};

/// Open the authorized disk for writing. Block devices are opened
/// `O_EXCL`, which the kernel refuses while a partition is mounted.
std::optional<disk_writer> open_for_write(
    const bootforge::host::host_provider& provider,
    const bootforge::safety::authorization& grant,
    bootforge::schema::error_t& error);

}  // namespace bootforge::imaging
