#pragma once
#include <bootforge/common/unique_fd.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>

namespace bootforge::imaging {

/// Read-only handle on a block device or regular file.
///
/// Opened `O_RDONLY`; the access mode is checked again after open and a
/// handle that could write is refused. Block device size comes from
/// `BLKGETSIZE64`, regular files from `fstat`.
class disk_reader final {
 public:
  static std::optional<disk_reader> open(const std::filesystem::path& path,
                                         bootforge::schema::error_t& error);

  disk_reader(disk_reader&&) noexcept = default;
  disk_reader& operator=(disk_reader&&) noexcept = default;
  disk_reader(const disk_reader&) = delete;
  disk_reader& operator=(const disk_reader&) = delete;

  uint64_t size_bytes() const { return size_bytes_; }
  const std::filesystem::path& path() const { return path_; }

  /// Fill `out` from `offset`. A short read is an `io_error`.
  bool read_at(uint64_t offset,
               std::span<uint8_t> out,
               bootforge::schema::error_t& error) const;

 private:
  disk_reader(bootforge::common::unique_fd fd,
              uint64_t size_bytes,
              std::filesystem::path path);

  bootforge::common::unique_fd fd_;
  uint64_t size_bytes_{};
  std::filesystem::path path_;
};

}  // namespace bootforge::imaging
