#include <bootforge/common/posix_io.hpp>
#include <bootforge/imaging/reader.hpp>

#include <cerrno>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#if defined(__linux__)
#include <linux/fs.h>
#endif

namespace bootforge::imaging {

disk_reader::disk_reader(bootforge::common::unique_fd fd,
                         const uint64_t size_bytes,
                         std::filesystem::path path)
    : fd_{std::move(fd)}, size_bytes_{size_bytes}, path_{std::move(path)} {}

std::optional<disk_reader> disk_reader::open(
    const std::filesystem::path& path,
    bootforge::schema::error_t& error) {
  auto fd = bootforge::common::unique_fd{
      ::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NOCTTY)};
  if (!fd) {
    error = bootforge::common::make_errno_error(errno, "open " + path.string());
    return std::nullopt;
  }

  auto flags = ::fcntl(fd.get(), F_GETFL);
  if (flags < 0 || (flags & O_ACCMODE) != O_RDONLY) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::access_denied,
        "refusing non read-only handle for " + path.string());
    return std::nullopt;
  }

  struct stat info {};
  if (::fstat(fd.get(), &info) != 0) {
    error = bootforge::common::make_errno_error(errno, "fstat " + path.string());
    return std::nullopt;
  }

  auto size_bytes = uint64_t{};
  if (S_ISBLK(info.st_mode)) {
#if defined(BLKGETSIZE64)
    if (::ioctl(fd.get(), BLKGETSIZE64, &size_bytes) != 0) {
      error = bootforge::common::make_errno_error(
          errno, "BLKGETSIZE64 " + path.string());
      return std::nullopt;
    }
#else
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::io_error,
        "block device size query is unavailable on this platform");
    return std::nullopt;
#endif
  } else if (S_ISREG(info.st_mode)) {
    size_bytes = static_cast<uint64_t>(info.st_size);
  } else {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::not_found,
        path.string() + " is neither a block device nor a regular file");
    return std::nullopt;
  }

  return disk_reader{std::move(fd), size_bytes, path};
}

bool disk_reader::read_at(const uint64_t offset,
                          std::span<uint8_t> out,
                          bootforge::schema::error_t& error) const {
  auto count =
      bootforge::common::pread_all(fd_.get(), out.data(), out.size(), offset);
  if (count < 0) {
    error = bootforge::common::make_errno_error(
        errno, "read " + path_.string() + " at " + std::to_string(offset));
    // A failing read is always reported as an I/O fault.
    error.code = bootforge::schema::error_code_t::io_error;
    return false;
  }
  if (static_cast<std::size_t>(count) != out.size()) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::io_error,
        "short read from " + path_.string() + " at " + std::to_string(offset) +
            ": " + std::to_string(count) + " of " +
            std::to_string(out.size()) + " bytes");
    return false;
  }
  return true;
}

}  // namespace bootforge::imaging
