#include <bootforge/common/posix_io.hpp>
#include <bootforge/imaging/writer.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>
#if defined(__linux__)
#include <linux/fs.h>
#endif

namespace bootforge::imaging {

disk_writer::disk_writer(bootforge::common::unique_fd fd,
                         const uint64_t size_bytes,
                         std::filesystem::path path)
    : fd_{std::move(fd)}, size_bytes_{size_bytes}, path_{std::move(path)} {}

std::optional<disk_writer> open_for_write(
    const bootforge::host::host_provider& provider,
    const bootforge::safety::authorization& grant,
    bootforge::schema::error_t& error) {
  auto path = provider.device_path(grant.disk_id());
  if (!path) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::not_found,
        "no device node for disk '" + grant.disk_id() + "'");
    return std::nullopt;
  }

  struct stat info {};
  if (::stat(path->c_str(), &info) != 0) {
    error = bootforge::common::make_errno_error(errno, "stat " + path->string());
    return std::nullopt;
  }
  auto flags = O_WRONLY | O_CLOEXEC | O_NOCTTY;
  if (S_ISBLK(info.st_mode)) {
    flags |= O_EXCL;
  } else if (!S_ISREG(info.st_mode)) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::not_found,
        path->string() + " is neither a block device nor a regular file");
    return std::nullopt;
  }

  auto fd = bootforge::common::unique_fd{::open(path->c_str(), flags)};
  if (!fd) {
    error = bootforge::common::make_errno_error(errno, "open " + path->string());
    return std::nullopt;
  }

  auto size_bytes = static_cast<uint64_t>(info.st_size);
#if defined(BLKGETSIZE64)
  if (S_ISBLK(info.st_mode) &&
      ::ioctl(fd.get(), BLKGETSIZE64, &size_bytes) != 0) {
    error = bootforge::common::make_errno_error(
        errno, "BLKGETSIZE64 " + path->string());
    return std::nullopt;
  }
#endif

  spdlog::info("opened disk '{}' ({}) for {}", grant.disk_id(), path->string(),
               grant.operation());
  return disk_writer{std::move(fd), size_bytes, *path};
}

bool disk_writer::write_at(const uint64_t offset,
                           const bootforge::schema::bytes_view_t& bytes,
                           bootforge::schema::error_t& error) {
  auto count = bootforge::common::pwrite_all(fd_.get(), bytes.data(),
                                             bytes.size(), offset);
  if (count < 0 || static_cast<std::size_t>(count) != bytes.size()) {
    auto error_number = count < 0 ? errno : EIO;
    error = bootforge::common::make_errno_error(
        error_number,
        "write " + path_.string() + " at " + std::to_string(offset));
    if (error.code != bootforge::schema::error_code_t::device_busy &&
        error.code != bootforge::schema::error_code_t::access_denied) {
      error.code = bootforge::schema::error_code_t::io_error;
    }
    return false;
  }
  return true;
}

bool disk_writer::sync(bootforge::schema::error_t& error) {
  if (::fdatasync(fd_.get()) != 0) {
    error = bootforge::common::make_errno_error(errno, "fdatasync " + path_.string());
    error.code = bootforge::schema::error_code_t::io_error;
    return false;
  }
  return true;
}

}  // namespace bootforge::imaging
