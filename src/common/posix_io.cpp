#include <bootforge/common/posix_io.hpp>

#include <cerrno>
#include <cstring>
#include <string>

#include <unistd.h>

namespace bootforge::common {

int64_t pread_all(const int fd,
                  void* buffer,
                  const std::size_t length,
                  uint64_t offset) {
  auto* cursor = static_cast<unsigned char*>(buffer);
  auto left = length;
  while (left > 0) {
    auto count = ::pread(fd, cursor, left, static_cast<off_t>(offset));
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      return -1;
    }
    if (count == 0) {
      break;
    }
    left -= static_cast<std::size_t>(count);
    cursor += count;
    offset += static_cast<uint64_t>(count);
  }
  return static_cast<int64_t>(length - left);
}

int64_t pwrite_all(const int fd,
                   const void* buffer,
                   const std::size_t length,
                   uint64_t offset) {
  const auto* cursor = static_cast<const unsigned char*>(buffer);
  auto left = length;
  while (left > 0) {
    auto count = ::pwrite(fd, cursor, left, static_cast<off_t>(offset));
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      return -1;
    }
    if (count == 0) {
      break;
    }
    left -= static_cast<std::size_t>(count);
    cursor += count;
    offset += static_cast<uint64_t>(count);
  }
  return static_cast<int64_t>(length - left);
}

bootforge::schema::error_code_t error_code_from_errno(const int error_number) {
  switch (error_number) {
    case ENOENT:
    case ENXIO:
    case ENODEV:
    case ENOTDIR:
      return bootforge::schema::error_code_t::not_found;
    case EACCES:
    case EPERM:
    case EROFS:
      return bootforge::schema::error_code_t::access_denied;
    case EBUSY:
    case EWOULDBLOCK:
    case ETXTBSY:
      return bootforge::schema::error_code_t::device_busy;
    default:
      return bootforge::schema::error_code_t::io_error;
  }
}

bootforge::schema::error_t make_errno_error(const int error_number,
                                            const std::string_view what) {
  return bootforge::schema::make_error(
      error_code_from_errno(error_number),
      std::string{what} + ": " + std::strerror(error_number));
}

}  // namespace bootforge::common
