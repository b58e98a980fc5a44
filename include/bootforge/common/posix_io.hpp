#pragma once
#include <bootforge/schema/error_code.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace bootforge::common {

/// Positional read retrying on EINTR and short reads.
///
/// Returns the number of bytes read (less than `length` only at end of
/// file) or -1 with errno set.
int64_t pread_all(int fd, void* buffer, std::size_t length, uint64_t offset);

/// Positional write retrying on EINTR and short writes.
int64_t pwrite_all(int fd,
                   const void* buffer,
                   std::size_t length,
                   uint64_t offset);

/// Map an errno from open/read/write to the imaging fault taxonomy.
bootforge::schema::error_code_t error_code_from_errno(int error_number);

/// `error_t` carrying the mapped code and `what: strerror(errno)`.
bootforge::schema::error_t make_errno_error(int error_number,
                                            std::string_view what);

}  // namespace bootforge::common
