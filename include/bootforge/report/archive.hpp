#pragma once
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bootforge::report {

struct archive_entry final {
  // Name inside the archive, '/' separated.
  std::string name;
  std::filesystem::path source;
};

/// Write a gzip compressed POSIX ustar archive of regular files.
///
/// Member bytes are copied verbatim. Names longer than 100 bytes use the
/// ustar prefix field, or a GNU long-name record when they cannot be split;
/// members of 8 GiB or more are rejected. The archive is staged at
/// `<output>.partial` and renamed over `output` only when complete, so a
/// failure leaves nothing at `output`.
bool write_tar_gz(const std::filesystem::path& output,
                  const std::vector<archive_entry>& entries,
                  bootforge::schema::error_t& error);

/// Regular files below `root`, named relative to `base`, sorted by name.
std::vector<archive_entry> collect_tree(const std::filesystem::path& root,
                                        const std::filesystem::path& base);

}  // namespace bootforge::report
