#include <bootforge/report/archive.hpp>

#include <zlib.h>

#include <sys/stat.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>

namespace bootforge::report {

namespace {

using bootforge::schema::error_code_t;

constexpr auto kBlockSize = std::size_t{512};
constexpr auto kMaxMemberSize = uint64_t{077777777777};
constexpr auto kCopyBufferSize = std::size_t{1} << 20;

// GNU extension: the next member's full name, stored as the record's data.
constexpr auto kLongNameType = 'L';
constexpr auto kLongNameMarker = "././@LongLink";

using header_t = std::array<char, kBlockSize>;
using gz_file_ptr = std::unique_ptr<gzFile_s, decltype(&gzclose)>;

void put_octal(char* field, const std::size_t width, uint64_t value) {
  // width - 1 digits followed by NUL.
  std::memset(field, '0', width - 1);
  field[width - 1] = '\0';
  for (auto i = width - 1; i > 0 && value > 0; --i) {
    field[i - 1] = static_cast<char>('0' + (value & 7u));
    value >>= 3u;
  }
}

void put_string(char* field, const std::size_t width, const std::string& value) {
  std::memcpy(field, value.data(), std::min(width, value.size()));
}

uint32_t header_checksum(const header_t& header) {
  auto sum = uint32_t{0};
  for (std::size_t i = 0; i < header.size(); ++i) {
    // The checksum field itself counts as spaces.
    auto c = (i >= 148 && i < 156) ? static_cast<unsigned char>(' ')
                                   : static_cast<unsigned char>(header[i]);
    sum += c;
  }
  return sum;
}

bool split_name(const std::string& name, std::string& prefix, std::string& base) {
  if (name.size() <= 100) {
    prefix.clear();
    base = name;
    return true;
  }
  for (auto slash = name.rfind('/'); slash != std::string::npos && slash > 0;
       slash = name.rfind('/', slash - 1)) {
    if (slash <= 155 && name.size() - slash - 1 <= 100) {
      prefix = name.substr(0, slash);
      base = name.substr(slash + 1);
      return true;
    }
  }
  return false;
}

header_t make_header(const std::string& name,
                     const std::string& prefix,
                     const uint64_t mode,
                     const uint64_t size,
                     const uint64_t mtime,
                     const char type) {
  auto header = header_t{};
  put_string(header.data(), 100, name);
  put_octal(header.data() + 100, 8, mode);
  put_octal(header.data() + 108, 8, 0);
  put_octal(header.data() + 116, 8, 0);
  put_octal(header.data() + 124, 12, size);
  put_octal(header.data() + 136, 12, mtime);
  header[156] = type;
  if (type == kLongNameType) {
    std::memcpy(header.data() + 257, "ustar  ", 8);
  } else {
    std::memcpy(header.data() + 257, "ustar", 6);
    std::memcpy(header.data() + 263, "00", 2);
  }
  put_string(header.data() + 345, 155, prefix);
  auto checksum = header_checksum(header);
  put_octal(header.data() + 148, 7, checksum);
  header[155] = ' ';
  return header;
}

bool gz_write_all(gzFile file,
                  const void* data,
                  const std::size_t length,
                  bootforge::schema::error_t& error) {
  if (length == 0) {
    return true;
  }
  auto written = gzwrite(file, data, static_cast<unsigned int>(length));
  if (written <= 0 || static_cast<std::size_t>(written) != length) {
    auto code = 0;
    error = bootforge::schema::make_error(
        error_code_t::io_error,
        std::string{"gzip write failed: "} + gzerror(file, &code));
    return false;
  }
  return true;
}

bool write_archive(const std::filesystem::path& output,
                   const std::vector<archive_entry>& entries,
                   bootforge::schema::error_t& error) {
  auto file = gz_file_ptr{gzopen(output.c_str(), "wb9"), gzclose};
  if (!file) {
    error = bootforge::schema::make_error(
        error_code_t::io_error, "cannot create " + output.string() + ": " +
                                    std::strerror(errno));
    return false;
  }

  auto buffer = std::vector<char>(kCopyBufferSize);
  for (const auto& entry : entries) {
    struct stat info {};
    if (::stat(entry.source.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
      error = bootforge::schema::make_error(
          error_code_t::not_found,
          "not a regular file: " + entry.source.string());
      return false;
    }
    auto size = static_cast<uint64_t>(info.st_size);
    if (size > kMaxMemberSize) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_argument,
          entry.name + " is too large for a ustar archive");
      return false;
    }
    auto padding = (kBlockSize - size % kBlockSize) % kBlockSize;
    auto zeros = header_t{};
    auto prefix = std::string{};
    auto base = std::string{};
    if (!split_name(entry.name, prefix, base)) {
      auto long_name = entry.name + '\0';
      auto long_padding =
          (kBlockSize - long_name.size() % kBlockSize) % kBlockSize;
      auto long_header = make_header(kLongNameMarker, {}, 0644, long_name.size(),
                                     0, kLongNameType);
      if (!gz_write_all(file.get(), long_header.data(), long_header.size(),
                        error) ||
          !gz_write_all(file.get(), long_name.data(), long_name.size(), error) ||
          !gz_write_all(file.get(), zeros.data(), long_padding, error)) {
        return false;
      }
      prefix.clear();
      base = entry.name.substr(0, 100);
    }

    auto header = make_header(base, prefix, info.st_mode & 0777, size,
                              static_cast<uint64_t>(info.st_mtime), '0');
    if (!gz_write_all(file.get(), header.data(), header.size(), error)) {
      return false;
    }

    auto stream = std::ifstream{entry.source, std::ios::binary};
    if (!stream) {
      error = bootforge::schema::make_error(
          error_code_t::io_error, "cannot open " + entry.source.string());
      return false;
    }
    auto copied = uint64_t{0};
    while (copied < size) {
      auto want = static_cast<std::streamsize>(
          std::min<uint64_t>(buffer.size(), size - copied));
      stream.read(buffer.data(), want);
      if (stream.gcount() != want) {
        error = bootforge::schema::make_error(
            error_code_t::io_error,
            entry.source.string() + " changed while being archived");
        return false;
      }
      if (!gz_write_all(file.get(), buffer.data(),
                        static_cast<std::size_t>(want), error)) {
        return false;
      }
      copied += static_cast<uint64_t>(want);
    }
    if (!gz_write_all(file.get(), zeros.data(), padding, error)) {
      return false;
    }
  }

  auto trailer = std::array<char, kBlockSize * 2>{};
  if (!gz_write_all(file.get(), trailer.data(), trailer.size(), error)) {
    return false;
  }
  if (gzclose(file.release()) != Z_OK) {
    error = bootforge::schema::make_error(
        error_code_t::io_error, "failed to finish " + output.string());
    return false;
  }
  return true;
}

}  // namespace

bool write_tar_gz(const std::filesystem::path& output,
                  const std::vector<archive_entry>& entries,
                  bootforge::schema::error_t& error) {
  // Written beside the destination and renamed into place once complete.
  auto partial = output;
  partial += ".partial";
  auto ec = std::error_code{};
  if (!write_archive(partial, entries, error)) {
    std::filesystem::remove(partial, ec);
    return false;
  }
  std::filesystem::rename(partial, output, ec);
  if (ec) {
    error = bootforge::schema::make_error(
        error_code_t::io_error,
        "cannot move archive to " + output.string() + ": " + ec.message());
    std::filesystem::remove(partial, ec);
    return false;
  }
  return true;
}

std::vector<archive_entry> collect_tree(const std::filesystem::path& root,
                                        const std::filesystem::path& base) {
  auto entries = std::vector<archive_entry>{};
  auto ec = std::error_code{};
  if (std::filesystem::is_regular_file(root, ec)) {
    entries.push_back(archive_entry{
        .name = std::filesystem::relative(root, base, ec).generic_string(),
        .source = root});
    return entries;
  }
  auto it = std::filesystem::recursive_directory_iterator{root, ec};
  if (ec) {
    return entries;
  }
  for (const auto& item : it) {
    auto file_ec = std::error_code{};
    if (!item.is_regular_file(file_ec)) {
      continue;
    }
    entries.push_back(archive_entry{
        .name = std::filesystem::relative(item.path(), base, file_ec)
                    .generic_string(),
        .source = item.path()});
  }
  std::sort(std::begin(entries), std::end(entries),
            [](const auto& lhs, const auto& rhs) { return lhs.name < rhs.name; });
  return entries;
}

}  // namespace bootforge::report
