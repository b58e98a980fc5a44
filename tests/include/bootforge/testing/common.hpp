#pragma once

#include <bootforge/host/static_provider.hpp>
#include <bootforge/schema/device_graph.hpp>
#include <bootforge/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace bootforge::testing {

inline constexpr auto kSystemDiskId = std::string_view{"PhysicalDrive0"};
inline constexpr auto kTargetDiskId = std::string_view{"PhysicalDrive1"};

inline std::string make_temp_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Fresh directory under the system temp directory, removed on destruction.
class temp_dir final {
 public:
  explicit temp_dir(const std::string_view prefix)
      : path_{make_temp_path(prefix)} {
    std::filesystem::create_directories(path_);
  }
  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;
  ~temp_dir() { remove_path(path_); }

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string_view name) const {
    return path_ / std::string{name};
  }

 private:
  std::filesystem::path path_;
};

/// Deterministic, non-repeating-looking bytes.
inline bootforge::schema::bytes_t make_pattern(const std::size_t size,
                                               const uint8_t seed = 7) {
  auto out = bootforge::schema::bytes_t(size);
  auto state = static_cast<uint32_t>(seed) * 2654435761u + 1;
  for (auto& byte : out) {
    state = state * 1664525u + 1013904223u;
    byte = static_cast<uint8_t>(state >> 24);
  }
  return out;
}

inline void write_bytes(const std::filesystem::path& path,
                        const bootforge::schema::bytes_t& bytes) {
  std::filesystem::create_directories(path.parent_path());
  auto stream = std::ofstream{path, std::ios::binary | std::ios::trunc};
  stream.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
}

inline void write_text(const std::filesystem::path& path,
                       const std::string_view text) {
  std::filesystem::create_directories(path.parent_path());
  auto stream = std::ofstream{path, std::ios::binary | std::ios::trunc};
  stream << text;
}

inline std::string read_text(const std::filesystem::path& path) {
  auto stream = std::ifstream{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{stream},
                     std::istreambuf_iterator<char>{}};
}

inline bootforge::schema::bytes_t read_bytes(const std::filesystem::path& path) {
  return bootforge::schema::make_bytes(read_text(path));
}

/// Two disks: `PhysicalDrive0` hosts `/`, `PhysicalDrive1` is a removable
/// 32 GB stick with one FAT partition mounted at `target_mount`.
inline bootforge::schema::device_graph_t make_fixture_graph(
    const std::string& target_mount = "/media/usb") {
  auto system = bootforge::schema::disk_t{};
  system.id = std::string{kSystemDiskId};
  system.friendly_name = "System SSD";
  system.size_bytes = uint64_t{512} * 1000 * 1000 * 1000;
  system.removable = false;
  system.is_system_disk = true;
  system.partitions.push_back(bootforge::schema::partition_t{
      .id = "PhysicalDrive0Partition1",
      .label = "root",
      .fs = "ext4",
      .size_bytes = uint64_t{500} * 1000 * 1000 * 1000,
      .mount_points = {"/"}});

  auto target = bootforge::schema::disk_t{};
  target.id = std::string{kTargetDiskId};
  target.friendly_name = "USB Stick";
  target.size_bytes = uint64_t{32} * 1000 * 1000 * 1000;
  target.removable = true;
  target.is_system_disk = false;
  target.partitions.push_back(bootforge::schema::partition_t{
      .id = "PhysicalDrive1Partition1",
      .label = "BOOTFORGE",
      .fs = "vfat",
      .size_bytes = uint64_t{31} * 1000 * 1000 * 1000,
      .mount_points = {target_mount}});

  return bootforge::schema::make_device_graph(
      bootforge::schema::host_info_t{
          .os = "linux", .os_version = "Test 1.0", .machine = "fixture"},
      {std::move(system), std::move(target)});
}

/// Provider over the fixture graph with both disks backed by regular files
/// in `directory` (`system.img` and `target.img`).
inline bootforge::host::static_host_provider make_fixture_provider(
    const std::filesystem::path& directory,
    const std::string& target_mount = "/media/usb") {
  return bootforge::host::static_host_provider{
      make_fixture_graph(target_mount),
      bootforge::host::device_path_map_t{
          {std::string{kSystemDiskId}, directory / "system.img"},
          {std::string{kTargetDiskId}, directory / "target.img"}}};
}

}  // namespace bootforge::testing
