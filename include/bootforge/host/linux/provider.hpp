#pragma once
#include <bootforge/host/provider.hpp>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace bootforge::host {

/// Filesystem locations the Linux provider reads. Tests point them at a
/// fabricated tree.
struct linux_provider_roots final {
  std::filesystem::path sys_block{"/sys/block"};
  std::filesystem::path sys_fs_btrfs{"/sys/fs/btrfs"};
  std::filesystem::path mounts{"/proc/self/mounts"};
  std::filesystem::path by_label{"/dev/disk/by-label"};
  std::filesystem::path os_release{"/etc/os-release"};
  std::filesystem::path dmi{"/sys/devices/virtual/dmi/id"};
  std::filesystem::path hostname{"/proc/sys/kernel/hostname"};
  std::filesystem::path dev{"/dev"};
};

struct mount_entry final {
  std::string source;
  std::string mount_point;
  std::string fs_type;
};

/// Parse `/proc/self/mounts` text, decoding octal escapes (`\040`).
std::vector<mount_entry> parse_mounts(std::string_view text);

/// sysfs based enumeration of whole disks and their partitions.
///
/// A disk is a system disk when `/`, `/boot` or `/boot/efi` is mounted from
/// one of its partitions, from the disk itself, from a device-mapper or md
/// device stacked on it, from a btrfs filesystem it is a member of, or from a
/// loop device whose image file lives on it. When any of those mounts cannot
/// be traced to a physical disk, or `/` is not mounted at all, every disk is
/// reported as a system disk.
class linux_host_provider final : public host_provider {
 public:
  explicit linux_host_provider(linux_provider_roots roots = {});

  std::optional<bootforge::schema::device_graph_t> device_graph(
      bootforge::schema::error_t& error) const override;
  std::optional<std::filesystem::path> device_path(
      const bootforge::schema::disk_id_t& disk_id) const override;
  std::string_view name() const override { return "linux"; }

 private:
  bootforge::schema::host_info_t read_host_info() const;
  std::map<std::string, std::string> read_labels() const;

  /// Kernel name behind a mount source such as `/dev/mapper/vg-root`.
  std::optional<std::string> resolve_source(std::string_view source) const;

  /// Whole disks backing kernel device `name`, following partitions and
  /// `slaves/` links. Empty when nothing resolves.
  std::set<std::string> backing_disks(const std::string& name,
                                      int depth = 0) const;

  /// Physical disks holding the filesystem of `mount`, or std::nullopt when
  /// any part of it cannot be traced to one.
  std::optional<std::set<std::string>> mount_disks(
      const mount_entry& mount,
      const std::vector<mount_entry>& mounts,
      int depth = 0) const;

  /// Every device of the btrfs filesystem that `name` belongs to.
  std::optional<std::set<std::string>> btrfs_devices(
      const std::string& name) const;

  linux_provider_roots roots_;
};

}  // namespace bootforge::host
