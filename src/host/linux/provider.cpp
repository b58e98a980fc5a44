#include <bootforge/host/linux/provider.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

namespace bootforge::host {

namespace {

constexpr auto kSectorBytes = uint64_t{512};
constexpr auto kMaxStackDepth = 8;
constexpr auto kSystemMounts =
    std::array<std::string_view, 3>{"/", "/boot", "/boot/efi"};

std::optional<std::string> read_text(const std::filesystem::path& path) {
  auto stream = std::ifstream{path};
  if (!stream) {
    return std::nullopt;
  }
  return std::string{std::istreambuf_iterator<char>{stream},
                     std::istreambuf_iterator<char>{}};
}

std::optional<std::string> read_line(const std::filesystem::path& path) {
  auto text = read_text(path);
  if (!text) {
    return std::nullopt;
  }
  auto end = text->find_last_not_of(" \t\r\n");
  if (end == std::string::npos) {
    return std::nullopt;
  }
  auto begin = text->find_first_not_of(" \t\r\n");
  return text->substr(begin, end - begin + 1);
}

std::optional<uint64_t> read_u64(const std::filesystem::path& path) {
  auto line = read_line(path);
  if (!line) {
    return std::nullopt;
  }
  auto value = uint64_t{};
  auto [ptr, ec] =
      std::from_chars(line->data(), line->data() + line->size(), value);
  if (ec != std::errc{} || ptr != line->data() + line->size()) {
    return std::nullopt;
  }
  return value;
}

uint64_t sectors_to_bytes(const uint64_t sectors) {
  if (sectors > std::numeric_limits<uint64_t>::max() / kSectorBytes) {
    return std::numeric_limits<uint64_t>::max();
  }
  return sectors * kSectorBytes;
}

bool has_prefix(const std::string_view value, const std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

bool is_virtual_disk(const std::string& name,
                     const std::filesystem::path& path) {
  for (auto prefix : {"loop", "ram", "zram", "dm-", "md", "sr", "nbd"}) {
    if (has_prefix(name, prefix)) {
      return true;
    }
  }
  auto ec = std::error_code{};
  auto target = std::filesystem::canonical(path, ec);
  return !ec && target.string().find("/virtual/") != std::string::npos;
}

std::string unescape_mount_field(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 3 < value.size()) {
      auto octal = value.substr(i + 1, 3);
      auto code = 0;
      auto ok = true;
      for (auto c : octal) {
        if (c < '0' || c > '7') {
          ok = false;
          break;
        }
        code = code * 8 + (c - '0');
      }
      if (ok && code <= 0xFF) {
        out.push_back(static_cast<char>(code));
        i += 3;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

// udev escapes label bytes as \xHH in /dev/disk/by-label names.
std::string unescape_label(const std::string_view value) {
  auto out = std::string{};
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 3 < value.size() && value[i + 1] == 'x') {
      auto code = 0;
      auto [ptr, ec] = std::from_chars(value.data() + i + 2,
                                       value.data() + i + 4, code, 16);
      if (ec == std::errc{} && ptr == value.data() + i + 4) {
        out.push_back(static_cast<char>(code));
        i += 3;
        continue;
      }
    }
    out.push_back(value[i]);
  }
  return out;
}

std::string trim_os_value(const std::string& line) {
  auto value = line.substr(line.find('=') + 1);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

// The mount whose mount point is the deepest ancestor of `path`; later
// entries shadow earlier ones on the same mount point.
std::optional<mount_entry> containing_mount(
    const std::string_view path,
    const std::vector<mount_entry>& mounts) {
  auto found = std::optional<mount_entry>{};
  for (const auto& mount : mounts) {
    const auto& point = mount.mount_point;
    auto contains = point == "/" ||
                    (has_prefix(path, point) &&
                     (path.size() == point.size() || path[point.size()] == '/'));
    if (contains && (!found || point.size() >= found->mount_point.size())) {
      found = mount;
    }
  }
  return found;
}

}  // namespace

std::vector<mount_entry> parse_mounts(const std::string_view text) {
  auto entries = std::vector<mount_entry>{};
  auto stream = std::istringstream{std::string{text}};
  auto line = std::string{};
  while (std::getline(stream, line)) {
    auto fields = std::istringstream{line};
    auto source = std::string{};
    auto mount_point = std::string{};
    auto fs_type = std::string{};
    if (!(fields >> source >> mount_point >> fs_type)) {
      continue;
    }
    entries.push_back(mount_entry{.source = unescape_mount_field(source),
                                  .mount_point = unescape_mount_field(mount_point),
                                  .fs_type = fs_type});
  }
  return entries;
}

linux_host_provider::linux_host_provider(linux_provider_roots roots)
    : roots_{std::move(roots)} {}

bootforge::schema::host_info_t linux_host_provider::read_host_info() const {
  auto info = bootforge::schema::host_info_t{.os = "linux"};

  auto name = std::optional<std::string>{};
  auto version = std::optional<std::string>{};
  if (auto text = read_text(roots_.os_release)) {
    auto stream = std::istringstream{*text};
    auto line = std::string{};
    while (std::getline(stream, line)) {
      if (!name && has_prefix(line, "NAME=")) {
        name = trim_os_value(line);
      } else if (!version && has_prefix(line, "VERSION=")) {
        version = trim_os_value(line);
      }
    }
  }
  if (name && version) {
    info.os_version = *name + " " + *version;
  } else {
    info.os_version = name.value_or("unknown");
  }

  auto vendor = read_line(roots_.dmi / "sys_vendor");
  auto product = read_line(roots_.dmi / "product_name");
  if (vendor && product) {
    info.machine = *vendor + " " + *product;
  } else if (vendor || product) {
    info.machine = vendor ? *vendor : *product;
  } else {
    info.machine = read_line(roots_.hostname).value_or("unknown");
  }
  return info;
}

std::map<std::string, std::string> linux_host_provider::read_labels() const {
  auto labels = std::map<std::string, std::string>{};
  auto ec = std::error_code{};
  auto it = std::filesystem::directory_iterator{roots_.by_label, ec};
  if (ec) {
    return labels;
  }
  for (const auto& entry : it) {
    auto link_ec = std::error_code{};
    auto target = std::filesystem::read_symlink(entry.path(), link_ec);
    if (link_ec) {
      continue;
    }
    labels[target.filename().string()] =
        unescape_label(entry.path().filename().string());
  }
  return labels;
}

std::optional<std::string> linux_host_provider::resolve_source(
    const std::string_view source) const {
  if (!has_prefix(source, "/dev/")) {
    return std::nullopt;
  }
  auto relative = std::filesystem::path{std::string{source.substr(5)}};
  auto node = roots_.dev / relative;
  auto ec = std::error_code{};
  if (std::filesystem::is_symlink(node, ec)) {
    auto target = std::filesystem::canonical(node, ec);
    if (!ec) {
      return target.filename().string();
    }
  }
  auto name = relative.filename().string();
  if (name.empty() || name == "root") {
    // /dev/root is a kernel alias that does not name the real device.
    return std::nullopt;
  }
  return name;
}

std::set<std::string> linux_host_provider::backing_disks(
    const std::string& name,
    const int depth) const {
  auto disks = std::set<std::string>{};
  if (depth > kMaxStackDepth) {
    return disks;
  }

  auto ec = std::error_code{};
  auto whole = roots_.sys_block / name;
  auto parent = std::optional<std::string>{};
  if (!std::filesystem::is_directory(whole, ec)) {
    // A partition lives below its disk: /sys/block/<disk>/<partition>.
    auto it = std::filesystem::directory_iterator{roots_.sys_block, ec};
    if (ec) {
      return disks;
    }
    for (const auto& entry : it) {
      auto part_ec = std::error_code{};
      if (std::filesystem::exists(entry.path() / name / "partition", part_ec)) {
        parent = entry.path().filename().string();
        break;
      }
    }
    if (!parent) {
      return disks;
    }
    whole = roots_.sys_block / *parent;
  }

  auto slaves = whole / "slaves";
  auto has_slaves = false;
  if (std::filesystem::is_directory(slaves, ec)) {
    auto it = std::filesystem::directory_iterator{slaves, ec};
    if (!ec) {
      for (const auto& entry : it) {
        has_slaves = true;
        auto nested =
            backing_disks(entry.path().filename().string(), depth + 1);
        disks.insert(std::begin(nested), std::end(nested));
      }
    }
  }
  if (!has_slaves) {
    disks.insert(whole.filename().string());
  }
  return disks;
}

std::optional<std::set<std::string>> linux_host_provider::btrfs_devices(
    const std::string& name) const {
  auto ec = std::error_code{};
  auto filesystems = std::filesystem::directory_iterator{roots_.sys_fs_btrfs, ec};
  if (ec) {
    return std::nullopt;
  }
  for (const auto& filesystem : filesystems) {
    auto devices_dir = filesystem.path() / "devices";
    auto member_ec = std::error_code{};
    if (!std::filesystem::exists(devices_dir / name, member_ec)) {
      continue;
    }
    auto devices = std::set<std::string>{};
    auto it = std::filesystem::directory_iterator{devices_dir, member_ec};
    if (member_ec) {
      return std::nullopt;
    }
    for (const auto& device : it) {
      devices.insert(device.path().filename().string());
    }
    return devices;
  }
  return std::nullopt;
}

std::optional<std::set<std::string>> linux_host_provider::mount_disks(
    const mount_entry& mount,
    const std::vector<mount_entry>& mounts,
    const int depth) const {
  if (depth > kMaxStackDepth) {
    return std::nullopt;
  }
  auto device = resolve_source(mount.source);
  if (!device) {
    return std::nullopt;
  }
  // /proc/mounts names one member of a multi-device btrfs filesystem.
  auto members = std::set<std::string>{*device};
  if (mount.fs_type == "btrfs") {
    auto devices = btrfs_devices(*device);
    if (!devices) {
      return std::nullopt;
    }
    members = std::move(*devices);
  }

  auto disks = std::set<std::string>{};
  for (const auto& member : members) {
    for (const auto& disk : backing_disks(member)) {
      if (!is_virtual_disk(disk, roots_.sys_block / disk)) {
        disks.insert(disk);
        continue;
      }
      // A loop device is held by the filesystem its image file lives on.
      auto image = read_line(roots_.sys_block / disk / "loop" / "backing_file");
      if (!image) {
        return std::nullopt;
      }
      auto holder = containing_mount(*image, mounts);
      if (!holder) {
        return std::nullopt;
      }
      auto nested = mount_disks(*holder, mounts, depth + 1);
      if (!nested) {
        return std::nullopt;
      }
      disks.insert(std::begin(*nested), std::end(*nested));
    }
  }
  if (disks.empty()) {
    return std::nullopt;
  }
  return disks;
}

std::optional<bootforge::schema::device_graph_t>
linux_host_provider::device_graph(bootforge::schema::error_t& error) const {
  auto ec = std::error_code{};
  auto iterator = std::filesystem::directory_iterator{roots_.sys_block, ec};
  if (ec) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::enumeration_error,
        "cannot read " + roots_.sys_block.string() + ": " + ec.message());
    return std::nullopt;
  }

  auto mounts_text = read_text(roots_.mounts);
  auto mounts = mounts_text ? parse_mounts(*mounts_text)
                            : std::vector<mount_entry>{};
  auto mounts_by_device = std::map<std::string, std::vector<mount_entry>>{};
  for (const auto& mount : mounts) {
    if (auto device = resolve_source(mount.source)) {
      mounts_by_device[*device].push_back(mount);
    }
  }

  // Disks hosting the running OS. Every system mount must resolve and root
  // must be present; otherwise every disk is treated as a system disk.
  auto system_disks = std::set<std::string>{};
  auto root_seen = false;
  auto system_resolved = true;
  for (const auto& mount : mounts) {
    auto is_system_mount =
        std::find(std::begin(kSystemMounts), std::end(kSystemMounts),
                  mount.mount_point) != std::end(kSystemMounts);
    // An autofs trigger is listed beside the filesystem it mounts.
    if (!is_system_mount || mount.fs_type == "autofs") {
      continue;
    }
    root_seen = root_seen || mount.mount_point == "/";
    auto backing = mount_disks(mount, mounts);
    if (!backing) {
      spdlog::warn("{} source '{}' does not resolve to a physical disk",
                   mount.mount_point, mount.source);
      system_resolved = false;
      continue;
    }
    system_disks.insert(std::begin(*backing), std::end(*backing));
  }
  system_resolved = system_resolved && root_seen;

  auto labels = read_labels();
  auto disks = std::vector<bootforge::schema::disk_t>{};
  for (const auto& entry : iterator) {
    auto name = entry.path().filename().string();
    if (is_virtual_disk(name, entry.path())) {
      continue;
    }

    auto disk = bootforge::schema::disk_t{};
    disk.id = name;
    disk.size_bytes = sectors_to_bytes(read_u64(entry.path() / "size").value_or(0));
    disk.removable = read_u64(entry.path() / "removable").value_or(0) == 1;
    disk.friendly_name =
        read_line(entry.path() / "device" / "model").value_or(name);
    disk.is_system_disk = !system_resolved || system_disks.contains(name);

    auto part_ec = std::error_code{};
    auto children = std::filesystem::directory_iterator{entry.path(), part_ec};
    if (part_ec) {
      error = bootforge::schema::make_error(
          bootforge::schema::error_code_t::enumeration_error,
          "cannot read " + entry.path().string() + ": " + part_ec.message());
      return std::nullopt;
    }
    auto numbered = std::vector<std::pair<uint64_t, bootforge::schema::partition_t>>{};
    for (const auto& child : children) {
      auto number = read_u64(child.path() / "partition");
      if (!number) {
        continue;
      }
      auto partition = bootforge::schema::partition_t{};
      partition.id = child.path().filename().string();
      partition.size_bytes =
          sectors_to_bytes(read_u64(child.path() / "size").value_or(0));
      if (auto label = labels.find(partition.id); label != std::end(labels)) {
        partition.label = label->second;
      }
      if (auto found = mounts_by_device.find(partition.id);
          found != std::end(mounts_by_device)) {
        for (const auto& mount : found->second) {
          partition.mount_points.insert(mount.mount_point);
        }
        partition.fs = found->second.front().fs_type;
      }
      numbered.emplace_back(*number, std::move(partition));
    }
    std::sort(std::begin(numbered), std::end(numbered),
              [](const auto& lhs, const auto& rhs) {
                return lhs.first < rhs.first;
              });
    for (auto& [number, partition] : numbered) {
      disk.partitions.push_back(std::move(partition));
    }
    disks.push_back(std::move(disk));
  }
  std::sort(std::begin(disks), std::end(disks),
            [](const auto& lhs, const auto& rhs) { return lhs.id < rhs.id; });

  spdlog::debug("enumerated {} disk(s); system disks resolved: {}",
                disks.size(), system_resolved);
  return bootforge::schema::make_device_graph(read_host_info(),
                                              std::move(disks));
}

std::optional<std::filesystem::path> linux_host_provider::device_path(
    const bootforge::schema::disk_id_t& disk_id) const {
  if (disk_id.empty() || disk_id.find('/') != std::string::npos ||
      disk_id == "." || disk_id == "..") {
    return std::nullopt;
  }
  auto ec = std::error_code{};
  if (!std::filesystem::is_directory(roots_.sys_block / disk_id, ec)) {
    return std::nullopt;
  }
  return roots_.dev / disk_id;
}

}  // namespace bootforge::host
