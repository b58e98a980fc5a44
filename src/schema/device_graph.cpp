#include <bootforge/schema/device_graph.hpp>

#include <algorithm>
#include <limits>
#include <set>

namespace bootforge::schema {

namespace {

std::string_view trim_trailing_separators(std::string_view path) {
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  return path;
}

}  // namespace

bool has_mount_point(const disk_t& disk, const std::string_view mount_point) {
  const auto wanted = trim_trailing_separators(mount_point);
  return std::any_of(
      std::begin(disk.partitions), std::end(disk.partitions),
      [&](const partition_t& partition) {
        return std::any_of(std::begin(partition.mount_points),
                           std::end(partition.mount_points),
                           [&](const std::string& mount) {
                             return trim_trailing_separators(mount) == wanted;
                           });
      });
}

uint64_t partitioned_bytes(const disk_t& disk) {
  auto total = uint64_t{0};
  for (const auto& partition : disk.partitions) {
    if (partition.size_bytes > std::numeric_limits<uint64_t>::max() - total) {
      return std::numeric_limits<uint64_t>::max();
    }
    total += partition.size_bytes;
  }
  return total;
}

device_graph_t make_device_graph(host_info_t host, std::vector<disk_t> disks) {
  return device_graph_t{.schema_version = std::string{kDeviceGraphSchemaVersion},
                        .graph_id = make_uuid(),
                        .generated_at_utc = now_utc_rfc3339(),
                        .host = std::move(host),
                        .disks = std::move(disks)};
}

const disk_t* find_disk(const device_graph_t& graph,
                        const std::string_view disk_id) {
  auto it = std::find_if(
      std::begin(graph.disks), std::end(graph.disks),
      [&](const disk_t& disk) { return disk.id == disk_id; });
  return it == std::end(graph.disks) ? nullptr : &*it;
}

const disk_t* find_disk_by_mount(const device_graph_t& graph,
                                 const std::string_view mount_point) {
  auto it = std::find_if(std::begin(graph.disks), std::end(graph.disks),
                         [&](const disk_t& disk) {
                           return has_mount_point(disk, mount_point);
                         });
  return it == std::end(graph.disks) ? nullptr : &*it;
}

bool validate_device_graph(const device_graph_t& graph, error_t& error) {
  if (!is_uuid(graph.graph_id)) {
    error = make_error(error_code_t::invalid_document,
                       "graph_id is not a UUID: '" + graph.graph_id + "'");
    return false;
  }

  auto seen = std::set<std::string>{};
  for (const auto& disk : graph.disks) {
    if (disk.id.empty()) {
      error = make_error(error_code_t::invalid_document, "disk with empty id");
      return false;
    }
    if (!seen.insert(disk.id).second) {
      error = make_error(error_code_t::invalid_document,
                         "duplicate disk id '" + disk.id + "'");
      return false;
    }
    if (partitioned_bytes(disk) > disk.size_bytes) {
      error = make_error(error_code_t::invalid_document,
                         "partitions of '" + disk.id +
                             "' exceed the disk size");
      return false;
    }
  }
  return true;
}

}  // namespace bootforge::schema
