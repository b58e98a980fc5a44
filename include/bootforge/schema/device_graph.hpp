#pragma once
#include <bootforge/schema/disk.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/host_info.hpp>
#include <bootforge/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bootforge::schema {

inline constexpr auto kDeviceGraphSchemaVersion = std::string_view{"1.1.0"};

/// Point-in-time snapshot of the host's disks.
///
/// Snapshots are regenerated on every provider query; callers copy rather
/// than patch them.
template <uint16_t Version>
struct device_graph;

template <>
struct device_graph<1> final {
  std::string schema_version{kDeviceGraphSchemaVersion};
  std::string graph_id;
  timestamp_utc_t generated_at_utc;
  host_info_t host;
  std::vector<disk_t> disks;
};

using device_graph_t = device_graph<1>;

/// Build a snapshot stamped with a fresh graph id and the current time.
device_graph_t make_device_graph(host_info_t host, std::vector<disk_t> disks);

const disk_t* find_disk(const device_graph_t& graph, std::string_view disk_id);

/// Resolve the disk owning the partition mounted at `mount_point`.
///
/// Trailing separators are ignored; the match is exact otherwise.
const disk_t* find_disk_by_mount(const device_graph_t& graph,
                                 std::string_view mount_point);

/// Check structural invariants: unique disk ids, a UUID graph id and
/// partition sizes that fit their disk.
bool validate_device_graph(const device_graph_t& graph, error_t& error);

}  // namespace bootforge::schema
