#pragma once
#include <bootforge/schema/partition.hpp>
#include <bootforge/schema/primitives.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace bootforge::schema {

template <uint16_t Version>
struct disk;

template <>
struct disk<1> final {
  disk_id_t id;
  std::string friendly_name;
  uint64_t size_bytes{};
  bool removable{};
  // Fail-safe default: only a provider that proved otherwise clears it.
  bool is_system_disk{true};
  std::vector<partition_t> partitions;
};

using disk_t = disk<1>;

/// True when any partition of `disk` lists `mount_point` verbatim.
bool has_mount_point(const disk_t& disk, std::string_view mount_point);

/// Sum of partition sizes, saturating at UINT64_MAX.
uint64_t partitioned_bytes(const disk_t& disk);

}  // namespace bootforge::schema
