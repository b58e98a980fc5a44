#pragma once
#include <bootforge/host/provider.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

namespace bootforge::host {

using device_path_map_t =
    std::map<bootforge::schema::disk_id_t, std::filesystem::path>;

/// Read a device graph document: decode, check the schema version and the
/// structural invariants.
std::optional<bootforge::schema::device_graph_t> read_device_graph(
    const std::filesystem::path& path,
    bootforge::schema::error_t& error);

/// Provider backed by a fixed description instead of the live host.
///
/// Serves either an in-memory graph or a graph document that is read again
/// on every query. Each snapshot gets a new `graph_id` and timestamp. Disk
/// ids map to arbitrary paths, typically regular files standing in for
/// disks.
class static_host_provider final : public host_provider {
 public:
  static_host_provider(bootforge::schema::device_graph_t graph,
                       device_path_map_t device_paths);
  static_host_provider(std::filesystem::path document,
                       device_path_map_t device_paths);

  std::optional<bootforge::schema::device_graph_t> device_graph(
      bootforge::schema::error_t& error) const override;
  std::optional<std::filesystem::path> device_path(
      const bootforge::schema::disk_id_t& disk_id) const override;
  std::string_view name() const override { return "static"; }

  /// Replace the in-memory graph served by later queries.
  void set_graph(bootforge::schema::device_graph_t graph);

 private:
  mutable std::mutex mutex_;
  std::optional<bootforge::schema::device_graph_t> graph_;
  std::optional<std::filesystem::path> document_;
  device_path_map_t device_paths_;
};

}  // namespace bootforge::host
