#include <bootforge/host/static_provider.hpp>
#include <bootforge/schema/encoding/document.hpp>
#include <bootforge/schema/schema_version.hpp>

#include <utility>

namespace bootforge::host {

std::optional<bootforge::schema::device_graph_t> read_device_graph(
    const std::filesystem::path& path,
    bootforge::schema::error_t& error) {
  auto graph = bootforge::schema::encoding::read_typed_document<
      bootforge::schema::device_graph_t>(path, error);
  if (!graph) {
    return std::nullopt;
  }
  if (!bootforge::schema::check_schema_version(
          "device graph", bootforge::schema::kDeviceGraphSchemaVersion,
          graph->schema_version, error)) {
    return std::nullopt;
  }
  if (!bootforge::schema::validate_device_graph(*graph, error)) {
    return std::nullopt;
  }
  return graph;
}

static_host_provider::static_host_provider(
    bootforge::schema::device_graph_t graph,
    device_path_map_t device_paths)
    : graph_{std::move(graph)}, device_paths_{std::move(device_paths)} {}

static_host_provider::static_host_provider(std::filesystem::path document,
                                           device_path_map_t device_paths)
    : document_{std::move(document)}, device_paths_{std::move(device_paths)} {}

std::optional<bootforge::schema::device_graph_t>
static_host_provider::device_graph(bootforge::schema::error_t& error) const {
  auto snapshot = std::optional<bootforge::schema::device_graph_t>{};
  {
    auto guard = std::lock_guard<std::mutex>{mutex_};
    if (graph_) {
      snapshot = graph_;
    }
  }
  if (!snapshot && document_) {
    auto read_error = bootforge::schema::error_t{};
    snapshot = read_device_graph(*document_, read_error);
    if (!snapshot) {
      error = bootforge::schema::make_error(
          bootforge::schema::error_code_t::enumeration_error,
          "device graph document " + document_->string() + ": " +
              read_error.message);
      return std::nullopt;
    }
  }
  if (!snapshot) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::enumeration_error,
        "static provider has no device graph");
    return std::nullopt;
  }
  return bootforge::schema::make_device_graph(std::move(snapshot->host),
                                              std::move(snapshot->disks));
}

std::optional<std::filesystem::path> static_host_provider::device_path(
    const bootforge::schema::disk_id_t& disk_id) const {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  auto it = device_paths_.find(disk_id);
  if (it == std::end(device_paths_)) {
    return std::nullopt;
  }
  return it->second;
}

void static_host_provider::set_graph(bootforge::schema::device_graph_t graph) {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  graph_ = std::move(graph);
}

}  // namespace bootforge::host
