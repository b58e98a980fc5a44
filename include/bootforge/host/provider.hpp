#pragma once
#include <bootforge/schema/device_graph.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace bootforge::host {

/// Read-only source of device graphs for one platform.
///
/// Every call to `device_graph` enumerates again and returns a snapshot with
/// a new `graph_id`; nothing is cached between calls. Implementations never
/// write to any device. `is_system_disk` is true unless the implementation
/// proved the disk does not host the running OS.
class host_provider {
 public:
  virtual ~host_provider() = default;

  /// Enumerate disks. Fails with `enumeration_error`.
  virtual std::optional<bootforge::schema::device_graph_t> device_graph(
      bootforge::schema::error_t& error) const = 0;

  /// Node to open for raw I/O on `disk_id`, or std::nullopt when unknown.
  virtual std::optional<std::filesystem::path> device_path(
      const bootforge::schema::disk_id_t& disk_id) const = 0;

  virtual std::string_view name() const = 0;
};

/// Provider for platforms without an implementation. Always fails.
class unsupported_host_provider final : public host_provider {
 public:
  std::optional<bootforge::schema::device_graph_t> device_graph(
      bootforge::schema::error_t& error) const override;
  std::optional<std::filesystem::path> device_path(
      const bootforge::schema::disk_id_t& disk_id) const override;
  std::string_view name() const override { return "unsupported"; }
};

/// Select the implementation for the platform this binary was built for.
std::unique_ptr<host_provider> make_host_provider();

}  // namespace bootforge::host
