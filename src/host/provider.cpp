#include <bootforge/host/provider.hpp>

#if defined(__linux__)
#include <bootforge/host/linux/provider.hpp>
#endif

namespace bootforge::host {

std::optional<bootforge::schema::device_graph_t>
unsupported_host_provider::device_graph(
    bootforge::schema::error_t& error) const {
  error = bootforge::schema::make_error(
      bootforge::schema::error_code_t::enumeration_error,
      "no host provider is available for this platform");
  return std::nullopt;
}

std::optional<std::filesystem::path> unsupported_host_provider::device_path(
    const bootforge::schema::disk_id_t& disk_id) const {
  static_cast<void>(disk_id);
  return std::nullopt;
}

std::unique_ptr<host_provider> make_host_provider() {
#if defined(__linux__)
  return std::make_unique<linux_host_provider>();
#else
  return std::make_unique<unsupported_host_provider>();
#endif
}

}  // namespace bootforge::host
