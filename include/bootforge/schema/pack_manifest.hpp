#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bootforge::schema {

inline constexpr auto kPackSchemaVersion = std::string_view{"1.0.0"};

template <uint16_t Version>
struct pack_manifest;

template <>
struct pack_manifest<1> final {
  std::string schema_version{kPackSchemaVersion};
  std::string name;
  std::string version;
  std::string description;
  // Relative to the manifest's directory.
  std::vector<std::string> workflows;
  std::optional<std::string> assets;
};

using pack_manifest_t = pack_manifest<1>;

}  // namespace bootforge::schema
