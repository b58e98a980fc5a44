#pragma once
#include <cstdint>
#include <string>

namespace bootforge::schema {

template <uint16_t Version>
struct host_info;

template <>
struct host_info<1> final {
  std::string os;  // "linux", "windows", "macos"
  std::string os_version;
  std::string machine;
};

using host_info_t = host_info<1>;

}  // namespace bootforge::schema
