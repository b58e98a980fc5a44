#pragma once
#include <bootforge/schema/primitives.hpp>
#include <optional>
#include <set>
#include <string>

namespace bootforge::schema {

template <uint16_t Version>
struct partition;

template <>
struct partition<1> final {
  partition_id_t id;
  std::optional<std::string> label;
  std::optional<std::string> fs;
  uint64_t size_bytes{};
  std::set<std::string> mount_points;
};

using partition_t = partition<1>;

}  // namespace bootforge::schema
