#pragma once
#include <cstdint>

namespace bootforge::schema {

template <uint16_t Version>
struct chunk_plan;

template <>
struct chunk_plan<1> final {
  uint64_t chunk_size_bytes{};
  uint64_t total_size_bytes{};
  uint64_t chunk_count{};
};

using chunk_plan_t = chunk_plan<1>;

}  // namespace bootforge::schema
