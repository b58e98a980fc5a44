#pragma once
#include <bootforge/schema/primitives.hpp>
#include <optional>
#include <span>

namespace bootforge::schema::encoding {

// Documents are encoded through a tag-selected library. The library is a
// build time choice; nothing swaps it at runtime.
template <typename Library>
struct encoder {
  template <typename T>
  bootforge::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bootforge::schema::bytes_t& out);

  template <typename T>
  T decode(const bootforge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bootforge::schema::bytes_view_t& bytes);
};

}  // namespace bootforge::schema::encoding
