#pragma once
#include <bootforge/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace bootforge::storage {

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const bootforge::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const bootforge::schema::bytes_view_t& key,
           const T& value);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace bootforge::storage
