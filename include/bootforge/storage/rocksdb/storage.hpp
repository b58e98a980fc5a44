#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <bootforge/common/critical.hpp>
#include <bootforge/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace bootforge::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const bootforge::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const bootforge::schema::bytes_view_t& key);

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const bootforge::schema::bytes_view_t& key,
           const T& value);
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const bootforge::schema::bytes_view_t& key) {
  if (!database) {
    bootforge::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    bootforge::common::critical("failed to get value from RocksDB: {}",
                                status.ToString());
  }
  auto decoded = encoder.template try_decode<T>(
      bootforge::schema::make_bytes_view(value));
  if (!decoded) {
    spdlog::error("undecodable RocksDB value at key '{}'",
                  bootforge::schema::make_string(key));
  }
  return decoded;
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const bootforge::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    bootforge::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status =
      database->Put(write_options, detail::to_slice(key),
                    detail::to_slice(bootforge::schema::make_bytes_view(
                        encoded_value)));
  if (!status.ok()) {
    bootforge::common::critical("failed to put value into RocksDB: {}",
                                status.ToString());
  }
}

}  // namespace bootforge::storage
