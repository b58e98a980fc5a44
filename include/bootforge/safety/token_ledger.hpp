#pragma once
#include <bootforge/schema/encoding/json/encoder.hpp>
#include <bootforge/schema/token_record.hpp>
#include <bootforge/storage/rocksdb/storage.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace bootforge::safety {

/// Record of minted confirmation tokens, keyed by token digest.
class token_ledger {
 public:
  virtual ~token_ledger() = default;

  virtual void record(const bootforge::schema::token_record_t& record) = 0;

  virtual std::optional<bootforge::schema::token_record_t> find(
      const std::string& token_digest) const = 0;

  /// Mark the token consumed. Returns false when it is unknown or was already
  /// consumed; check and update happen under one lock.
  virtual bool consume(const std::string& token_digest,
                       const bootforge::schema::timestamp_utc_t& at) = 0;
};

/// Tokens valid for the lifetime of the process.
class memory_token_ledger final : public token_ledger {
 public:
  void record(const bootforge::schema::token_record_t& record) override;
  std::optional<bootforge::schema::token_record_t> find(
      const std::string& token_digest) const override;
  bool consume(const std::string& token_digest,
               const bootforge::schema::timestamp_utc_t& at) override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, bootforge::schema::token_record_t> records_;
};

/// Tokens persisted in RocksDB so one invocation can mint and a later one
/// consume.
class rocksdb_token_ledger final : public token_ledger {
 public:
  explicit rocksdb_token_ledger(std::string_view path);

  void record(const bootforge::schema::token_record_t& record) override;
  std::optional<bootforge::schema::token_record_t> find(
      const std::string& token_digest) const override;
  bool consume(const std::string& token_digest,
               const bootforge::schema::timestamp_utc_t& at) override;

 private:
  std::optional<bootforge::schema::token_record_t> find_locked(
      const std::string& token_digest) const;

  mutable std::mutex mutex_;
  mutable bootforge::schema::encoding::encoder<
      bootforge::schema::encoding::json_encoder_tag>
      encoder_;
  mutable bootforge::storage::storage<bootforge::storage::rocksdb_storage_tag>
      storage_;
};

/// Hex SHA-256 of a token string, the ledger key.
std::string token_digest(std::string_view token);

/// Mint a fresh token bound to (disk_id, operation) and record it.
///
/// Tokens read `BF-` followed by 32 lowercase hex characters.
std::string mint_token(token_ledger& ledger,
                       const bootforge::schema::disk_id_t& disk_id,
                       std::string_view operation);

}  // namespace bootforge::safety
