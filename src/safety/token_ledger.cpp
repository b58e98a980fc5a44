#include <bootforge/crypto/hmac.hpp>
#include <bootforge/crypto/sha256.hpp>
#include <bootforge/safety/token_ledger.hpp>

#include <spdlog/spdlog.h>

namespace bootforge::safety {

namespace {

constexpr auto kTokenKeyPrefix = std::string_view{"TOKEN|"};
constexpr auto kTokenPrefix = std::string_view{"BF-"};
constexpr auto kTokenRandomBytes = std::size_t{16};

std::string make_token_key(const std::string& token_digest) {
  auto key = std::string{kTokenKeyPrefix};
  key.append(token_digest);
  return key;
}

}  // namespace

void memory_token_ledger::record(
    const bootforge::schema::token_record_t& record) {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  records_[record.token_digest] = record;
}

std::optional<bootforge::schema::token_record_t> memory_token_ledger::find(
    const std::string& token_digest) const {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  auto it = records_.find(token_digest);
  if (it == std::end(records_)) {
    return std::nullopt;
  }
  return it->second;
}

bool memory_token_ledger::consume(
    const std::string& token_digest,
    const bootforge::schema::timestamp_utc_t& at) {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  auto it = records_.find(token_digest);
  if (it == std::end(records_) || it->second.consumed) {
    return false;
  }
  it->second.consumed = true;
  it->second.consumed_at_utc = at;
  return true;
}

rocksdb_token_ledger::rocksdb_token_ledger(const std::string_view path)
    : storage_{bootforge::storage::make_storage<
          bootforge::storage::rocksdb_storage_tag>(path)} {}

void rocksdb_token_ledger::record(
    const bootforge::schema::token_record_t& record) {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  auto key = make_token_key(record.token_digest);
  storage_.put(encoder_, bootforge::schema::make_bytes_view(key), record);
}

std::optional<bootforge::schema::token_record_t> rocksdb_token_ledger::find(
    const std::string& token_digest) const {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  return find_locked(token_digest);
}

std::optional<bootforge::schema::token_record_t>
rocksdb_token_ledger::find_locked(const std::string& token_digest) const {
  auto key = make_token_key(token_digest);
  return storage_.get<decltype(encoder_), bootforge::schema::token_record_t>(
      encoder_, bootforge::schema::make_bytes_view(key));
}

bool rocksdb_token_ledger::consume(
    const std::string& token_digest,
    const bootforge::schema::timestamp_utc_t& at) {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  auto record = find_locked(token_digest);
  if (!record || record->consumed) {
    return false;
  }
  record->consumed = true;
  record->consumed_at_utc = at;
  auto key = make_token_key(token_digest);
  storage_.put(encoder_, bootforge::schema::make_bytes_view(key), *record);
  return true;
}

std::string token_digest(const std::string_view token) {
  return bootforge::schema::to_hex(bootforge::crypto::sha256(token));
}

std::string mint_token(token_ledger& ledger,
                       const bootforge::schema::disk_id_t& disk_id,
                       const std::string_view operation) {
  auto random = bootforge::crypto::random_bytes(kTokenRandomBytes);
  auto token = std::string{kTokenPrefix};
  token.append(bootforge::schema::to_hex(bootforge::schema::make_bytes_view(random)));

  ledger.record(bootforge::schema::token_record_t{
      .token_digest = token_digest(token),
      .disk_id = disk_id,
      .operation = std::string{operation},
      .minted_at_utc = bootforge::schema::now_utc_rfc3339()});
  spdlog::info("minted confirmation token for {} on disk '{}'", operation,
               disk_id);
  return token;
}

}  // namespace bootforge::safety
