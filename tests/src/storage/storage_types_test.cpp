#include <bootforge/schema/encoding/json/encoder.hpp>
#include <bootforge/schema/token_record.hpp>
#include <bootforge/storage/rocksdb/storage.hpp>
#include <bootforge/storage/storage.hpp>
#include <bootforge/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using encoder_t =
    bootforge::schema::encoding::encoder<bootforge::schema::encoding::json_encoder_tag>;

bootforge::schema::token_record_t make_record(const std::string& digest) {
  return bootforge::schema::token_record_t{.token_digest = digest,
                                           .disk_id = "sdb",
                                           .operation = "apply-image",
                                           .minted_at_utc = "2026-01-01T00:00:00.000Z"};
}

}  // namespace

TEST(storage_types, record_round_trips) {
  auto db = bootforge::testing::make_temp_path("bootforge_storage_round_trip");
  {
    auto storage =
        bootforge::storage::make_storage<bootforge::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = std::string{"token/abc"};
    storage.put(encoder, bootforge::schema::make_bytes_view(key), make_record("abc"));

    auto loaded = storage.get<encoder_t, bootforge::schema::token_record_t>(
        encoder, bootforge::schema::make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->token_digest, "abc");
    EXPECT_EQ(loaded->disk_id, "sdb");
    EXPECT_FALSE(loaded->consumed);
    EXPECT_FALSE(loaded->consumed_at_utc.has_value());

    auto missing = std::string{"token/none"};
    EXPECT_FALSE((storage.get<encoder_t, bootforge::schema::token_record_t>(
                      encoder, bootforge::schema::make_bytes_view(missing)))
                     .has_value());
  }
  bootforge::testing::remove_path(db);
}
