#pragma once
#include <bootforge/schema/primitives.hpp>
#include <optional>
#include <string>

namespace bootforge::schema {

/// Ledger entry for one minted confirmation token.
///
/// Only the SHA-256 of the token is kept; the token itself is handed to the
/// operator and never stored.
template <uint16_t Version>
struct token_record;

template <>
struct token_record<1> final {
  std::string token_digest;  // hex SHA-256 of the token string
  disk_id_t disk_id;
  std::string operation;
  timestamp_utc_t minted_at_utc;
  bool consumed{};
  std::optional<timestamp_utc_t> consumed_at_utc;
};

using token_record_t = token_record<1>;

}  // namespace bootforge::schema
