#pragma once
#include <bootforge/schema/primitives.hpp>

namespace bootforge::crypto {

/// HMAC-SHA256 of `message` under `key`.
bootforge::schema::hash32_t hmac_sha256(
    const bootforge::schema::bytes_view_t& key,
    const bootforge::schema::bytes_view_t& message);

/// Compare two byte ranges without an early exit on the first difference.
///
/// Ranges of different length compare unequal; only the length leaks.
bool constant_time_equal(const bootforge::schema::bytes_view_t& lhs,
                         const bootforge::schema::bytes_view_t& rhs);

/// Fill `count` bytes from the OpenSSL CSPRNG.
bootforge::schema::bytes_t random_bytes(std::size_t count);

}  // namespace bootforge::crypto
