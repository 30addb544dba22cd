#pragma once

#include <agentid/schema/primitives.hpp>
#include <array>
#include <string>
#include <string_view>

namespace agentid::crypto {

using sha256_digest_t = std::array<uint8_t, 32>;

sha256_digest_t sha256(const agentid::schema::bytes_view_t& input);

sha256_digest_t hmac_sha256(const agentid::schema::bytes_view_t& key,
                            const agentid::schema::bytes_view_t& message);

/// Lower-case hex HMAC-SHA256, the form carried in webhook signature headers.
std::string hmac_sha256_hex(std::string_view key, std::string_view message);

/// Constant-time comparison for signature strings.
bool constant_time_equals(std::string_view lhs, std::string_view rhs);

}  // namespace agentid::crypto
