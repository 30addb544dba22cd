#pragma once

#include <agentid/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace agentid::crypto {

/// Standard (RFC 4648, padded) base64.
std::string encode_base64(const agentid::schema::bytes_view_t& input);

/// Strict decode: padded input only, no whitespace, no URL alphabet.
std::optional<agentid::schema::bytes_t> try_decode_base64(
    std::string_view input);

}  // namespace agentid::crypto
