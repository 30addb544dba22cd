#pragma once

#include <agentid/schema/primitives.hpp>
#include <string_view>

namespace agentid::crypto {

/// True when the linked OpenSSL exposes Ed25519.
bool available();

bool verify_ed25519(const agentid::schema::bytes_view_t& message,
                    const agentid::schema::ed25519_public_key_t& public_key,
                    const agentid::schema::ed25519_signature_t& signature);

/// Verify with base64 key and signature as stored on issuers and
/// credentials. Malformed base64 or wrong lengths fail closed.
bool verify_ed25519(const agentid::schema::bytes_view_t& message,
                    std::string_view public_key_base64,
                    std::string_view signature_base64);

}  // namespace agentid::crypto
