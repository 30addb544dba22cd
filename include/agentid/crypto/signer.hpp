#pragma once

#include <agentid/schema/json.hpp>
#include <agentid/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace agentid::crypto {

inline constexpr auto kSigningKeyInfo =
    std::string_view{"agentid-signing-key-v1"};

/// Process-wide signing secret. Loaded once at start-up and never
/// reassigned; copies share nothing mutable.
class master_secret final {
 public:
  /// Empty secrets are rejected with std::invalid_argument.
  explicit master_secret(std::string value);

  /// Read the secret from an environment variable, if set and non-empty.
  static std::optional<master_secret> from_environment(
      std::string_view variable);

  agentid::schema::bytes_view_t bytes() const;

 private:
  std::string value_;
};

/// HKDF-SHA256(ikm = master secret, salt = issuer id, info =
/// "agentid-signing-key-v1"), 32 bytes: the issuer's Ed25519 seed.
agentid::schema::ed25519_seed_t derive_seed(const master_secret& secret,
                                            std::string_view issuer_id);

struct issuer_keys final {
  std::string public_key;  // base64 raw Ed25519 public key
  std::string key_id;      // "key_" + first 16 hex chars of SHA-256(pubkey)
};

/// Derives per-issuer Ed25519 keys on demand and signs canonical payloads.
/// No private key material outlives a call.
class signer final {
 public:
  explicit signer(master_secret secret);

  /// Deterministic: the same issuer id always yields the same keys.
  issuer_keys generate_keys(std::string_view issuer_id) const;

  agentid::schema::ed25519_signature_t sign(
      const agentid::schema::bytes_view_t& message,
      std::string_view issuer_id) const;

  /// Base64 Ed25519 signature over canonical_signing_input(payload).
  std::string sign_payload(const agentid::schema::json_t& payload,
                           std::string_view issuer_id) const;

 private:
  master_secret secret_;
};

std::string make_key_id(const agentid::schema::ed25519_public_key_t& key);

}  // namespace agentid::crypto
