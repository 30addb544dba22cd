#include <agentid/crypto/base64.hpp>
#include <agentid/crypto/canonical.hpp>
#include <agentid/crypto/digest.hpp>
#include <agentid/crypto/openssl.hpp>
#include <agentid/crypto/signer.hpp>

#include <openssl/kdf.h>

#include <cstdlib>
#include <stdexcept>

namespace agentid::crypto {

namespace {

evp_pkey_ptr make_private_key(const agentid::schema::ed25519_seed_t& seed) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(),
                                   seed.size()),
      EVP_PKEY_free};
  if (!pkey) {
    throw std::runtime_error{"failed to load Ed25519 private key"};
  }
  return pkey;
}

}  // namespace

master_secret::master_secret(std::string value) : value_{std::move(value)} {
  if (value_.empty()) {
    throw std::invalid_argument{"master signing secret must not be empty"};
  }
}

std::optional<master_secret> master_secret::from_environment(
    std::string_view variable) {
  const auto* raw = std::getenv(std::string{variable}.c_str());
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return master_secret{std::string{raw}};
}

agentid::schema::bytes_view_t master_secret::bytes() const {
  return agentid::schema::make_bytes_view(value_);
}

agentid::schema::ed25519_seed_t derive_seed(const master_secret& secret,
                                            std::string_view issuer_id) {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1) {
    throw std::runtime_error{"failed to initialise HKDF"};
  }

  auto ikm = secret.bytes();
  auto salt = agentid::schema::make_bytes_view(issuer_id);
  auto info = agentid::schema::make_bytes_view(kSigningKeyInfo);
  // An empty salt is legal HKDF input but OpenSSL rejects a null pointer.
  static const auto kEmpty = uint8_t{0};
  if (EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) != 1 ||
      EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(),
                                  salt.empty() ? &kEmpty : salt.data(),
                                  static_cast<int>(salt.size())) != 1 ||
      EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(),
                                 static_cast<int>(ikm.size())) != 1 ||
      EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(),
                                  static_cast<int>(info.size())) != 1) {
    throw std::runtime_error{"failed to configure HKDF"};
  }

  auto seed = agentid::schema::ed25519_seed_t{};
  auto length = seed.size();
  if (EVP_PKEY_derive(ctx.get(), seed.data(), &length) != 1 ||
      length != seed.size()) {
    throw std::runtime_error{"HKDF derivation failed"};
  }
  return seed;
}

std::string make_key_id(const agentid::schema::ed25519_public_key_t& key) {
  auto digest = sha256(agentid::schema::bytes_view_t{key.data(), key.size()});
  auto hex = agentid::schema::to_hex(
      agentid::schema::bytes_view_t{digest.data(), digest.size()});
  return "key_" + hex.substr(0, 16);
}

signer::signer(master_secret secret) : secret_{std::move(secret)} {}

issuer_keys signer::generate_keys(std::string_view issuer_id) const {
  auto pkey = make_private_key(derive_seed(secret_, issuer_id));
  auto public_key = agentid::schema::ed25519_public_key_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &length) !=
          1 ||
      length != public_key.size()) {
    throw std::runtime_error{"failed to extract Ed25519 public key"};
  }
  return issuer_keys{
      .public_key = encode_base64(
          agentid::schema::bytes_view_t{public_key.data(), public_key.size()}),
      .key_id = make_key_id(public_key)};
}

agentid::schema::ed25519_signature_t signer::sign(
    const agentid::schema::bytes_view_t& message,
    std::string_view issuer_id) const {
  auto pkey = make_private_key(derive_seed(secret_, issuer_id));
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1) {
    throw std::runtime_error{"failed to initialise Ed25519 signing"};
  }
  auto signature = agentid::schema::ed25519_signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    throw std::runtime_error{"Ed25519 signing failed"};
  }
  return signature;
}

std::string signer::sign_payload(const agentid::schema::json_t& payload,
                                 std::string_view issuer_id) const {
  auto message = canonical_signing_input(payload);
  auto signature =
      sign(agentid::schema::make_bytes_view(message), issuer_id);
  return encode_base64(
      agentid::schema::bytes_view_t{signature.data(), signature.size()});
}

}  // namespace agentid::crypto
