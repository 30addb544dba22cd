#include <agentid/crypto/base64.hpp>
#include <agentid/crypto/openssl.hpp>
#include <agentid/crypto/verify.hpp>

#include <algorithm>

namespace agentid::crypto {

namespace {

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

bool verify_ed25519(const agentid::schema::bytes_view_t& message,
                    const agentid::schema::ed25519_public_key_t& public_key,
                    const agentid::schema::ed25519_signature_t& signature) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

bool verify_ed25519(const agentid::schema::bytes_view_t& message,
                    std::string_view public_key_base64,
                    std::string_view signature_base64) {
  auto key_bytes = try_decode_base64(public_key_base64);
  auto signature_bytes = try_decode_base64(signature_base64);
  if (!key_bytes || !signature_bytes) {
    return false;
  }
  auto public_key = agentid::schema::ed25519_public_key_t{};
  auto signature = agentid::schema::ed25519_signature_t{};
  if (key_bytes->size() != public_key.size() ||
      signature_bytes->size() != signature.size()) {
    return false;
  }
  std::ranges::copy(*key_bytes, std::begin(public_key));
  std::ranges::copy(*signature_bytes, std::begin(signature));
  return verify_ed25519(message, public_key, signature);
}

}  // namespace agentid::crypto
