#include <agentid/crypto/digest.hpp>
#include <agentid/crypto/openssl.hpp>

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include <stdexcept>

namespace agentid::crypto {

sha256_digest_t sha256(const agentid::schema::bytes_view_t& input) {
  auto out = sha256_digest_t{};
  SHA256(input.data(), input.size(), out.data());
  return out;
}

sha256_digest_t hmac_sha256(const agentid::schema::bytes_view_t& key,
                            const agentid::schema::bytes_view_t& message) {
  auto out = sha256_digest_t{};
  auto length = static_cast<unsigned int>(out.size());
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           message.data(), message.size(), out.data(), &length) == nullptr) {
    throw std::runtime_error{"HMAC-SHA256 failed"};
  }
  return out;
}

std::string hmac_sha256_hex(std::string_view key, std::string_view message) {
  auto digest = hmac_sha256(agentid::schema::make_bytes_view(key),
                            agentid::schema::make_bytes_view(message));
  return agentid::schema::to_hex(
      agentid::schema::bytes_view_t{digest.data(), digest.size()});
}

bool constant_time_equals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace agentid::crypto
