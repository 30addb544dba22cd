#include <agentid/crypto/random.hpp>

#include <openssl/rand.h>

#include <stdexcept>

namespace agentid::crypto {

agentid::schema::bytes_t random_bytes(std::size_t count) {
  auto out = agentid::schema::bytes_t(count);
  if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    throw std::runtime_error{"RAND_bytes failed"};
  }
  return out;
}

std::string make_uuid() {
  auto bytes = random_bytes(16);
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0Fu) | 0x40u);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3Fu) | 0x80u);
  auto hex = agentid::schema::to_hex(agentid::schema::make_bytes_view(bytes));
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}  // namespace agentid::crypto
