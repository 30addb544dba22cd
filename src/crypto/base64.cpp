#include <agentid/crypto/base64.hpp>

#include <openssl/evp.h>

#include <algorithm>

namespace agentid::crypto {

namespace {

bool is_base64_char(const char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

}  // namespace

std::string encode_base64(const agentid::schema::bytes_view_t& input) {
  auto out = std::string(((input.size() + 2) / 3) * 4, '\0');
  if (input.empty()) {
    return out;
  }
  auto written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                      input.data(), static_cast<int>(input.size()));
  out.resize(static_cast<size_t>(std::max(written, 0)));
  return out;
}

std::optional<agentid::schema::bytes_t> try_decode_base64(
    std::string_view input) {
  if ((input.size() % 4) != 0) {
    return std::nullopt;
  }
  if (input.empty()) {
    return agentid::schema::bytes_t{};
  }

  auto padding = size_t{0};
  if (input.back() == '=') {
    ++padding;
    if (input[input.size() - 2] == '=') {
      ++padding;
    }
  }
  auto body = input.substr(0, input.size() - padding);
  if (!std::ranges::all_of(body, is_base64_char)) {
    return std::nullopt;
  }

  auto out = agentid::schema::bytes_t((input.size() / 4) * 3);
  auto written = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(input.data()),
      static_cast<int>(input.size()));
  if (written < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts padding bytes as output.
  out.resize(static_cast<size_t>(written) - padding);
  return out;
}

}  // namespace agentid::crypto
