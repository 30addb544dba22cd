#pragma once
#include <agentid/common/critical.hpp>
#include <agentid/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>
#include <stdexcept>

namespace agentid::schema::encoding {

struct scale_encoder_tag {};

/// Raised when stored bytes do not decode as the requested type.
struct decoding_error final : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  agentid::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, agentid::schema::bytes_t& out);

  template <typename T>
  T decode(const agentid::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const agentid::schema::bytes_view_t& bytes);
};

template <typename T>
agentid::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    agentid::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        agentid::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const agentid::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    throw decoding_error{"failed to decode SCALE bytes"};
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const agentid::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace agentid::schema::encoding
