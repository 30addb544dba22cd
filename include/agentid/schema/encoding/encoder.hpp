#pragma once
#include <agentid/schema/primitives.hpp>
#include <optional>
#include <span>

namespace agentid::schema::encoding {

// Callers name a codec tag; its specialisation pulls in the library.
template <typename Library>
struct encoder {
  template <typename T>
  agentid::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, agentid::schema::bytes_t& out);

  template <typename T>
  T decode(const agentid::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const agentid::schema::bytes_view_t& bytes);
};

}  // namespace agentid::schema::encoding
