#pragma once
#include <agentid/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace agentid::schema::key {

/// Byte-wise key assembly. Integers are written big-endian so that RocksDB's
/// lexicographic order matches numeric order inside a prefix.
struct builder final {
  agentid::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& separator();
  // Length-prefixed id, so a '|' inside the id cannot shift the segment
  // boundaries of a composite key.
  builder& segment(const std::string_view& id);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace agentid::schema::key
