#include <agentid/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>
#include <ranges>

using namespace agentid::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::separator() {
  data.push_back(static_cast<uint8_t>('|'));
  return *this;
}

builder& builder::segment(const std::string_view& id) {
  write(static_cast<uint32_t>(id.size()));
  return write(id);
}
