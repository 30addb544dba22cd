#pragma once
#include <agentid/schema/enum_string.hpp>
#include <cstdint>
#include <string_view>

// Schema type: webhook delivery status.
namespace agentid::schema {

enum class delivery_status_t : uint8_t {
  pending = 0,
  delivered = 1,
  retrying = 2,
  failed = 3
};

inline constexpr auto kDeliveryStatusNames =
    std::array<std::pair<std::string_view, delivery_status_t>, 4>{{
        {"pending", delivery_status_t::pending},
        {"delivered", delivery_status_t::delivered},
        {"retrying", delivery_status_t::retrying},
        {"failed", delivery_status_t::failed},
    }};

inline std::string_view to_string(const delivery_status_t value) {
  return to_string(value, kDeliveryStatusNames).value_or("unknown");
}

}  // namespace agentid::schema
