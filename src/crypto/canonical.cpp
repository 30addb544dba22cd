#include <agentid/crypto/canonical.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace agentid::crypto {

namespace {

constexpr auto kMaxSafeInteger = 9007199254740991.0;

void write_canonical(const agentid::schema::json_t& value, std::string& out) {
  using value_t = agentid::schema::json_t::value_t;
  switch (value.type()) {
    case value_t::object: {
      auto keys = std::vector<std::string>{};
      keys.reserve(value.size());
      for (auto it = value.begin(); it != value.end(); ++it) {
        keys.push_back(it.key());
      }
      std::ranges::sort(keys);
      out.push_back('{');
      auto first = true;
      for (const auto& key : keys) {
        if (!first) {
          out.push_back(',');
        }
        first = false;
        out.append(agentid::schema::json_t(key).dump());
        out.push_back(':');
        write_canonical(value.at(key), out);
      }
      out.push_back('}');
      break;
    }
    case value_t::array: {
      out.push_back('[');
      auto first = true;
      for (const auto& element : value) {
        if (!first) {
          out.push_back(',');
        }
        first = false;
        write_canonical(element, out);
      }
      out.push_back(']');
      break;
    }
    case value_t::number_float: {
      auto number = value.get<double>();
      if (std::isfinite(number) && std::trunc(number) == number &&
          std::fabs(number) <= kMaxSafeInteger) {
        out.append(std::to_string(static_cast<int64_t>(number)));
      } else {
        out.append(value.dump());
      }
      break;
    }
    default:
      out.append(value.dump());
      break;
  }
}

}  // namespace

std::string canonicalize(const agentid::schema::json_t& value) {
  auto out = std::string{};
  write_canonical(value, out);
  return out;
}

std::string canonical_signing_input(const agentid::schema::json_t& payload) {
  if (!payload.is_object() || !payload.contains("signature")) {
    return canonicalize(payload);
  }
  auto unsigned_payload = payload;
  unsigned_payload.erase("signature");
  return canonicalize(unsigned_payload);
}

}  // namespace agentid::crypto
