#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_seed_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;

inline constexpr auto kMillisecondsPerSecond = uint64_t{1000};
inline constexpr auto kMillisecondsPerMinute = uint64_t{60} * 1000;
inline constexpr auto kMillisecondsPerHour = uint64_t{60} * 60 * 1000;
inline constexpr auto kMillisecondsPerDay = uint64_t{24} * 60 * 60 * 1000;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);

}  // namespace agentid::schema
