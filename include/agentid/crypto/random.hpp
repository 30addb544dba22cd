#pragma once

#include <agentid/schema/primitives.hpp>
#include <cstddef>
#include <string>

namespace agentid::crypto {

/// CSPRNG bytes; throws std::runtime_error when the generator is unseeded.
agentid::schema::bytes_t random_bytes(std::size_t count);

/// Random RFC 4122 version 4 UUID in canonical lower-case form.
std::string make_uuid();

}  // namespace agentid::crypto
