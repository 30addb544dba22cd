#pragma once

#include <agentid/schema/json.hpp>
#include <string>

namespace agentid::crypto {

/// Deterministic JSON text: object keys sorted byte-wise at every level,
/// arrays kept in order, no insignificant whitespace. Integral floating
/// point values print as integers so that 5.0 and 5 canonicalize alike.
std::string canonicalize(const agentid::schema::json_t& value);

/// Canonical signing input for a credential payload: the payload with any
/// top-level "signature" member removed, then canonicalized.
std::string canonical_signing_input(const agentid::schema::json_t& payload);

}  // namespace agentid::crypto
