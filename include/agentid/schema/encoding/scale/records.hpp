#pragma once
#include <agentid/schema/audit_entry.hpp>
#include <agentid/schema/authorization_grant.hpp>
#include <agentid/schema/credential_record.hpp>
#include <agentid/schema/encoding/scale/encoder.hpp>
#include <agentid/schema/issuer_record.hpp>
#include <agentid/schema/policy_record.hpp>
#include <agentid/schema/policy_version_record.hpp>
#include <agentid/schema/reputation_record.hpp>
#include <agentid/schema/revocation_event.hpp>
#include <agentid/schema/trust_score_change.hpp>
#include <agentid/schema/verification_event.hpp>
#include <agentid/schema/webhook_delivery.hpp>
#include <agentid/schema/webhook_subscription.hpp>

// Persisted row layout. Each record travels as a SCALE tuple whose first
// element is the schema version; JSON members are stored as their dump.
namespace agentid::schema::encoding::scale {

bytes_t encode(const issuer_record<1>& o);
bytes_t encode(const credential_record<1>& o);
bytes_t encode(const policy_record<1>& o);
bytes_t encode(const policy_version_record<1>& o);
bytes_t encode(const reputation_record<1>& o);
bytes_t encode(const trust_score_change<1>& o);
bytes_t encode(const authorization_grant<1>& o);
bytes_t encode(const verification_event<1>& o);
bytes_t encode(const audit_entry<1>& o);
bytes_t encode(const revocation_event<1>& o);
bytes_t encode(const webhook_subscription<1>& o);
bytes_t encode(const webhook_delivery<1>& o);

/// Decode a stored row; std::nullopt when the bytes are not a valid row of
/// the requested type.
template <typename T>
std::optional<T> decode(const bytes_view_t& bytes);

template <>
std::optional<issuer_record<1>> decode<issuer_record<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<credential_record<1>> decode<credential_record<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<policy_record<1>> decode<policy_record<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<policy_version_record<1>> decode<policy_version_record<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<reputation_record<1>> decode<reputation_record<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<trust_score_change<1>> decode<trust_score_change<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<authorization_grant<1>> decode<authorization_grant<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<verification_event<1>> decode<verification_event<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<audit_entry<1>> decode<audit_entry<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<revocation_event<1>> decode<revocation_event<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<webhook_subscription<1>> decode<webhook_subscription<1>>(
    const bytes_view_t& bytes);
template <>
std::optional<webhook_delivery<1>> decode<webhook_delivery<1>>(
    const bytes_view_t& bytes);

}  // namespace agentid::schema::encoding::scale
