#include <agentid/schema/encoding/scale/records.hpp>

#include <tuple>

namespace agentid::schema::encoding::scale {

namespace {

using issuer_row_t = std::tuple<uint16_t,
                                std::string,
                                std::string,
                                uint8_t,
                                bool,
                                std::string,
                                std::string,
                                uint64_t>;

using credential_row_t = std::tuple<uint16_t,
                                    std::string,
                                    std::string,
                                    std::string,
                                    std::string,
                                    std::string,
                                    std::string,
                                    std::optional<std::string>,
                                    uint64_t,
                                    uint64_t,
                                    std::vector<std::string>,
                                    std::vector<std::string>,
                                    uint8_t,
                                    std::string,
                                    std::string,
                                    std::string,
                                    std::string,
                                    uint64_t,
                                    uint64_t,
                                    std::optional<uint64_t>,
                                    std::optional<std::string>>;

using policy_row_t = std::tuple<uint16_t,
                                std::string,
                                std::string,
                                std::string,
                                std::string,
                                std::string,
                                uint32_t,
                                bool,
                                uint64_t,
                                uint64_t>;

using policy_version_row_t = std::tuple<uint16_t,
                                        std::string,
                                        uint32_t,
                                        std::string,
                                        uint8_t,
                                        std::string,
                                        uint64_t>;

using reputation_row_t = std::tuple<uint16_t,
                                    std::string,
                                    std::string,
                                    std::string,
                                    uint32_t,
                                    uint32_t,
                                    uint32_t,
                                    uint32_t,
                                    uint64_t,
                                    uint64_t,
                                    uint64_t,
                                    std::optional<uint64_t>,
                                    uint64_t>;

using trust_change_row_t = std::tuple<uint16_t,
                                      uint64_t,
                                      std::string,
                                      uint32_t,
                                      uint32_t,
                                      uint32_t,
                                      uint32_t,
                                      uint32_t,
                                      std::string,
                                      int32_t,
                                      uint64_t>;

using grant_row_t = std::tuple<uint16_t,
                               std::string,
                               std::string,
                               std::string,
                               std::string,
                               std::string,
                               uint8_t,
                               std::optional<uint64_t>,
                               std::string,
                               uint64_t,
                               uint64_t,
                               std::optional<uint64_t>>;

using verification_row_t = std::tuple<uint16_t,
                                      uint64_t,
                                      std::string,
                                      std::optional<std::string>,
                                      std::optional<std::string>,
                                      std::optional<std::string>,
                                      bool,
                                      uint32_t,
                                      std::string,
                                      uint64_t,
                                      uint64_t>;

using audit_row_t = std::tuple<uint16_t,
                               uint64_t,
                               std::string,
                               std::string,
                               std::string,
                               std::string,
                               std::string,
                               uint64_t>;

using revocation_row_t = std::tuple<uint16_t,
                                    uint64_t,
                                    std::string,
                                    std::string,
                                    std::string,
                                    std::string,
                                    std::string,
                                    uint64_t>;

using subscription_row_t = std::tuple<uint16_t,
                                      std::string,
                                      std::string,
                                      std::string,
                                      std::string,
                                      std::vector<std::string>,
                                      bool,
                                      uint32_t,
                                      std::optional<uint64_t>,
                                      std::optional<uint64_t>,
                                      uint64_t>;

using delivery_row_t = std::tuple<uint16_t,
                                  std::string,
                                  std::string,
                                  std::string,
                                  std::string,
                                  uint8_t,
                                  uint32_t,
                                  std::optional<uint32_t>,
                                  std::optional<uint64_t>,
                                  std::string,
                                  uint64_t,
                                  uint64_t>;

std::optional<json_t> parse_json(const std::string& text) {
  auto parsed = json_t::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

template <typename Row>
std::optional<Row> decode_row(const bytes_view_t& bytes, uint16_t version) {
  auto encoder = scale_encoder_t{};
  auto row = encoder.try_decode<Row>(bytes);
  if (!row || std::get<0>(*row) != version) {
    return std::nullopt;
  }
  return row;
}

}  // namespace

bytes_t encode(const issuer_record<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(issuer_row_t{
      o.version, o.issuer_id, o.name, static_cast<uint8_t>(o.issuer_type),
      o.verified, o.public_key, o.key_id, o.created_at});
}

bytes_t encode(const credential_record<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(credential_row_t{
      o.version, o.credential_id, o.issuer_id, o.agent_id, o.agent_name,
      o.agent_type, o.permissions.dump(), o.policy_id, o.valid_from,
      o.valid_until, o.geographic_restrictions, o.allowed_services,
      static_cast<uint8_t>(o.status), o.signature, o.key_id,
      o.credential_payload, o.metadata.dump(), o.created_at, o.updated_at,
      o.revoked_at, o.revocation_reason});
}

bytes_t encode(const policy_record<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(policy_row_t{
      o.version, o.policy_id, o.issuer_id, o.name, o.description,
      o.permissions.dump(), o.policy_version, o.is_active, o.created_at,
      o.updated_at});
}

bytes_t encode(const policy_version_record<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(policy_version_row_t{
      o.version, o.policy_id, o.policy_version, o.permissions.dump(),
      static_cast<uint8_t>(o.change_type), o.change_reason, o.created_at});
}

bytes_t encode(const reputation_record<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(reputation_row_t{
      o.version, o.credential_id, o.agent_id, o.issuer_id, o.trust_score,
      o.verification_score, o.longevity_score, o.activity_score,
      o.total_verifications, o.successful_verifications,
      o.failed_verifications, o.last_verification_at, o.updated_at});
}

bytes_t encode(const trust_score_change<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(trust_change_row_t{
      o.version, o.change_id, o.credential_id, o.trust_score,
      o.verification_score, o.longevity_score, o.activity_score,
      o.issuer_score, o.change_reason, o.change_delta, o.recorded_at});
}

bytes_t encode(const authorization_grant<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(grant_row_t{
      o.version, o.grant_id, o.requester_credential_id,
      o.grantor_credential_id, o.permissions.dump(), o.constraints.dump(),
      static_cast<uint8_t>(o.status), o.valid_until, o.message, o.created_at,
      o.updated_at, o.responded_at});
}

bytes_t encode(const verification_event<1>& o) {
  auto encoder = scale_encoder_t{};
  // Zero marks "no error"; verify_error_code values start at one.
  auto error_code =
      o.error_code ? static_cast<uint32_t>(*o.error_code) : uint32_t{0};
  return encoder.encode(verification_row_t{
      o.version, o.event_id, o.request_id, o.credential_id, o.agent_id,
      o.issuer_id, o.success, error_code, o.failure_reason, o.latency_ms,
      o.recorded_at});
}

bytes_t encode(const audit_entry<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(audit_row_t{o.version, o.entry_id, o.issuer_id,
                                    o.action, o.resource_type, o.resource_id,
                                    o.details.dump(), o.recorded_at});
}

bytes_t encode(const revocation_event<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(revocation_row_t{
      o.version, o.sequence, o.revocation_id, o.credential_id, o.issuer_id,
      o.agent_id, o.reason, o.revoked_at});
}

bytes_t encode(const webhook_subscription<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(subscription_row_t{
      o.version, o.subscription_id, o.issuer_id, o.url, o.secret, o.events,
      o.is_active, o.consecutive_failures, o.last_success_at,
      o.last_failure_at, o.created_at});
}

bytes_t encode(const webhook_delivery<1>& o) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(delivery_row_t{
      o.version, o.delivery_id, o.subscription_id, o.event, o.payload,
      static_cast<uint8_t>(o.status), o.attempts, o.response_status,
      o.next_retry_at, o.error, o.created_at, o.updated_at});
}

template <>
std::optional<issuer_record<1>> decode<issuer_record<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<issuer_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = issuer_record<1>{};
  auto issuer_type = uint8_t{};
  std::tie(out.version, out.issuer_id, out.name, issuer_type, out.verified,
           out.public_key, out.key_id, out.created_at) = std::move(*row);
  out.issuer_type = static_cast<issuer_type_t>(issuer_type);
  return out;
}

template <>
std::optional<credential_record<1>> decode<credential_record<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<credential_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = credential_record<1>{};
  auto permissions = std::string{};
  auto metadata = std::string{};
  auto status = uint8_t{};
  std::tie(out.version, out.credential_id, out.issuer_id, out.agent_id,
           out.agent_name, out.agent_type, permissions, out.policy_id,
           out.valid_from, out.valid_until, out.geographic_restrictions,
           out.allowed_services, status, out.signature, out.key_id,
           out.credential_payload, metadata, out.created_at, out.updated_at,
           out.revoked_at, out.revocation_reason) = std::move(*row);
  auto parsed_permissions = parse_json(permissions);
  auto parsed_metadata = parse_json(metadata);
  if (!parsed_permissions || !parsed_metadata) {
    return std::nullopt;
  }
  out.permissions = std::move(*parsed_permissions);
  out.metadata = std::move(*parsed_metadata);
  out.status = static_cast<credential_status_t>(status);
  return out;
}

template <>
std::optional<policy_record<1>> decode<policy_record<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<policy_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = policy_record<1>{};
  auto permissions = std::string{};
  std::tie(out.version, out.policy_id, out.issuer_id, out.name,
           out.description, permissions, out.policy_version, out.is_active,
           out.created_at, out.updated_at) = std::move(*row);
  auto parsed = parse_json(permissions);
  if (!parsed) {
    return std::nullopt;
  }
  out.permissions = std::move(*parsed);
  return out;
}

template <>
std::optional<policy_version_record<1>> decode<policy_version_record<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<policy_version_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = policy_version_record<1>{};
  auto permissions = std::string{};
  auto change_type = uint8_t{};
  std::tie(out.version, out.policy_id, out.policy_version, permissions,
           change_type, out.change_reason, out.created_at) = std::move(*row);
  auto parsed = parse_json(permissions);
  if (!parsed) {
    return std::nullopt;
  }
  out.permissions = std::move(*parsed);
  out.change_type = static_cast<policy_change_type_t>(change_type);
  return out;
}

template <>
std::optional<reputation_record<1>> decode<reputation_record<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<reputation_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = reputation_record<1>{};
  std::tie(out.version, out.credential_id, out.agent_id, out.issuer_id,
           out.trust_score, out.verification_score, out.longevity_score,
           out.activity_score, out.total_verifications,
           out.successful_verifications, out.failed_verifications,
           out.last_verification_at, out.updated_at) = std::move(*row);
  return out;
}

template <>
std::optional<trust_score_change<1>> decode<trust_score_change<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<trust_change_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = trust_score_change<1>{};
  std::tie(out.version, out.change_id, out.credential_id, out.trust_score,
           out.verification_score, out.longevity_score, out.activity_score,
           out.issuer_score, out.change_reason, out.change_delta,
           out.recorded_at) = std::move(*row);
  return out;
}

template <>
std::optional<authorization_grant<1>> decode<authorization_grant<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<grant_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = authorization_grant<1>{};
  auto permissions = std::string{};
  auto constraints = std::string{};
  auto status = uint8_t{};
  std::tie(out.version, out.grant_id, out.requester_credential_id,
           out.grantor_credential_id, permissions, constraints, status,
           out.valid_until, out.message, out.created_at, out.updated_at,
           out.responded_at) = std::move(*row);
  auto parsed_permissions = parse_json(permissions);
  auto parsed_constraints = parse_json(constraints);
  if (!parsed_permissions || !parsed_constraints) {
    return std::nullopt;
  }
  out.permissions = std::move(*parsed_permissions);
  out.constraints = std::move(*parsed_constraints);
  out.status = static_cast<grant_status_t>(status);
  return out;
}

template <>
std::optional<verification_event<1>> decode<verification_event<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<verification_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = verification_event<1>{};
  auto error_code = uint32_t{};
  std::tie(out.version, out.event_id, out.request_id, out.credential_id,
           out.agent_id, out.issuer_id, out.success, error_code,
           out.failure_reason, out.latency_ms, out.recorded_at) =
      std::move(*row);
  if (error_code != 0) {
    out.error_code = static_cast<verify_error_code>(error_code);
  }
  return out;
}

template <>
std::optional<audit_entry<1>> decode<audit_entry<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<audit_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = audit_entry<1>{};
  auto details = std::string{};
  std::tie(out.version, out.entry_id, out.issuer_id, out.action,
           out.resource_type, out.resource_id, details, out.recorded_at) =
      std::move(*row);
  auto parsed = parse_json(details);
  if (!parsed) {
    return std::nullopt;
  }
  out.details = std::move(*parsed);
  return out;
}

template <>
std::optional<revocation_event<1>> decode<revocation_event<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<revocation_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = revocation_event<1>{};
  std::tie(out.version, out.sequence, out.revocation_id, out.credential_id,
           out.issuer_id, out.agent_id, out.reason, out.revoked_at) =
      std::move(*row);
  return out;
}

template <>
std::optional<webhook_subscription<1>> decode<webhook_subscription<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<subscription_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = webhook_subscription<1>{};
  std::tie(out.version, out.subscription_id, out.issuer_id, out.url,
           out.secret, out.events, out.is_active, out.consecutive_failures,
           out.last_success_at, out.last_failure_at, out.created_at) =
      std::move(*row);
  return out;
}

template <>
std::optional<webhook_delivery<1>> decode<webhook_delivery<1>>(
    const bytes_view_t& bytes) {
  auto row = decode_row<delivery_row_t>(bytes, 1);
  if (!row) {
    return std::nullopt;
  }
  auto out = webhook_delivery<1>{};
  auto status = uint8_t{};
  std::tie(out.version, out.delivery_id, out.subscription_id, out.event,
           out.payload, status, out.attempts, out.response_status,
           out.next_retry_at, out.error, out.created_at, out.updated_at) =
      std::move(*row);
  out.status = static_cast<delivery_status_t>(status);
  return out;
}

}  // namespace agentid::schema::encoding::scale
