#include <agentid/execution/credential_payload.hpp>

#include <agentid/common/time.hpp>
#include <agentid/schema/issuer_type.hpp>

namespace agentid::execution {

namespace {

std::optional<std::string> string_member(const agentid::schema::json_t& object,
                                         const char* name) {
  auto it = object.find(name);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

}  // namespace

agentid::schema::json_t make_credential_payload(
    const agentid::schema::credential_record_t& credential,
    const agentid::schema::issuer_record_t& issuer) {
  return agentid::schema::json_t{
      {"credential_id", credential.credential_id},
      {"agent_id", credential.agent_id},
      {"agent_name", credential.agent_name},
      {"agent_type", credential.agent_type},
      {"issuer",
       {{"issuer_id", issuer.issuer_id},
        {"issuer_type", std::string{to_string(issuer.issuer_type)}},
        {"issuer_verified", issuer.verified},
        {"name", issuer.name}}},
      {"permissions", credential.permissions},
      {"constraints",
       {{"valid_from", agentid::common::format_iso8601(credential.valid_from)},
        {"valid_until", agentid::common::format_iso8601(credential.valid_until)},
        {"geographic_restrictions", credential.geographic_restrictions},
        {"allowed_services", credential.allowed_services}}},
      {"issued_at", agentid::common::format_iso8601(credential.created_at)}};
}

std::optional<presented_credential> parse_credential_payload(
    const agentid::schema::json_t& payload) {
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto issuer_it = payload.find("issuer");
  auto constraints_it = payload.find("constraints");
  if (issuer_it == payload.end() || !issuer_it->is_object() ||
      constraints_it == payload.end() || !constraints_it->is_object()) {
    return std::nullopt;
  }

  auto credential_id = string_member(payload, "credential_id");
  auto issuer_id = string_member(*issuer_it, "issuer_id");
  auto agent_id = string_member(payload, "agent_id");
  auto signature = string_member(payload, "signature");
  auto valid_from = string_member(*constraints_it, "valid_from");
  auto valid_until = string_member(*constraints_it, "valid_until");
  if (!credential_id || !issuer_id || !agent_id || !signature || !valid_from ||
      !valid_until) {
    return std::nullopt;
  }
  auto from = agentid::common::parse_iso8601(*valid_from);
  auto until = agentid::common::parse_iso8601(*valid_until);
  if (!from || !until) {
    return std::nullopt;
  }

  auto out = presented_credential{
      .credential_id = std::move(*credential_id),
      .issuer_id = std::move(*issuer_id),
      .agent_id = std::move(*agent_id),
      .agent_name = string_member(payload, "agent_name").value_or(""),
      .agent_type = string_member(payload, "agent_type").value_or(""),
      .valid_from = *from,
      .valid_until = *until,
      .signature = std::move(*signature)};
  auto permissions_it = payload.find("permissions");
  if (permissions_it != payload.end()) {
    out.permissions = *permissions_it;
  }
  return out;
}

}  // namespace agentid::execution
