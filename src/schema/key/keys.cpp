#include <agentid/schema/key/builder.hpp>
#include <agentid/schema/key/keys.hpp>

namespace agentid::schema::key {

bytes_t make_prefix(std::string_view prefix) {
  return builder{}.write(prefix).data;
}

bytes_t make_prefix(std::string_view prefix, std::string_view id) {
  return builder{}.write(prefix).segment(id).separator().data;
}

bytes_t make_issuer_key(std::string_view issuer_id) {
  return builder{}.write(kIssuerPrefix).write(issuer_id).data;
}

bytes_t make_credential_key(std::string_view credential_id) {
  return builder{}.write(kCredentialPrefix).write(credential_id).data;
}

bytes_t make_active_agent_key(std::string_view issuer_id,
                              std::string_view agent_id) {
  return builder{}
      .write(kActiveAgentIndexPrefix)
      .segment(issuer_id)
      .separator()
      .write(agent_id)
      .data;
}

bytes_t make_issuer_credential_key(std::string_view issuer_id,
                                   std::string_view credential_id) {
  return builder{}
      .write(kIssuerCredentialIndexPrefix)
      .segment(issuer_id)
      .separator()
      .write(credential_id)
      .data;
}

bytes_t make_policy_credential_key(std::string_view policy_id,
                                   std::string_view credential_id) {
  return builder{}
      .write(kPolicyCredentialIndexPrefix)
      .segment(policy_id)
      .separator()
      .write(credential_id)
      .data;
}

bytes_t make_policy_key(std::string_view policy_id) {
  return builder{}.write(kPolicyPrefix).write(policy_id).data;
}

bytes_t make_policy_name_key(std::string_view issuer_id,
                             std::string_view name) {
  return builder{}
      .write(kPolicyNameIndexPrefix)
      .segment(issuer_id)
      .separator()
      .write(name)
      .data;
}

bytes_t make_policy_version_key(std::string_view policy_id,
                                uint32_t policy_version) {
  return builder{}
      .write(kPolicyVersionPrefix)
      .segment(policy_id)
      .separator()
      .write(policy_version)
      .data;
}

bytes_t make_reputation_key(std::string_view credential_id) {
  return builder{}.write(kReputationPrefix).write(credential_id).data;
}

bytes_t make_trust_history_key(std::string_view credential_id,
                               uint64_t change_id) {
  return builder{}
      .write(kTrustHistoryPrefix)
      .segment(credential_id)
      .separator()
      .write(change_id)
      .data;
}

bytes_t make_grant_key(std::string_view grant_id) {
  return builder{}.write(kGrantPrefix).write(grant_id).data;
}

bytes_t make_grant_pair_key(std::string_view requester_credential_id,
                            std::string_view grantor_credential_id,
                            std::string_view grant_id) {
  return builder{}
      .write(kGrantPairIndexPrefix)
      .segment(requester_credential_id)
      .separator()
      .segment(grantor_credential_id)
      .separator()
      .write(grant_id)
      .data;
}

bytes_t make_verification_log_key(uint64_t event_id) {
  return builder{}.write(kVerificationLogPrefix).write(event_id).data;
}

bytes_t make_audit_log_key(uint64_t entry_id) {
  return builder{}.write(kAuditLogPrefix).write(entry_id).data;
}

bytes_t make_revocation_stream_key(uint64_t sequence) {
  return builder{}.write(kRevocationStreamPrefix).write(sequence).data;
}

bytes_t make_webhook_subscription_key(std::string_view subscription_id) {
  return builder{}
      .write(kWebhookSubscriptionPrefix)
      .write(subscription_id)
      .data;
}

bytes_t make_webhook_delivery_key(std::string_view delivery_id) {
  return builder{}.write(kWebhookDeliveryPrefix).write(delivery_id).data;
}

bytes_t make_sequence_key(std::string_view name) {
  return builder{}.write(kSequencePrefix).write(name).data;
}

std::string_view index_tail(const bytes_view_t& key) {
  auto text = make_string_view(key);
  auto position = text.rfind('|');
  if (position == std::string_view::npos) {
    return text;
  }
  return text.substr(position + 1);
}

}  // namespace agentid::schema::key
