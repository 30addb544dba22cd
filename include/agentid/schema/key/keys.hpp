#pragma once
#include <agentid/schema/primitives.hpp>
#include <string_view>

// Storage key layout. Every key starts with "AID|" and a table tag; index
// rows carry no value beyond the id they point at.
namespace agentid::schema::key {

inline constexpr auto kIssuerPrefix = std::string_view{"AID|ISSUER|"};
inline constexpr auto kCredentialPrefix = std::string_view{"AID|CRED|"};
inline constexpr auto kActiveAgentIndexPrefix =
    std::string_view{"AID|IDX|ACTIVE_AGENT|"};
inline constexpr auto kIssuerCredentialIndexPrefix =
    std::string_view{"AID|IDX|ISSUER_CRED|"};
inline constexpr auto kPolicyCredentialIndexPrefix =
    std::string_view{"AID|IDX|POLICY_CRED|"};
inline constexpr auto kPolicyPrefix = std::string_view{"AID|POLICY|"};
inline constexpr auto kPolicyNameIndexPrefix =
    std::string_view{"AID|IDX|POLICY_NAME|"};
inline constexpr auto kPolicyVersionPrefix =
    std::string_view{"AID|POLICY_VERSION|"};
inline constexpr auto kReputationPrefix = std::string_view{"AID|REPUTATION|"};
inline constexpr auto kTrustHistoryPrefix =
    std::string_view{"AID|TRUST_HISTORY|"};
inline constexpr auto kGrantPrefix = std::string_view{"AID|GRANT|"};
inline constexpr auto kGrantPairIndexPrefix =
    std::string_view{"AID|IDX|GRANT_PAIR|"};
inline constexpr auto kVerificationLogPrefix =
    std::string_view{"AID|LOG|VERIFICATION|"};
inline constexpr auto kAuditLogPrefix = std::string_view{"AID|LOG|AUDIT|"};
inline constexpr auto kRevocationStreamPrefix =
    std::string_view{"AID|STREAM|REVOCATION|"};
inline constexpr auto kWebhookSubscriptionPrefix =
    std::string_view{"AID|WEBHOOK|SUB|"};
inline constexpr auto kWebhookDeliveryPrefix =
    std::string_view{"AID|WEBHOOK|DELIVERY|"};
inline constexpr auto kSequencePrefix = std::string_view{"AID|SYS|SEQ|"};

bytes_t make_prefix(std::string_view prefix);
bytes_t make_prefix(std::string_view prefix, std::string_view id);

bytes_t make_issuer_key(std::string_view issuer_id);
bytes_t make_credential_key(std::string_view credential_id);
bytes_t make_active_agent_key(std::string_view issuer_id,
                              std::string_view agent_id);
bytes_t make_issuer_credential_key(std::string_view issuer_id,
                                   std::string_view credential_id);
bytes_t make_policy_credential_key(std::string_view policy_id,
                                   std::string_view credential_id);
bytes_t make_policy_key(std::string_view policy_id);
bytes_t make_policy_name_key(std::string_view issuer_id,
                             std::string_view name);
bytes_t make_policy_version_key(std::string_view policy_id,
                                uint32_t policy_version);
bytes_t make_reputation_key(std::string_view credential_id);
bytes_t make_trust_history_key(std::string_view credential_id,
                               uint64_t change_id);
bytes_t make_grant_key(std::string_view grant_id);
bytes_t make_grant_pair_key(std::string_view requester_credential_id,
                            std::string_view grantor_credential_id,
                            std::string_view grant_id);
bytes_t make_verification_log_key(uint64_t event_id);
bytes_t make_audit_log_key(uint64_t entry_id);
bytes_t make_revocation_stream_key(uint64_t sequence);
bytes_t make_webhook_subscription_key(std::string_view subscription_id);
bytes_t make_webhook_delivery_key(std::string_view delivery_id);
bytes_t make_sequence_key(std::string_view name);

/// Return the trailing id segment of an index key (text after the last '|').
std::string_view index_tail(const bytes_view_t& key);

}  // namespace agentid::schema::key
