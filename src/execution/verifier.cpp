#include <agentid/execution/verifier.hpp>

#include <agentid/crypto/canonical.hpp>
#include <agentid/crypto/random.hpp>
#include <agentid/crypto/verify.hpp>
#include <agentid/execution/credential_payload.hpp>
#include <agentid/schema/credential_status.hpp>

#include <chrono>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace agentid::execution {

namespace {

using agentid::schema::verify_error_code;

constexpr auto kBase36Digits =
    std::string_view{"0123456789abcdefghijklmnopqrstuvwxyz"};

std::string to_base36(uint64_t value) {
  if (value == 0) {
    return "0";
  }
  auto out = std::string{};
  while (value > 0) {
    out.insert(out.begin(), kBase36Digits[value % 36]);
    value /= 36;
  }
  return out;
}

verification_response failure(const verify_error_code code,
                              std::string message) {
  return verification_response{
      .valid = false,
      .error = verify_error{.code = code, .message = std::move(message)}};
}

std::string string_or_empty(const agentid::schema::json_t& object,
                            const char* name) {
  auto it = object.find(name);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

bool signature_matches(const agentid::schema::json_t& payload,
                       const std::string& public_key) {
  if (!payload.is_object()) {
    return false;
  }
  auto signature_it = payload.find("signature");
  if (signature_it == payload.end() || !signature_it->is_string()) {
    return false;
  }
  auto message = agentid::crypto::canonical_signing_input(payload);
  return agentid::crypto::verify_ed25519(
      agentid::schema::make_bytes_view(message), public_key,
      signature_it->get_ref<const std::string&>());
}

}  // namespace

std::string make_request_id(const agentid::schema::timestamp_milliseconds_t now) {
  auto suffix = std::string{};
  for (auto byte : agentid::crypto::random_bytes(6)) {
    suffix.push_back(kBase36Digits[byte % kBase36Digits.size()]);
  }
  return "req_" + to_base36(now) + "_" + suffix;
}

agentid::schema::json_t to_json(const verification_response& response) {
  auto out = agentid::schema::json_t{
      {"valid", response.valid},
      {"request_id", response.request_id},
      {"verification_time_ms", response.verification_time_ms}};
  if (response.credential) {
    const auto& credential = *response.credential;
    out["credential"] = {
        {"credential_id", credential.credential_id},
        {"agent_id", credential.agent_id},
        {"agent_name", credential.agent_name},
        {"agent_type", credential.agent_type},
        {"issuer", credential.issuer},
        {"permissions", credential.permissions},
        {"valid_until", agentid::common::format_iso8601(credential.valid_until)}};
  }
  if (response.error) {
    out["error"] = {{"code", std::string{to_string(response.error->code)}},
                    {"message", response.error->message},
                    {"request_id", response.request_id}};
  }
  if (response.policy) {
    out["policy"] = {{"id", response.policy->policy_id},
                     {"name", response.policy->name},
                     {"version", response.policy->version}};
    out["live_permissions"] = response.live_permissions;
  }
  if (response.permission_check) {
    out["permission_check"] = to_json(*response.permission_check);
  }
  return out;
}

verifier::verifier(agentid::storage::repository& repository,
                   const policy_engine& policies,
                   side_effects& effects,
                   rate_limiter* limiter,
                   agentid::common::clock_fn_t clock)
    : repository_{repository},
      policies_{policies},
      effects_{effects},
      limiter_{limiter},
      clock_{std::move(clock)} {}

verification_response verifier::verify(const verify_request& request) {
  auto started = std::chrono::steady_clock::now();
  auto request_id = make_request_id(clock_());
  auto subject = resolved{};
  auto response = verification_response{};
  try {
    response = evaluate(request, subject);
  } catch (const std::exception& e) {
    spdlog::error("[{}] Verification error: {}", request_id, e.what());
    response = failure(verify_error_code::internal_error,
                       "Verification failed due to internal error");
  }
  response.request_id = std::move(request_id);
  response.verification_time_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count());
  record(response, subject);
  return response;
}

agentid::schema::operation_result<std::vector<verification_response>>
verifier::verify_batch(const std::vector<verify_request>& requests) {
  using result_t =
      agentid::schema::operation_result<std::vector<verification_response>>;
  if (requests.empty()) {
    return result_t::failure(agentid::schema::operation_error_code::batch_empty,
                             "At least one credential is required");
  }
  if (requests.size() > kMaxBatchVerifications) {
    return result_t::failure(
        agentid::schema::operation_error_code::batch_too_large,
        "Maximum 100 credentials per batch");
  }
  auto responses = std::vector<verification_response>{};
  responses.reserve(requests.size());
  for (const auto& request : requests) {
    responses.push_back(verify(request));
  }
  return result_t::success(std::move(responses));
}

verification_response verifier::evaluate(const verify_request& request,
                                         resolved& subject) {
  auto now = clock_();
  auto stored = std::optional<agentid::schema::credential_record_t>{};
  auto presented = std::optional<presented_credential>{};
  auto payload = agentid::schema::json_t{};

  if (request.credential_id) {
    subject.credential_id = *request.credential_id;
    stored = repository_.get_credential(*request.credential_id);
    if (!stored) {
      return failure(verify_error_code::credential_not_found,
                     "Credential not found");
    }
    payload = agentid::schema::json_t::parse(stored->credential_payload,
                                             nullptr, false);
  } else if (request.credential) {
    presented = parse_credential_payload(*request.credential);
    if (!presented) {
      return failure(verify_error_code::invalid_request,
                     "Invalid request format");
    }
    subject.credential_id = presented->credential_id;
    subject.agent_id = presented->agent_id;
    subject.issuer_id = presented->issuer_id;
    payload = *request.credential;
    // A presented copy of a credential we hold is judged by our record.
    stored = repository_.get_credential(presented->credential_id);
  } else {
    return failure(verify_error_code::missing_input,
                   "Must provide credential_id or credential");
  }

  if (stored) {
    subject.agent_id = stored->agent_id;
    subject.issuer_id = stored->issuer_id;
  }
  auto issuer = repository_.get_issuer(*subject.issuer_id);
  if (!issuer) {
    return failure(verify_error_code::issuer_not_found, "Issuer not found");
  }

  if (stored && stored->status != agentid::schema::credential_status_t::active) {
    return failure(verify_error_code::credential_revoked,
                   "Credential status: " +
                       std::string{to_string(stored->status)});
  }

  auto valid_from = stored ? stored->valid_from : presented->valid_from;
  auto valid_until = stored ? stored->valid_until : presented->valid_until;
  if (now < valid_from) {
    return failure(verify_error_code::credential_not_yet_valid,
                   "Credential not yet valid");
  }
  if (now >= valid_until) {
    return failure(verify_error_code::credential_expired, "Credential expired");
  }

  if (!signature_matches(payload, issuer->public_key)) {
    spdlog::debug("Signature mismatch for credential {}",
                  subject.credential_id.value_or(""));
    return failure(verify_error_code::invalid_signature, "Invalid signature");
  }

  auto effective = stored ? policies_.resolve(*stored)
                          : effective_permissions{.permissions =
                                                      presented->permissions};
  auto response = verification_response{.valid = true};
  response.credential = verified_credential{
      .credential_id = *subject.credential_id,
      .agent_id = string_or_empty(payload, "agent_id"),
      .agent_name = string_or_empty(payload, "agent_name"),
      .agent_type = string_or_empty(payload, "agent_type"),
      .issuer = payload.value("issuer", agentid::schema::json_t::object()),
      .permissions = effective.permissions,
      .valid_until = valid_until};
  if (effective.policy) {
    response.policy = verified_policy{.policy_id = effective.policy->policy_id,
                                      .name = effective.policy->name,
                                      .version = effective.policy->policy_version};
    response.live_permissions = true;
  }

  if (request.check_permission) {
    const auto& check = *request.check_permission;
    auto context = permission_context{
        .region = check.region,
        .hour = agentid::common::utc_hour(now),
        .day = std::string{weekday_name(agentid::common::utc_weekday(now))},
        .credential_id = subject.credential_id};
    response.permission_check = check_permission(
        permission_request{.action = check.action, .resource = check.resource},
        effective.permissions, context, limiter_);
  }
  return response;
}

void verifier::record(const verification_response& response,
                      const resolved& subject) {
  auto event = agentid::schema::verification_event_t{
      .request_id = response.request_id,
      .credential_id = subject.credential_id,
      .agent_id = subject.agent_id,
      .issuer_id = subject.issuer_id,
      .success = response.valid,
      .latency_ms = response.verification_time_ms,
      .recorded_at = clock_()};
  if (response.error) {
    event.error_code = response.error->code;
    event.failure_reason = response.error->message;
  }
  effects_.verification(std::move(event));
  if (subject.credential_id) {
    effects_.reputation(*subject.credential_id, response.valid);
  }
}

}  // namespace agentid::execution
