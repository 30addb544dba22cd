#include <spdlog/spdlog.h>
#include <agentid/rpc/server.hpp>
#include <agentid/schema/issuer_type.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace agentid::rpc;
using namespace agentid::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void set_status(agentid::v1::OperationStatus* status,
                const operation_error_code code,
                const std::string& message) {
  status->set_code(static_cast<uint32_t>(code));
  status->set_name(std::string{to_string(code)});
  status->set_message(message);
}

template <typename T>
void set_status(agentid::v1::OperationStatus* status,
                const operation_result<T>& result) {
  set_status(status, result.code, result.message);
}

void set_invalid(agentid::v1::OperationStatus* status, const std::string& message) {
  set_status(status, operation_error_code::invalid_request, message);
}

/// Empty text yields `fallback`; text that is not JSON yields nothing.
std::optional<json_t> parse_json_field(const std::string& text,
                                       json_t fallback) {
  if (text.empty()) {
    return fallback;
  }
  auto parsed = json_t::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::string> non_empty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string> to_vector(
    const google::protobuf::RepeatedPtrField<std::string>& values) {
  return std::vector<std::string>{values.begin(), values.end()};
}

void populate_issuer(const issuer_record_t& source, agentid::v1::Issuer* out) {
  out->set_issuer_id(source.issuer_id);
  out->set_name(source.name);
  out->set_issuer_type(std::string{to_string(source.issuer_type)});
  out->set_verified(source.verified);
  out->set_public_key(source.public_key);
  out->set_key_id(source.key_id);
  out->set_created_at(agentid::common::format_iso8601(source.created_at));
}

void populate_revocation(const revocation_event_t& source,
                         agentid::v1::RevocationEvent* out) {
  out->set_sequence(source.sequence);
  out->set_revocation_id(source.revocation_id);
  out->set_credential_id(source.credential_id);
  out->set_issuer_id(source.issuer_id);
  out->set_agent_id(source.agent_id);
  out->set_reason(source.reason);
  out->set_revoked_at(agentid::common::format_iso8601(source.revoked_at));
}

void populate_credential(const operation_result<credential_record_t>& result,
                         agentid::v1::CredentialResponse* response) {
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    response->set_credential_id(result.value.credential_id);
    response->set_credential_json(result.value.credential_payload);
  }
}

void populate_verification(const agentid::execution::verification_response& source,
                           agentid::v1::VerifyCredentialResponse* out) {
  out->set_valid(source.valid);
  out->set_request_id(source.request_id);
  if (source.error) {
    out->set_error_code(std::string{to_string(source.error->code)});
  }
  out->set_response_json(agentid::execution::to_json(source).dump());
}

agentid::execution::verify_request make_verify_request(
    const agentid::v1::VerifyCredentialRequest& request) {
  auto out = agentid::execution::verify_request{};
  if (!request.credential_id().empty()) {
    out.credential_id = request.credential_id();
  } else if (!request.credential_json().empty()) {
    // Unparseable text becomes a non-object and fails as a malformed payload.
    out.credential = json_t::parse(request.credential_json(), nullptr, false);
    if (out.credential->is_discarded()) {
      out.credential = json_t{};
    }
  }
  if (request.has_check_permission() &&
      !request.check_permission().action().empty()) {
    const auto& check = request.check_permission();
    out.check_permission = agentid::execution::permission_check_request{
        .action = check.action(),
        .resource = non_empty(check.resource()),
        .region = non_empty(check.region())};
  }
  return out;
}

json_t to_json(const reputation_record_t& record) {
  auto out = json_t{{"credential_id", record.credential_id},
                    {"agent_id", record.agent_id},
                    {"issuer_id", record.issuer_id},
                    {"trust_score", record.trust_score},
                    {"verification_score", record.verification_score},
                    {"longevity_score", record.longevity_score},
                    {"activity_score", record.activity_score},
                    {"total_verifications", record.total_verifications},
                    {"successful_verifications", record.successful_verifications},
                    {"failed_verifications", record.failed_verifications},
                    {"last_verification_at", nullptr},
                    {"updated_at", agentid::common::format_iso8601(record.updated_at)}};
  if (record.last_verification_at) {
    out["last_verification_at"] =
        agentid::common::format_iso8601(*record.last_verification_at);
  }
  return out;
}

json_t to_json(const issuer_reputation_t& record) {
  return json_t{{"issuer_id", record.issuer_id},
                {"trust_score", record.trust_score},
                {"total_credentials", record.total_credentials},
                {"active_credentials", record.active_credentials},
                {"revoked_credentials", record.revoked_credentials},
                {"expired_credentials", record.expired_credentials},
                {"total_verifications", record.total_verifications},
                {"successful_verifications", record.successful_verifications}};
}

json_t to_json(const trust_score_change_t& change) {
  return json_t{{"change_id", change.change_id},
                {"trust_score", change.trust_score},
                {"verification_score", change.verification_score},
                {"longevity_score", change.longevity_score},
                {"activity_score", change.activity_score},
                {"issuer_score", change.issuer_score},
                {"change_reason", change.change_reason},
                {"change_delta", change.change_delta},
                {"created_at", agentid::common::format_iso8601(change.recorded_at)}};
}

json_t to_json(const agentid::execution::trust_history& history) {
  auto changes = json_t::array();
  for (const auto& change : history.changes) {
    changes.push_back(to_json(change));
  }
  auto out = json_t{{"credential_id", history.credential_id},
                    {"current", nullptr},
                    {"history", std::move(changes)},
                    {"stats", nullptr},
                    {"period_days", history.period_days}};
  if (history.current) {
    out["current"] = to_json(*history.current);
  }
  if (history.stats) {
    out["stats"] = json_t{{"min_score", history.stats->min_score},
                          {"max_score", history.stats->max_score},
                          {"avg_score", history.stats->average_score},
                          {"total_changes", history.stats->total_changes},
                          {"net_change", history.stats->net_change},
                          {"trend", history.stats->trend}};
  }
  return out;
}

json_t to_json(const agentid::execution::leaderboard_entry& entry) {
  return json_t{{"rank", entry.rank},
                {"credential_id", entry.credential_id},
                {"agent_id", entry.agent_id},
                {"agent_name", entry.agent_name},
                {"trust_score", entry.trust_score},
                {"verification_count", entry.verification_count},
                {"issuer_name", entry.issuer_name},
                {"issuer_verified", entry.issuer_verified}};
}

}  // namespace

listener::listener(agentid::execution::engine& engine) : engine_{engine} {}

grpc::ServerUnaryReactor* listener::Health(
    grpc::CallbackServerContext* context,
    const agentid::v1::HealthRequest*,
    agentid::v1::HealthResponse* response) {
  response->set_serving(true);
  response->set_signing_enabled(engine_.can_sign());
  response->set_time(agentid::common::format_iso8601(
      agentid::common::system_clock()()));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RegisterIssuer(
    grpc::CallbackServerContext* context,
    const agentid::v1::RegisterIssuerRequest* request,
    agentid::v1::RegisterIssuerResponse* response) {
  auto issuer_type = request->issuer_type().empty()
                         ? std::optional{issuer_type_t::individual}
                         : try_parse_issuer_type(request->issuer_type());
  if (!issuer_type) {
    set_invalid(response->mutable_status(),
                "issuer_type must be individual, organization or enterprise");
    return finish_ok(context);
  }
  auto result = engine_.register_issuer(agentid::execution::register_issuer_request{
      .name = request->name(),
      .issuer_type = *issuer_type,
      .verified = request->verified(),
      .issuer_id = non_empty(request->issuer_id())});
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    populate_issuer(result.value, response->mutable_issuer());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::IssueCredential(
    grpc::CallbackServerContext* context,
    const agentid::v1::IssueCredentialRequest* request,
    agentid::v1::CredentialResponse* response) {
  auto permissions = parse_json_field(request->permissions_json(), json_t::array());
  auto metadata = parse_json_field(request->metadata_json(), json_t::object());
  if (!permissions || !metadata) {
    set_invalid(response->mutable_status(),
                "permissions_json and metadata_json must be JSON");
    return finish_ok(context);
  }
  auto valid_until = agentid::common::parse_iso8601(request->valid_until());
  auto valid_from = std::optional<timestamp_milliseconds_t>{};
  if (!request->valid_from().empty()) {
    valid_from = agentid::common::parse_iso8601(request->valid_from());
    if (!valid_from) {
      set_invalid(response->mutable_status(), "valid_from must be ISO-8601");
      return finish_ok(context);
    }
  }
  if (!valid_until) {
    set_invalid(response->mutable_status(), "valid_until must be ISO-8601");
    return finish_ok(context);
  }

  auto result = engine_.issue_credential(agentid::execution::issue_request{
      .issuer_id = request->issuer_id(),
      .agent_id = request->agent_id(),
      .agent_name = request->agent_name(),
      .agent_type = request->agent_type(),
      .permissions = std::move(*permissions),
      .valid_from = valid_from,
      .valid_until = *valid_until,
      .geographic_restrictions = to_vector(request->geographic_restrictions()),
      .allowed_services = to_vector(request->allowed_services()),
      .metadata = std::move(*metadata),
      .policy_id = non_empty(request->policy_id())});
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    response->set_credential_id(result.value.record.credential_id);
    response->set_credential_json(result.value.payload.dump());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::VerifyCredential(
    grpc::CallbackServerContext* context,
    const agentid::v1::VerifyCredentialRequest* request,
    agentid::v1::VerifyCredentialResponse* response) {
  populate_verification(engine_.verify(make_verify_request(*request)), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::VerifyBatch(
    grpc::CallbackServerContext* context,
    const agentid::v1::VerifyBatchRequest* request,
    agentid::v1::VerifyBatchResponse* response) {
  auto requests = std::vector<agentid::execution::verify_request>{};
  requests.reserve(static_cast<std::size_t>(request->requests_size()));
  for (const auto& item : request->requests()) {
    requests.push_back(make_verify_request(item));
  }
  auto result = engine_.verify_batch(requests);
  set_status(response->mutable_status(), result);
  auto valid = uint32_t{0};
  for (const auto& item : result.value) {
    populate_verification(item, response->add_results());
    if (item.valid) {
      ++valid;
    }
  }
  response->set_valid_count(valid);
  response->set_invalid_count(static_cast<uint32_t>(result.value.size()) - valid);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RenewCredential(
    grpc::CallbackServerContext* context,
    const agentid::v1::RenewCredentialRequest* request,
    agentid::v1::CredentialResponse* response) {
  auto extend_days = request->has_extend_days()
                         ? std::optional<int64_t>{request->extend_days()}
                         : std::nullopt;
  populate_credential(engine_.renew_credential(request->issuer_id(),
                                               request->credential_id(),
                                               extend_days),
                      response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RevokeCredential(
    grpc::CallbackServerContext* context,
    const agentid::v1::RevokeCredentialRequest* request,
    agentid::v1::RevokeCredentialResponse* response) {
  auto result = engine_.revoke_credential(request->issuer_id(),
                                          request->credential_id(),
                                          non_empty(request->reason()));
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    populate_revocation(result.value, response->mutable_revocation());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SuspendCredential(
    grpc::CallbackServerContext* context,
    const agentid::v1::CredentialStateRequest* request,
    agentid::v1::CredentialResponse* response) {
  populate_credential(
      engine_.suspend_credential(request->issuer_id(), request->credential_id()),
      response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ReinstateCredential(
    grpc::CallbackServerContext* context,
    const agentid::v1::CredentialStateRequest* request,
    agentid::v1::CredentialResponse* response) {
  populate_credential(engine_.reinstate_credential(request->issuer_id(),
                                                   request->credential_id()),
                      response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::BulkCredentials(
    grpc::CallbackServerContext* context,
    const agentid::v1::BulkCredentialsRequest* request,
    agentid::v1::BulkCredentialsResponse* response) {
  auto result = engine_.bulk_credentials(agentid::execution::bulk_request{
      .issuer_id = request->issuer_id(),
      .action = request->action(),
      .credential_ids = to_vector(request->credential_ids()),
      .reason = non_empty(request->reason()),
      .extend_days = request->has_extend_days()
                         ? std::optional<int64_t>{request->extend_days()}
                         : std::nullopt});
  set_status(response->mutable_status(), result);
  if (!result.ok()) {
    return finish_ok(context);
  }
  const auto& outcome = result.value;
  response->set_action(request->action());
  for (const auto& item : outcome.results) {
    auto* out = response->add_results();
    out->set_credential_id(item.credential_id);
    out->set_success(item.success);
    out->set_error(item.error.value_or(""));
  }
  response->set_total(static_cast<uint32_t>(outcome.total));
  response->set_successful(static_cast<uint32_t>(outcome.successful));
  response->set_failed(static_cast<uint32_t>(outcome.failed));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::UpsertPolicy(
    grpc::CallbackServerContext* context,
    const agentid::v1::UpsertPolicyRequest* request,
    agentid::v1::UpsertPolicyResponse* response) {
  auto permissions = parse_json_field(request->permissions_json(), json_t::array());
  if (!permissions) {
    set_invalid(response->mutable_status(), "permissions_json must be JSON");
    return finish_ok(context);
  }
  auto result = engine_.upsert_policy(agentid::execution::upsert_policy_request{
      .issuer_id = request->issuer_id(),
      .name = request->name(),
      .permissions = std::move(*permissions),
      .description = non_empty(request->description()),
      .change_reason = non_empty(request->change_reason())});
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    response->set_policy_id(result.value.policy_id);
    response->set_created(result.value.created);
    response->set_version(result.value.version);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::UpdatePolicy(
    grpc::CallbackServerContext* context,
    const agentid::v1::UpdatePolicyRequest* request,
    agentid::v1::UpdatePolicyResponse* response) {
  auto update = agentid::execution::update_policy_request{
      .issuer_id = request->issuer_id(),
      .policy_id = request->policy_id(),
      .change_reason = non_empty(request->change_reason())};
  if (request->has_name()) {
    update.name = request->name();
  }
  if (request->has_description()) {
    update.description = request->description();
  }
  if (request->has_permissions_json()) {
    auto permissions = json_t::parse(request->permissions_json(), nullptr, false);
    if (permissions.is_discarded()) {
      set_invalid(response->mutable_status(), "permissions_json must be JSON");
      return finish_ok(context);
    }
    update.permissions = std::move(permissions);
  }
  if (request->has_is_active()) {
    update.is_active = request->is_active();
  }
  auto result = engine_.update_policy(update);
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    response->set_version(result.value.policy.policy_version);
    response->set_affected_credentials(result.value.affected_credentials);
    response->set_live_update(result.value.live_update);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::AssignPolicy(
    grpc::CallbackServerContext* context,
    const agentid::v1::AssignPolicyRequest* request,
    agentid::v1::AffectedCredentialsResponse* response) {
  auto result = engine_.assign_policy(request->issuer_id(),
                                      request->credential_id(),
                                      request->policy_id());
  set_status(response->mutable_status(), result);
  response->set_affected_credentials(result.value);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RemovePolicy(
    grpc::CallbackServerContext* context,
    const agentid::v1::RemovePolicyRequest* request,
    agentid::v1::AffectedCredentialsResponse* response) {
  auto result =
      engine_.remove_policy(request->issuer_id(), request->credential_id());
  set_status(response->mutable_status(), result);
  response->set_affected_credentials(result.value);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::DeletePolicy(
    grpc::CallbackServerContext* context,
    const agentid::v1::DeletePolicyRequest* request,
    agentid::v1::AffectedCredentialsResponse* response) {
  auto result =
      engine_.delete_policy(request->issuer_id(), request->policy_id());
  set_status(response->mutable_status(), result);
  response->set_affected_credentials(result.value);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RequestAuthorization(
    grpc::CallbackServerContext* context,
    const agentid::v1::RequestAuthorizationRequest* request,
    agentid::v1::AuthorizationResponse* response) {
  auto permissions = parse_json_field(request->permissions_json(), json_t::array());
  auto constraints = parse_json_field(request->constraints_json(), json_t::object());
  if (!permissions || !constraints) {
    set_invalid(response->mutable_status(),
                "permissions_json and constraints_json must be JSON");
    return finish_ok(context);
  }
  auto valid_until = std::optional<timestamp_milliseconds_t>{};
  if (!request->valid_until().empty()) {
    valid_until = agentid::common::parse_iso8601(request->valid_until());
    if (!valid_until) {
      set_invalid(response->mutable_status(), "valid_until must be ISO-8601");
      return finish_ok(context);
    }
  }
  auto result = engine_.request_authorization(agentid::execution::grant_request{
      .issuer_id = request->issuer_id(),
      .requester_credential_id = request->requester_credential_id(),
      .grantor_credential_id = request->grantor_credential_id(),
      .permissions = std::move(*permissions),
      .constraints = std::move(*constraints),
      .valid_until = valid_until,
      .message = request->message()});
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    response->set_authorization_id(result.value.grant_id);
    response->set_authorization_status(std::string{to_string(result.value.status)});
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RespondAuthorization(
    grpc::CallbackServerContext* context,
    const agentid::v1::RespondAuthorizationRequest* request,
    agentid::v1::AuthorizationResponse* response) {
  auto result = engine_.respond_authorization(
      request->issuer_id(), request->authorization_id(), request->approve());
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    response->set_authorization_id(result.value.grant_id);
    response->set_authorization_status(std::string{to_string(result.value.status)});
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckAuthorization(
    grpc::CallbackServerContext* context,
    const agentid::v1::CheckAuthorizationRequest* request,
    agentid::v1::CheckAuthorizationResponse* response) {
  if (request->requester_credential_id().empty() ||
      request->grantor_credential_id().empty() || request->action().empty()) {
    response->set_authorized(false);
    response->set_reason(
        "Missing required fields: requester_credential_id, "
        "grantor_credential_id, action");
    return finish_ok(context);
  }
  auto query = agentid::execution::authorization_query{
      .requester_credential_id = request->requester_credential_id(),
      .grantor_credential_id = request->grantor_credential_id(),
      .action = request->action(),
      .resource = non_empty(request->resource()),
      .context = {.region = non_empty(request->region()),
                  .hour = request->has_current_hour()
                              ? std::optional<uint32_t>{request->current_hour()}
                              : std::nullopt,
                  .day = non_empty(request->current_day())}};
  auto decision = engine_.check_authorization(query);
  response->set_authorized(decision.authorized);
  response->set_authorization_id(decision.authorization_id.value_or(""));
  for (const auto& applied : decision.constraints_applied) {
    response->add_constraints_applied(applied);
  }
  if (decision.valid_until) {
    response->set_valid_until(
        agentid::common::format_iso8601(*decision.valid_until));
  }
  if (decision.rate_limit_remaining) {
    response->set_rate_limit_remaining(*decision.rate_limit_remaining);
  }
  response->set_reason(decision.reason.value_or(""));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetReputation(
    grpc::CallbackServerContext* context,
    const agentid::v1::GetReputationRequest* request,
    agentid::v1::GetReputationResponse* response) {
  if (!request->credential_id().empty()) {
    if (auto record = engine_.reputation(request->credential_id())) {
      response->set_found(true);
      response->set_reputation_json(to_json(*record).dump());
    }
  } else if (!request->issuer_id().empty()) {
    if (auto record = engine_.issuer_reputation(request->issuer_id())) {
      response->set_found(true);
      response->set_reputation_json(to_json(*record).dump());
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetReputationHistory(
    grpc::CallbackServerContext* context,
    const agentid::v1::GetReputationHistoryRequest* request,
    agentid::v1::GetReputationHistoryResponse* response) {
  if (request->credential_id().empty()) {
    set_invalid(response->mutable_status(), "credential_id is required");
    return finish_ok(context);
  }
  auto limit = request->limit() == 0
                   ? std::optional<std::size_t>{}
                   : std::optional<std::size_t>{request->limit()};
  auto days = request->days() == 0 ? std::optional<uint32_t>{}
                                   : std::optional<uint32_t>{request->days()};
  auto result = engine_.reputation_history(request->credential_id(), limit, days);
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    response->set_history_json(to_json(result.value).dump());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetLeaderboard(
    grpc::CallbackServerContext* context,
    const agentid::v1::GetLeaderboardRequest* request,
    agentid::v1::GetLeaderboardResponse* response) {
  auto limit = request->limit() == 0 ? std::size_t{10}
                                     : std::size_t{request->limit()};
  auto entries = json_t::array();
  for (const auto& entry : engine_.leaderboard(limit)) {
    entries.push_back(to_json(entry));
  }
  response->set_leaderboard_json(entries.dump());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetRevocations(
    grpc::CallbackServerContext* context,
    const agentid::v1::GetRevocationsRequest* request,
    agentid::v1::GetRevocationsResponse* response) {
  auto query = agentid::storage::revocation_query{
      .credential_ids = to_vector(request->credential_ids())};
  if (!request->since().empty()) {
    auto since = agentid::common::parse_iso8601(request->since());
    if (!since) {
      set_invalid(response->mutable_status(), "since must be ISO-8601");
      return finish_ok(context);
    }
    query.since = *since;
  }
  if (request->limit() > 0) {
    query.limit = request->limit();
  }
  set_status(response->mutable_status(), operation_error_code::ok, "");
  for (const auto& event : engine_.revocations(query)) {
    populate_revocation(event, response->add_revocations());
  }
  response->set_checked_at(
      agentid::common::format_iso8601(agentid::common::system_clock()()));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CreateWebhook(
    grpc::CallbackServerContext* context,
    const agentid::v1::CreateWebhookRequest* request,
    agentid::v1::CreateWebhookResponse* response) {
  auto result = engine_.create_webhook(request->issuer_id(), request->url(),
                                       to_vector(request->events()));
  set_status(response->mutable_status(), result);
  if (result.ok()) {
    response->set_subscription_id(result.value.subscription_id);
    response->set_secret(result.value.secret);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Sweep(
    grpc::CallbackServerContext* context,
    const agentid::v1::SweepRequest*,
    agentid::v1::SweepResponse* response) {
  auto summary = engine_.sweep();
  response->set_expired_credentials(summary.expired_credentials);
  for (const auto& id : summary.expired_grants) {
    response->add_expired_authorizations(id);
  }
  spdlog::debug("Sweep expired {} credentials and {} authorizations",
                summary.expired_credentials, summary.expired_grants.size());
  return finish_ok(context);
}
