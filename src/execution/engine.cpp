#include <spdlog/spdlog.h>
#include <agentid/execution/engine.hpp>
#include <algorithm>
#include <exception>
#include <utility>

namespace agentid::execution {

namespace {

inline constexpr auto kMaxRevocationPage = std::size_t{1000};

template <typename T>
struct result_type;

template <typename T>
struct result_type<agentid::schema::operation_result<T>> {
  static agentid::schema::operation_result<T> internal_error() {
    return agentid::schema::operation_result<T>::failure(
        agentid::schema::operation_error_code::internal_error,
        "Internal error");
  }
};

template <typename T>
struct result_type<std::optional<T>> {
  static std::optional<T> internal_error() { return std::nullopt; }
};

template <typename T>
struct result_type<std::vector<T>> {
  static std::vector<T> internal_error() { return {}; }
};

/// Run `fn`, turning storage and other runtime failures into the operation's
/// internal_error value.
template <typename Fn>
auto guarded(const std::string_view operation, Fn&& fn) -> decltype(fn()) {
  using value_t = decltype(fn());
  try {
    return fn();
  } catch (const agentid::storage::storage_error& e) {
    spdlog::error("{} failed in storage: {}", operation, e.what());
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", operation, e.what());
  }
  return result_type<value_t>::internal_error();
}

}  // namespace

engine::engine(agentid::storage::repository& repository,
               engine_options options,
               agentid::common::clock_fn_t clock)
    : repository_{repository},
      clock_{std::move(clock)},
      signer_{options.secret ? std::optional<agentid::crypto::signer>{
                                   std::in_place, std::move(*options.secret)}
                             : std::nullopt},
      dispatcher_{options.worker_count},
      limiter_{clock_},
      reputation_{repository_, clock_},
      webhooks_{repository_, options.transport, clock_},
      effects_{dispatcher_, repository_, &webhooks_, &reputation_, clock_},
      issuers_{repository_, signer_ ? &*signer_ : nullptr, clock_},
      policies_{repository_, effects_, clock_},
      lifecycle_{repository_, signer_ ? &*signer_ : nullptr, bus_, effects_,
                 clock_},
      verifier_{repository_, policies_, effects_, &limiter_, clock_},
      authorizations_{repository_, limiter_, effects_, clock_} {
  spdlog::info("Credential engine ready ({} mode, {} side-effect workers)",
               signer_ ? "signing" : "verify-only", options.worker_count);
}

engine::~engine() {
  // Workers reference components declared after the dispatcher.
  dispatcher_.stop();
}

bool engine::can_sign() const {
  return signer_.has_value();
}

agentid::schema::operation_result<agentid::schema::issuer_record_t>
engine::register_issuer(const register_issuer_request& request) {
  return guarded("register_issuer",
                 [&] { return issuers_.register_issuer(request); });
}

agentid::schema::operation_result<agentid::schema::issuer_record_t>
engine::set_issuer_verified(const std::string_view issuer_id,
                            const bool verified) {
  return guarded("set_issuer_verified",
                 [&] { return issuers_.set_verified(issuer_id, verified); });
}

std::optional<agentid::schema::issuer_record_t> engine::get_issuer(
    const std::string_view issuer_id) const {
  return guarded("get_issuer", [&] { return issuers_.get(issuer_id); });
}

agentid::schema::operation_result<issued_credential> engine::issue_credential(
    const issue_request& request) {
  return guarded("issue_credential", [&] { return lifecycle_.issue(request); });
}

agentid::schema::operation_result<agentid::schema::credential_record_t>
engine::renew_credential(const std::string_view issuer_id,
                         const std::string_view credential_id,
                         const std::optional<int64_t> extend_days) {
  return guarded("renew_credential", [&] {
    return lifecycle_.renew(issuer_id, credential_id, extend_days);
  });
}

agentid::schema::operation_result<agentid::schema::revocation_event_t>
engine::revoke_credential(const std::string_view issuer_id,
                          const std::string_view credential_id,
                          std::optional<std::string> reason) {
  return guarded("revoke_credential", [&] {
    return lifecycle_.revoke(issuer_id, credential_id, std::move(reason));
  });
}

agentid::schema::operation_result<agentid::schema::credential_record_t>
engine::suspend_credential(const std::string_view issuer_id,
                           const std::string_view credential_id) {
  return guarded("suspend_credential", [&] {
    return lifecycle_.suspend(issuer_id, credential_id);
  });
}

agentid::schema::operation_result<agentid::schema::credential_record_t>
engine::reinstate_credential(const std::string_view issuer_id,
                             const std::string_view credential_id) {
  return guarded("reinstate_credential", [&] {
    return lifecycle_.reinstate(issuer_id, credential_id);
  });
}

agentid::schema::operation_result<bulk_outcome> engine::bulk_credentials(
    const bulk_request& request) {
  return guarded("bulk_credentials", [&] { return lifecycle_.bulk(request); });
}

std::optional<agentid::schema::credential_record_t> engine::get_credential(
    const std::string_view credential_id) const {
  return guarded("get_credential",
                 [&] { return lifecycle_.get(credential_id); });
}

std::vector<agentid::schema::credential_record_t> engine::list_credentials(
    const std::string_view issuer_id) const {
  return guarded("list_credentials", [&] { return lifecycle_.list(issuer_id); });
}

verification_response engine::verify(const verify_request& request) {
  return verifier_.verify(request);
}

agentid::schema::operation_result<std::vector<verification_response>>
engine::verify_batch(const std::vector<verify_request>& requests) {
  return verifier_.verify_batch(requests);
}

agentid::schema::operation_result<upsert_policy_outcome> engine::upsert_policy(
    const upsert_policy_request& request) {
  return guarded("upsert_policy", [&] { return policies_.upsert(request); });
}

agentid::schema::operation_result<update_policy_outcome> engine::update_policy(
    const update_policy_request& request) {
  return guarded("update_policy", [&] { return policies_.update(request); });
}

agentid::schema::operation_result<std::size_t> engine::assign_policy(
    const std::string_view issuer_id,
    const std::string_view credential_id,
    const std::string_view policy_id) {
  return guarded("assign_policy", [&] {
    return policies_.assign(issuer_id, credential_id, policy_id);
  });
}

agentid::schema::operation_result<std::size_t> engine::remove_policy(
    const std::string_view issuer_id,
    const std::string_view credential_id) {
  return guarded("remove_policy",
                 [&] { return policies_.remove(issuer_id, credential_id); });
}

agentid::schema::operation_result<std::size_t> engine::delete_policy(
    const std::string_view issuer_id,
    const std::string_view policy_id) {
  return guarded("delete_policy", [&] {
    return policies_.remove_policy(issuer_id, policy_id);
  });
}

std::optional<policy_details> engine::get_policy(
    const std::string_view issuer_id,
    const std::string_view policy_id,
    const std::size_t version_limit) const {
  return guarded("get_policy", [&] {
    return policies_.get(issuer_id, policy_id, version_limit);
  });
}

std::vector<agentid::schema::policy_record_t> engine::list_policies(
    const std::string_view issuer_id) const {
  return guarded("list_policies", [&] { return policies_.list(issuer_id); });
}

agentid::schema::operation_result<agentid::schema::authorization_grant_t>
engine::request_authorization(const grant_request& request) {
  return guarded("request_authorization",
                 [&] { return authorizations_.create_grant(request); });
}

agentid::schema::operation_result<agentid::schema::authorization_grant_t>
engine::respond_authorization(const std::string_view issuer_id,
                              const std::string_view grant_id,
                              const bool approve) {
  return guarded("respond_authorization", [&] {
    return authorizations_.respond(issuer_id, grant_id, approve);
  });
}

agentid::schema::operation_result<agentid::schema::authorization_grant_t>
engine::revoke_authorization(const std::string_view issuer_id,
                             const std::string_view grant_id) {
  return guarded("revoke_authorization",
                 [&] { return authorizations_.revoke(issuer_id, grant_id); });
}

authorization_decision engine::check_authorization(
    const authorization_query& query) {
  try {
    return authorizations_.check(query);
  } catch (const std::exception& e) {
    spdlog::error("check_authorization failed: {}", e.what());
    return authorization_decision{.reason = "Internal error"};
  }
}

std::vector<agentid::schema::authorization_grant_t> engine::list_authorizations(
    const std::string_view credential_id) const {
  return guarded("list_authorizations",
                 [&] { return authorizations_.list(credential_id); });
}

std::optional<agentid::schema::reputation_record_t> engine::reputation(
    const std::string_view credential_id) const {
  return guarded("reputation", [&] { return reputation_.get(credential_id); });
}

std::optional<agentid::schema::issuer_reputation_t> engine::issuer_reputation(
    const std::string_view issuer_id) const {
  return guarded("issuer_reputation",
                 [&] { return reputation_.issuer_reputation(issuer_id); });
}

std::vector<leaderboard_entry> engine::leaderboard(
    const std::size_t limit) const {
  return guarded("leaderboard", [&] { return reputation_.leaderboard(limit); });
}

agentid::schema::operation_result<trust_history> engine::reputation_history(
    const std::string_view credential_id,
    const std::optional<std::size_t> limit,
    const std::optional<uint32_t> days) const {
  using result_t = agentid::schema::operation_result<trust_history>;
  return guarded("reputation_history", [&] {
    if (!repository_.get_credential(credential_id)) {
      return result_t::failure(
          agentid::schema::operation_error_code::credential_not_found,
          "Credential not found");
    }
    return result_t::success(reputation_.history(
        credential_id,
        std::clamp(limit.value_or(kDefaultHistoryLimit), std::size_t{1},
                   kMaxHistoryLimit),
        std::clamp(days.value_or(kDefaultHistoryDays), uint32_t{1},
                   kMaxHistoryDays)));
  });
}

std::vector<agentid::schema::revocation_event_t> engine::revocations(
    agentid::storage::revocation_query query) const {
  query.limit = std::clamp(query.limit, std::size_t{1}, kMaxRevocationPage);
  return guarded("revocations",
                 [&] { return repository_.list_revocations(query); });
}

agentid::events::revocation_bus::subscription_id_t engine::subscribe_revocations(
    agentid::events::revocation_handler_t handler) {
  return bus_.subscribe(std::move(handler));
}

void engine::unsubscribe_revocations(
    const agentid::events::revocation_bus::subscription_id_t id) {
  bus_.unsubscribe(id);
}

agentid::schema::operation_result<agentid::schema::webhook_subscription_t>
engine::create_webhook(const std::string_view issuer_id,
                       std::string url,
                       std::vector<std::string> events) {
  return guarded("create_webhook", [&] {
    return webhooks_.create_subscription(issuer_id, std::move(url),
                                         std::move(events));
  });
}

agentid::schema::operation_result<agentid::schema::webhook_subscription_t>
engine::set_webhook_active(const std::string_view issuer_id,
                           const std::string_view subscription_id,
                           const bool active) {
  return guarded("set_webhook_active", [&] {
    return webhooks_.set_subscription_active(issuer_id, subscription_id,
                                             active);
  });
}

std::vector<agentid::schema::webhook_subscription_t> engine::list_webhooks(
    const std::string_view issuer_id) const {
  return guarded("list_webhooks",
                 [&] { return webhooks_.subscriptions(issuer_id); });
}

std::vector<agentid::schema::audit_entry_t> engine::audit_log(
    const std::string_view issuer_id) const {
  return guarded("audit_log", [&] {
    return repository_.list_audit_entries(std::string{issuer_id});
  });
}

std::vector<agentid::schema::verification_event_t> engine::verification_log(
    std::optional<std::string> credential_id) const {
  return guarded("verification_log", [&] {
    return repository_.list_verification_events(std::move(credential_id));
  });
}

sweep_summary engine::sweep() {
  auto summary = sweep_summary{};
  try {
    summary.expired_credentials = lifecycle_.mark_expired();
    summary.expired_grants = authorizations_.expire_grants();
  } catch (const std::exception& e) {
    spdlog::error("sweep failed: {}", e.what());
  }
  summary.purged_rate_windows = limiter_.purge_expired();
  return summary;
}

void engine::wait_idle() {
  dispatcher_.wait_idle();
}

}  // namespace agentid::execution
