#pragma once

#include <agentid/common/time.hpp>
#include <agentid/execution/permission_evaluator.hpp>
#include <agentid/execution/policy_engine.hpp>
#include <agentid/execution/rate_limiter.hpp>
#include <agentid/execution/side_effects.hpp>
#include <agentid/schema/json.hpp>
#include <agentid/schema/operation_result.hpp>
#include <agentid/schema/verify_error_code.hpp>
#include <agentid/storage/repository.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentid::execution {

inline constexpr auto kMaxBatchVerifications = std::size_t{100};

struct permission_check_request final {
  std::string action;
  std::optional<std::string> resource;
  // Caller's region, e.g. a country code taken from the edge.
  std::optional<std::string> region;
};

/// Exactly one of `credential_id` and `credential` should be set. When both
/// are present the id wins.
struct verify_request final {
  std::optional<std::string> credential_id;
  std::optional<agentid::schema::json_t> credential;
  std::optional<permission_check_request> check_permission;
};

struct verify_error final {
  agentid::schema::verify_error_code code{
      agentid::schema::verify_error_code::internal_error};
  std::string message;
};

struct verified_credential final {
  std::string credential_id;
  std::string agent_id;
  std::string agent_name;
  std::string agent_type;
  agentid::schema::json_t issuer = agentid::schema::json_t::object();
  agentid::schema::json_t permissions = agentid::schema::json_t::array();
  agentid::schema::timestamp_milliseconds_t valid_until{};
};

struct verified_policy final {
  std::string policy_id;
  std::string name;
  uint32_t version{};
};

struct verification_response final {
  bool valid{};
  std::string request_id;
  uint64_t verification_time_ms{};
  std::optional<verified_credential> credential;
  std::optional<verify_error> error;
  std::optional<verified_policy> policy;
  bool live_permissions{};
  std::optional<permission_check_result> permission_check;
};

/// `req_<base36 milliseconds>_<6 random base36 characters>`.
std::string make_request_id(agentid::schema::timestamp_milliseconds_t now);

/// Response envelope as relying parties receive it.
agentid::schema::json_t to_json(const verification_response& response);

/// Answers "is this credential valid right now, and what may it do?".
///
/// Checks run in a fixed order and stop at the first failure: resolve the
/// credential and issuer, status, validity window, signature. Each call logs
/// a verification event and feeds reputation through the side-effect
/// dispatcher; neither can change or delay the answer.
class verifier final {
 public:
  /// `limiter` may be null, in which case permission rate limits are noted
  /// but not counted.
  verifier(agentid::storage::repository& repository,
           const policy_engine& policies,
           side_effects& effects,
           rate_limiter* limiter,
           agentid::common::clock_fn_t clock);

  verification_response verify(const verify_request& request);

  /// Answer up to 100 requests independently, in order.
  agentid::schema::operation_result<std::vector<verification_response>>
  verify_batch(const std::vector<verify_request>& requests);

 private:
  struct resolved final {
    std::optional<std::string> credential_id;
    std::optional<std::string> agent_id;
    std::optional<std::string> issuer_id;
  };

  verification_response evaluate(const verify_request& request,
                                 resolved& subject);

  void record(const verification_response& response, const resolved& subject);

  agentid::storage::repository& repository_;
  const policy_engine& policies_;
  side_effects& effects_;
  rate_limiter* limiter_;
  agentid::common::clock_fn_t clock_;
};

}  // namespace agentid::execution
