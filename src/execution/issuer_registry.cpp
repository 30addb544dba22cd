#include <agentid/execution/issuer_registry.hpp>

#include <agentid/crypto/random.hpp>

#include <utility>

#include <spdlog/spdlog.h>

namespace agentid::execution {

issuer_registry::issuer_registry(agentid::storage::repository& repository,
                                 const agentid::crypto::signer* signer,
                                 agentid::common::clock_fn_t clock)
    : repository_{repository}, signer_{signer}, clock_{std::move(clock)} {}

agentid::schema::operation_result<agentid::schema::issuer_record_t>
issuer_registry::register_issuer(const register_issuer_request& request) {
  using result_t =
      agentid::schema::operation_result<agentid::schema::issuer_record_t>;
  if (signer_ == nullptr) {
    return result_t::failure(
        agentid::schema::operation_error_code::signing_unavailable,
        "Signing is not configured");
  }
  if (request.name.empty() || request.name.size() > kMaxIssuerNameLength) {
    return result_t::failure(agentid::schema::operation_error_code::invalid_request,
                             "Issuer name must be 1-200 characters");
  }
  auto issuer_id = request.issuer_id.value_or(agentid::crypto::make_uuid());
  if (issuer_id.empty()) {
    return result_t::failure(agentid::schema::operation_error_code::invalid_request,
                             "Issuer id must not be empty");
  }
  if (repository_.get_issuer(issuer_id)) {
    return result_t::failure(agentid::schema::operation_error_code::invalid_request,
                             "Issuer already registered");
  }

  auto keys = signer_->generate_keys(issuer_id);
  auto issuer = agentid::schema::issuer_record_t{
      .issuer_id = std::move(issuer_id),
      .name = request.name,
      .issuer_type = request.issuer_type,
      .verified = request.verified,
      .public_key = std::move(keys.public_key),
      .key_id = std::move(keys.key_id),
      .created_at = clock_()};
  repository_.put_issuer(issuer);
  spdlog::info("Registered issuer {} ({}) with key {}", issuer.issuer_id,
               issuer.name, issuer.key_id);
  return result_t::success(std::move(issuer));
}

agentid::schema::operation_result<agentid::schema::issuer_record_t>
issuer_registry::set_verified(const std::string_view issuer_id,
                              const bool verified) {
  using result_t =
      agentid::schema::operation_result<agentid::schema::issuer_record_t>;
  auto issuer = repository_.get_issuer(issuer_id);
  if (!issuer) {
    return result_t::failure(agentid::schema::operation_error_code::issuer_not_found,
                             "Issuer not found");
  }
  issuer->verified = verified;
  repository_.put_issuer(*issuer);
  return result_t::success(std::move(*issuer));
}

std::optional<agentid::schema::issuer_record_t> issuer_registry::get(
    const std::string_view issuer_id) const {
  return repository_.get_issuer(issuer_id);
}

std::vector<agentid::schema::issuer_record_t> issuer_registry::list() const {
  return repository_.list_issuers();
}

}  // namespace agentid::execution
