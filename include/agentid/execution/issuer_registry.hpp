#pragma once

#include <agentid/common/time.hpp>
#include <agentid/crypto/signer.hpp>
#include <agentid/schema/issuer_record.hpp>
#include <agentid/schema/operation_result.hpp>
#include <agentid/storage/repository.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::execution {

inline constexpr auto kMaxIssuerNameLength = std::size_t{200};

struct register_issuer_request final {
  std::string name;
  agentid::schema::issuer_type_t issuer_type{
      agentid::schema::issuer_type_t::individual};
  bool verified{};
  // Generated when absent.
  std::optional<std::string> issuer_id;
};

/// Issuer registration. The signing key pair is derived from the master
/// secret once, at registration, and only the public half is stored. There
/// is no re-keying: every credential an issuer ever signed verifies against
/// the same key.
class issuer_registry final {
 public:
  /// `signer` may be null in verify-only processes; registration then fails
  /// with signing_unavailable.
  issuer_registry(agentid::storage::repository& repository,
                  const agentid::crypto::signer* signer,
                  agentid::common::clock_fn_t clock);

  agentid::schema::operation_result<agentid::schema::issuer_record_t>
  register_issuer(const register_issuer_request& request);

  agentid::schema::operation_result<agentid::schema::issuer_record_t>
  set_verified(std::string_view issuer_id, bool verified);

  std::optional<agentid::schema::issuer_record_t> get(
      std::string_view issuer_id) const;
  std::vector<agentid::schema::issuer_record_t> list() const;

 private:
  agentid::storage::repository& repository_;
  const agentid::crypto::signer* signer_;
  agentid::common::clock_fn_t clock_;
};

}  // namespace agentid::execution
