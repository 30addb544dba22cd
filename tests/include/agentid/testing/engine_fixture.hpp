#pragma once

#include <agentid/crypto/signer.hpp>
#include <agentid/execution/engine.hpp>
#include <agentid/storage/repository.hpp>
#include <agentid/storage/rocksdb/storage.hpp>
#include <agentid/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

namespace agentid::testing {

inline constexpr auto kTestSecret =
    std::string_view{"test-master-secret-0123456789abcdef"};

/// Storage, repository and engine on a throwaway RocksDB directory with a
/// manual clock.
class engine_fixture final {
 public:
  explicit engine_fixture(
      const std::string_view db_prefix,
      const bool signing = true,
      agentid::webhooks::webhook_transport* transport = nullptr)
      : db_path_{make_db_path(db_prefix)},
        storage_{agentid::storage::make_storage<
            agentid::storage::rocksdb_storage_tag>(db_path_)},
        repository_{storage_},
        engine_{repository_, make_options(signing, transport), clock_.fn()} {}

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;

  ~engine_fixture() {
    engine_.wait_idle();
    remove_path(db_path_);
  }

  manual_clock& clock() { return clock_; }
  agentid::storage::repository& repository() { return repository_; }
  agentid::execution::engine& engine() { return engine_; }

  agentid::schema::issuer_record_t register_issuer(
      const std::string& name = "Acme Robotics",
      const bool verified = false) {
    auto result = engine_.register_issuer(
        agentid::execution::register_issuer_request{.name = name,
                                                    .verified = verified});
    EXPECT_TRUE(result.ok()) << result.message;
    return result.value;
  }

  agentid::execution::issue_request make_issue(
      const std::string& issuer_id,
      const std::string& agent_id,
      const uint64_t days = 30) const {
    return agentid::execution::issue_request{
        .issuer_id = issuer_id,
        .agent_id = agent_id,
        .agent_name = "Agent " + agent_id,
        .agent_type = "autonomous",
        .permissions = agentid::schema::json_t::array({"read", "write"}),
        .valid_until =
            clock_.now() + days * agentid::schema::kMillisecondsPerDay};
  }

  agentid::execution::issued_credential issue(const std::string& issuer_id,
                                              const std::string& agent_id,
                                              const uint64_t days = 30) {
    auto result = engine_.issue_credential(make_issue(issuer_id, agent_id, days));
    EXPECT_TRUE(result.ok()) << result.message;
    return result.value;
  }

 private:
  static agentid::execution::engine_options make_options(
      const bool signing,
      agentid::webhooks::webhook_transport* transport) {
    auto options = agentid::execution::engine_options{.transport = transport,
                                                      .worker_count = 1};
    if (signing) {
      options.secret = agentid::crypto::master_secret{std::string{kTestSecret}};
    }
    return options;
  }

  std::string db_path_;
  manual_clock clock_;
  agentid::storage::rocksdb_storage_t storage_;
  agentid::storage::repository repository_;
  agentid::execution::engine engine_;
};

}  // namespace agentid::testing
