#pragma once

#include <agentid/common/time.hpp>
#include <agentid/schema/credential_record.hpp>
#include <agentid/schema/issuer_reputation.hpp>
#include <agentid/schema/reputation_record.hpp>
#include <agentid/schema/trust_score_change.hpp>
#include <agentid/storage/repository.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentid::execution {

inline constexpr auto kVerificationWeight = 0.30;
inline constexpr auto kLongevityWeight = 0.25;
inline constexpr auto kActivityWeight = 0.20;
inline constexpr auto kIssuerWeight = 0.25;

/// Age bands of 30/90/180/365 days, 0..100.
uint32_t longevity_score(agentid::schema::timestamp_milliseconds_t created_at,
                         agentid::schema::timestamp_milliseconds_t now);

/// Success ratio as a percentage plus a volume bonus of one point per ten
/// successful verifications (at most ten). 50 with no history. The bonus
/// counts successes only so that a failure can never raise the score.
uint32_t verification_score(uint64_t total, uint64_t successful);

/// Recency of the last verification: 100 within a day, decaying to 10
/// after 180 days. 50 when the credential was never verified.
uint32_t activity_score(
    std::optional<agentid::schema::timestamp_milliseconds_t> last_verification,
    agentid::schema::timestamp_milliseconds_t now);

/// 100 for a verified issuer, 50 otherwise.
uint32_t issuer_score(bool issuer_verified);

uint32_t trust_score(uint32_t verification,
                     uint32_t longevity,
                     uint32_t activity,
                     bool issuer_verified);

/// Fold one verification outcome into a reputation record, creating it when
/// `existing` is empty.
agentid::schema::reputation_record_t apply_outcome(
    const std::optional<agentid::schema::reputation_record_t>& existing,
    const agentid::schema::credential_record_t& credential,
    bool issuer_verified,
    bool success,
    agentid::schema::timestamp_milliseconds_t now);

/// round((1 - 0.5 * revoke_rate) * success_rate * 100), clamped to 0..100.
uint32_t issuer_trust_score(uint64_t total_credentials,
                            uint64_t revoked_credentials,
                            uint64_t total_verifications,
                            uint64_t successful_verifications);

inline constexpr auto kDefaultHistoryLimit = std::size_t{100};
inline constexpr auto kMaxHistoryLimit = std::size_t{500};
inline constexpr auto kDefaultHistoryDays = uint32_t{30};
inline constexpr auto kMaxHistoryDays = uint32_t{365};

struct trust_score_stats final {
  uint32_t min_score{};
  uint32_t max_score{};
  double average_score{};
  uint64_t total_changes{};
  int64_t net_change{};
  std::string trend;
};

/// Summary over history entries ordered newest first. The net change is
/// newest minus oldest score; beyond +5 the trend is "improving", below -5
/// "declining", otherwise "stable".
std::optional<trust_score_stats> summarize_trust_history(
    const std::vector<agentid::schema::trust_score_change_t>& changes);

struct trust_history final {
  std::string credential_id;
  std::optional<agentid::schema::reputation_record_t> current;
  // Newest first, at most the requested limit.
  std::vector<agentid::schema::trust_score_change_t> changes;
  // Over every change in the period, regardless of the limit.
  std::optional<trust_score_stats> stats;
  uint32_t period_days{};
};

struct leaderboard_entry final {
  uint32_t rank{};
  std::string credential_id;
  std::string agent_id;
  std::string agent_name;
  uint32_t trust_score{};
  uint64_t verification_count{};
  std::string issuer_name;
  bool issuer_verified{};
};

/// Persists per-credential reputation and derives issuer-level figures.
class reputation_aggregator final {
 public:
  reputation_aggregator(agentid::storage::repository& repository,
                        agentid::common::clock_fn_t clock);

  /// Record one verification outcome. Unknown credentials are ignored.
  std::optional<agentid::schema::reputation_record_t> record_outcome(
      std::string_view credential_id,
      bool success);

  std::optional<agentid::schema::reputation_record_t> get(
      std::string_view credential_id) const;

  /// Trust score changes recorded within the last `days` days.
  trust_history history(std::string_view credential_id,
                        std::size_t limit,
                        uint32_t days) const;

  std::optional<agentid::schema::issuer_reputation_t> issuer_reputation(
      std::string_view issuer_id) const;

  /// Highest trust scores among active credentials.
  std::vector<leaderboard_entry> leaderboard(std::size_t limit = 10) const;

 private:
  agentid::storage::repository& repository_;
  agentid::common::clock_fn_t clock_;
  std::mutex mutex_;
};

}  // namespace agentid::execution
