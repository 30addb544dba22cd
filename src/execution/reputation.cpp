#include <agentid/execution/reputation.hpp>

#include <agentid/schema/credential_status.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace agentid::execution {

namespace {

uint64_t whole_days(const agentid::schema::timestamp_milliseconds_t from,
                    const agentid::schema::timestamp_milliseconds_t to) {
  if (to <= from) {
    return 0;
  }
  return (to - from) / agentid::schema::kMillisecondsPerDay;
}

uint32_t clamp_score(const double value) {
  return static_cast<uint32_t>(std::clamp(std::lround(value), 0L, 100L));
}

}  // namespace

uint32_t longevity_score(
    const agentid::schema::timestamp_milliseconds_t created_at,
    const agentid::schema::timestamp_milliseconds_t now) {
  auto days = whole_days(created_at, now);
  if (days >= 365) {
    return 100;
  }
  if (days >= 180) {
    return static_cast<uint32_t>(75 + (days - 180) * 25 / 185);
  }
  if (days >= 90) {
    return static_cast<uint32_t>(50 + (days - 90) * 25 / 90);
  }
  if (days >= 30) {
    return static_cast<uint32_t>(25 + (days - 30) * 25 / 60);
  }
  return static_cast<uint32_t>(days * 25 / 30);
}

uint32_t verification_score(const uint64_t total, const uint64_t successful) {
  if (total == 0) {
    return 50;
  }
  auto rate = static_cast<double>(std::min(successful, total)) /
              static_cast<double>(total);
  auto bonus = std::min<uint64_t>(10, successful / 10);
  return clamp_score(std::round(rate * 100.0) + static_cast<double>(bonus));
}

uint32_t activity_score(
    const std::optional<agentid::schema::timestamp_milliseconds_t>
        last_verification,
    const agentid::schema::timestamp_milliseconds_t now) {
  if (!last_verification) {
    return 50;
  }
  auto days = whole_days(*last_verification, now);
  if (days <= 1) {
    return 100;
  }
  if (days <= 7) {
    return static_cast<uint32_t>(100 - (days - 1) * 20 / 6);
  }
  if (days <= 30) {
    return static_cast<uint32_t>(80 - (days - 7) * 30 / 23);
  }
  if (days <= 90) {
    return static_cast<uint32_t>(50 - (days - 30) * 25 / 60);
  }
  if (days <= 180) {
    return static_cast<uint32_t>(25 - (days - 90) * 15 / 90);
  }
  return 10;
}

uint32_t issuer_score(const bool issuer_verified) {
  return issuer_verified ? 100 : 50;
}

uint32_t trust_score(const uint32_t verification,
                     const uint32_t longevity,
                     const uint32_t activity,
                     const bool issuer_verified) {
  return clamp_score(verification * kVerificationWeight +
                     longevity * kLongevityWeight +
                     activity * kActivityWeight +
                     issuer_score(issuer_verified) * kIssuerWeight);
}

agentid::schema::reputation_record_t apply_outcome(
    const std::optional<agentid::schema::reputation_record_t>& existing,
    const agentid::schema::credential_record_t& credential,
    const bool issuer_verified,
    const bool success,
    const agentid::schema::timestamp_milliseconds_t now) {
  auto record = existing.value_or(agentid::schema::reputation_record_t{
      .credential_id = credential.credential_id,
      .agent_id = credential.agent_id,
      .issuer_id = credential.issuer_id});
  ++record.total_verifications;
  if (success) {
    ++record.successful_verifications;
  } else {
    ++record.failed_verifications;
  }
  record.last_verification_at = now;
  record.longevity_score = longevity_score(credential.created_at, now);
  record.verification_score = verification_score(
      record.total_verifications, record.successful_verifications);
  record.activity_score = activity_score(record.last_verification_at, now);
  record.trust_score =
      trust_score(record.verification_score, record.longevity_score,
                  record.activity_score, issuer_verified);
  record.updated_at = now;
  return record;
}

uint32_t issuer_trust_score(const uint64_t total_credentials,
                            const uint64_t revoked_credentials,
                            const uint64_t total_verifications,
                            const uint64_t successful_verifications) {
  auto revoke_rate = total_credentials > 0
                         ? static_cast<double>(revoked_credentials) /
                               static_cast<double>(total_credentials)
                         : 0.0;
  auto success_rate = total_verifications > 0
                          ? static_cast<double>(successful_verifications) /
                                static_cast<double>(total_verifications)
                          : 1.0;
  return clamp_score((1.0 - revoke_rate * 0.5) * success_rate * 100.0);
}

std::optional<trust_score_stats> summarize_trust_history(
    const std::vector<agentid::schema::trust_score_change_t>& changes) {
  if (changes.empty()) {
    return std::nullopt;
  }
  auto stats = trust_score_stats{.min_score = changes.front().trust_score,
                                 .max_score = changes.front().trust_score,
                                 .total_changes = changes.size()};
  auto sum = 0.0;
  for (const auto& change : changes) {
    stats.min_score = std::min(stats.min_score, change.trust_score);
    stats.max_score = std::max(stats.max_score, change.trust_score);
    sum += change.trust_score;
  }
  stats.average_score =
      std::round(sum / static_cast<double>(changes.size()) * 10.0) / 10.0;
  stats.net_change = static_cast<int64_t>(changes.front().trust_score) -
                     static_cast<int64_t>(changes.back().trust_score);
  if (stats.net_change > 5) {
    stats.trend = "improving";
  } else if (stats.net_change < -5) {
    stats.trend = "declining";
  } else {
    stats.trend = "stable";
  }
  return stats;
}

reputation_aggregator::reputation_aggregator(
    agentid::storage::repository& repository,
    agentid::common::clock_fn_t clock)
    : repository_{repository}, clock_{std::move(clock)} {}

std::optional<agentid::schema::reputation_record_t>
reputation_aggregator::record_outcome(const std::string_view credential_id,
                                      const bool success) {
  auto credential = repository_.get_credential(credential_id);
  if (!credential) {
    spdlog::debug("reputation: credential '{}' not found", credential_id);
    return std::nullopt;
  }
  auto issuer = repository_.get_issuer(credential->issuer_id);
  auto issuer_verified = issuer && issuer->verified;

  auto lock = std::scoped_lock{mutex_};
  auto previous = repository_.get_reputation(credential_id);
  auto record =
      apply_outcome(previous, *credential, issuer_verified, success, clock_());
  if (previous && previous->trust_score == record.trust_score) {
    repository_.put_reputation(record);
    return record;
  }

  auto change = agentid::schema::trust_score_change_t{
      .credential_id = record.credential_id,
      .trust_score = record.trust_score,
      .verification_score = record.verification_score,
      .longevity_score = record.longevity_score,
      .activity_score = record.activity_score,
      .issuer_score = issuer_score(issuer_verified),
      .change_reason = previous ? "verification" : "initial",
      .change_delta =
          previous ? static_cast<int32_t>(record.trust_score) -
                         static_cast<int32_t>(previous->trust_score)
                   : 0,
      .recorded_at = record.updated_at};
  repository_.put_reputation(record, std::move(change));
  return record;
}

std::optional<agentid::schema::reputation_record_t> reputation_aggregator::get(
    const std::string_view credential_id) const {
  return repository_.get_reputation(credential_id);
}

trust_history reputation_aggregator::history(
    const std::string_view credential_id,
    const std::size_t limit,
    const uint32_t days) const {
  auto out = trust_history{.credential_id = std::string{credential_id},
                           .current = repository_.get_reputation(credential_id),
                           .period_days = days};
  auto now = clock_();
  auto window = static_cast<uint64_t>(days) * agentid::schema::kMillisecondsPerDay;
  auto since = now > window ? now - window : 0;

  auto changes = repository_.list_trust_history(credential_id);
  std::erase_if(changes, [since](const auto& change) {
    return change.recorded_at < since;
  });
  std::ranges::reverse(changes);
  out.stats = summarize_trust_history(changes);
  if (changes.size() > limit) {
    changes.resize(limit);
  }
  out.changes = std::move(changes);
  return out;
}

std::optional<agentid::schema::issuer_reputation_t>
reputation_aggregator::issuer_reputation(
    const std::string_view issuer_id) const {
  if (!repository_.get_issuer(issuer_id)) {
    return std::nullopt;
  }
  auto result = agentid::schema::issuer_reputation_t{
      .issuer_id = std::string{issuer_id}};
  for (const auto& credential :
       repository_.list_credentials_by_issuer(issuer_id)) {
    ++result.total_credentials;
    switch (credential.status) {
      case agentid::schema::credential_status_t::active:
        ++result.active_credentials;
        break;
      case agentid::schema::credential_status_t::revoked:
        ++result.revoked_credentials;
        break;
      case agentid::schema::credential_status_t::expired:
        ++result.expired_credentials;
        break;
      case agentid::schema::credential_status_t::suspended:
        break;
    }
    if (auto reputation = repository_.get_reputation(credential.credential_id)) {
      result.total_verifications += reputation->total_verifications;
      result.successful_verifications += reputation->successful_verifications;
    }
  }
  result.trust_score = issuer_trust_score(
      result.total_credentials, result.revoked_credentials,
      result.total_verifications, result.successful_verifications);
  return result;
}

std::vector<leaderboard_entry> reputation_aggregator::leaderboard(
    const std::size_t limit) const {
  auto ranked = std::vector<std::pair<agentid::schema::reputation_record_t,
                                      agentid::schema::credential_record_t>>{};
  for (auto& reputation : repository_.list_reputations()) {
    auto credential = repository_.get_credential(reputation.credential_id);
    if (!credential ||
        credential->status != agentid::schema::credential_status_t::active) {
      continue;
    }
    ranked.emplace_back(std::move(reputation), std::move(*credential));
  }
  std::ranges::stable_sort(ranked, [](const auto& lhs, const auto& rhs) {
    return lhs.first.trust_score > rhs.first.trust_score;
  });
  if (ranked.size() > limit) {
    ranked.resize(limit);
  }

  auto issuers =
      std::unordered_map<std::string,
                         std::optional<agentid::schema::issuer_record_t>>{};
  auto out = std::vector<leaderboard_entry>{};
  out.reserve(ranked.size());
  for (const auto& [reputation, credential] : ranked) {
    auto [it, inserted] = issuers.try_emplace(credential.issuer_id);
    if (inserted) {
      it->second = repository_.get_issuer(credential.issuer_id);
    }
    out.push_back(leaderboard_entry{
        .rank = static_cast<uint32_t>(out.size() + 1),
        .credential_id = credential.credential_id,
        .agent_id = credential.agent_id,
        .agent_name = credential.agent_name,
        .trust_score = reputation.trust_score,
        .verification_count = reputation.total_verifications,
        .issuer_name = it->second ? it->second->name : std::string{},
        .issuer_verified = it->second && it->second->verified});
  }
  return out;
}

}  // namespace agentid::execution
