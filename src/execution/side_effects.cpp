#include <agentid/execution/side_effects.hpp>

#include <utility>

namespace agentid::execution {

side_effects::side_effects(agentid::events::side_effect_dispatcher& dispatcher,
                           agentid::storage::repository& repository,
                           agentid::webhooks::dispatcher* webhooks,
                           reputation_aggregator* reputation,
                           agentid::common::clock_fn_t clock)
    : dispatcher_{dispatcher},
      repository_{repository},
      webhooks_{webhooks},
      reputation_{reputation},
      clock_{std::move(clock)} {}

void side_effects::audit(std::string issuer_id,
                         std::string action,
                         std::string resource_type,
                         std::string resource_id,
                         agentid::schema::json_t details) {
  auto entry = agentid::schema::audit_entry_t{
      .issuer_id = std::move(issuer_id),
      .action = std::move(action),
      .resource_type = std::move(resource_type),
      .resource_id = std::move(resource_id),
      .details = std::move(details),
      .recorded_at = clock_()};
  auto name = "audit " + entry.action;
  dispatcher_.submit(std::move(name), [this, entry = std::move(entry)]() {
    repository_.append_audit_entry(entry);
  });
}

void side_effects::webhook(std::string issuer_id,
                           std::string event,
                           agentid::schema::json_t data) {
  if (webhooks_ == nullptr) {
    return;
  }
  auto name = "webhook " + event;
  dispatcher_.submit(std::move(name), [this, issuer_id = std::move(issuer_id),
                                       event = std::move(event),
                                       data = std::move(data)]() {
    webhooks_->trigger(issuer_id, event, data);
  });
}

void side_effects::verification(agentid::schema::verification_event_t event) {
  dispatcher_.submit("verification log", [this, event = std::move(event)]() {
    repository_.append_verification_event(event);
  });
}

void side_effects::reputation(std::string credential_id, const bool success) {
  if (reputation_ == nullptr) {
    return;
  }
  dispatcher_.submit("reputation",
                     [this, credential_id = std::move(credential_id), success]() {
                       reputation_->record_outcome(credential_id, success);
                     });
}

}  // namespace agentid::execution
