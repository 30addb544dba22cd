#pragma once

#include <agentid/common/time.hpp>
#include <agentid/events/side_effect_dispatcher.hpp>
#include <agentid/execution/reputation.hpp>
#include <agentid/schema/json.hpp>
#include <agentid/schema/verification_event.hpp>
#include <agentid/storage/repository.hpp>
#include <agentid/webhooks/dispatcher.hpp>
#include <string>

namespace agentid::execution {

/// Best-effort bookkeeping attached to request handling. Every call queues
/// work on the dispatcher and returns immediately; failures are logged by
/// the dispatcher and never reach the caller.
class side_effects final {
 public:
  /// `webhooks` and `reputation` may be null to disable that channel.
  side_effects(agentid::events::side_effect_dispatcher& dispatcher,
               agentid::storage::repository& repository,
               agentid::webhooks::dispatcher* webhooks,
               reputation_aggregator* reputation,
               agentid::common::clock_fn_t clock);

  void audit(std::string issuer_id,
             std::string action,
             std::string resource_type,
             std::string resource_id,
             agentid::schema::json_t details);

  void webhook(std::string issuer_id,
               std::string event,
               agentid::schema::json_t data);

  void verification(agentid::schema::verification_event_t event);

  void reputation(std::string credential_id, bool success);

 private:
  agentid::events::side_effect_dispatcher& dispatcher_;
  agentid::storage::repository& repository_;
  agentid::webhooks::dispatcher* webhooks_;
  reputation_aggregator* reputation_;
  agentid::common::clock_fn_t clock_;
};

}  // namespace agentid::execution
