#pragma once

#include "cumulus/cpi/provider.hpp"
#include <caf/actor_system.hpp>
#include <caf/typed_actor.hpp>
#include <caf/typed_event_based_actor.hpp>
#include <caf/replies_to.hpp>
#include <caf/scheduled_actor.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace cumulus {
namespace cpi {

// One-shot dispatch actor: (dispatch, action, params JSON) -> result JSON
using dispatcher_actor = caf::typed_actor<
    caf::replies_to<caf::atom_value, std::string, std::string>::with<std::string>
>;

class DispatchActorState {
public:
    DispatchActorState(caf::scheduled_actor* self, std::shared_ptr<ProviderExtension> provider);

    dispatcher_actor::behavior_type make_behavior();

private:
    caf::scheduled_actor* self_;
    std::shared_ptr<ProviderExtension> provider_;

    std::string handle(const std::string& action, const std::string& params_json);
};

class DispatchActorImpl : public caf::typed_event_based_actor<
    caf::replies_to<caf::atom_value, std::string, std::string>::with<std::string>
> {
public:
    DispatchActorImpl(caf::actor_config& cfg, std::shared_ptr<ProviderExtension> provider)
        : caf::typed_event_based_actor<
            caf::replies_to<caf::atom_value, std::string, std::string>::with<std::string>
          >(cfg),
          state_(this, std::move(provider)) {}

    behavior_type make_behavior() override {
        return state_.make_behavior();
    }
private:
    DispatchActorState state_;
};

/**
 * Runtime host shim
 *
 * Turns a blocking host call into one dispatch on the actor system: each call
 * spawns a detached dispatch actor, waits for its single reply up to the host
 * call timeout and then retires the actor. Always returns a wire-format result.
 */
class ActionHost {
public:
    ActionHost(caf::actor_system& system,
               std::shared_ptr<ProviderExtension> provider,
               int64_t host_call_timeout_ms);

    std::string dispatch_json(const std::string& action, const std::string& params_json);

    ProviderExtension& provider() { return *provider_; }

private:
    caf::actor_system& system_;
    std::shared_ptr<ProviderExtension> provider_;
    int64_t host_call_timeout_ms_;
};

} // namespace cpi
} // namespace cumulus
