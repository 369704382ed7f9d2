#include "cumulus/cpi/actors.hpp"
#include "cumulus/cpi/result_converter.hpp"
#include <caf/atom.hpp>
#include <caf/exit_reason.hpp>
#include <caf/scoped_actor.hpp>
#include <caf/send.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <exception>

namespace cumulus {
namespace cpi {

using json = nlohmann::json;

DispatchActorState::DispatchActorState(caf::scheduled_actor* self,
                                       std::shared_ptr<ProviderExtension> provider)
    : self_(self), provider_(std::move(provider)) {}

dispatcher_actor::behavior_type DispatchActorState::make_behavior() {
    return {
        [this](caf::atom_value dispatch_atom, const std::string& action,
               const std::string& params_json) -> std::string {
            if (dispatch_atom != caf::atom("dispatch")) {
                return ResultConverter::dump(
                    ResultConverter::error_json(action, "", ErrorKind::unsupported_action,
                                                "unexpected request " + caf::to_string(dispatch_atom)));
            }
            return handle(action, params_json);
        }
    };
}

std::string DispatchActorState::handle(const std::string& action, const std::string& params_json) {
    json params;
    if (!params_json.empty()) {
        params = json::parse(params_json, nullptr, false);
        if (params.is_discarded()) {
            return ResultConverter::dump(ResultConverter::error_json(
                action, "", ErrorKind::invalid_parameters, "parameters are not valid JSON"));
        }
    }

    try {
        ActionResult result = provider_->dispatch(action, params);
        return ResultConverter::dump(ResultConverter::to_wire_json(result));
    } catch (const std::exception& e) {
        return ResultConverter::dump(ResultConverter::error_json(
            action, "", ErrorKind::unknown_backend_error, std::string("dispatch failed: ") + e.what()));
    }
}

ActionHost::ActionHost(caf::actor_system& system,
                       std::shared_ptr<ProviderExtension> provider,
                       int64_t host_call_timeout_ms)
    : system_(system),
      provider_(std::move(provider)),
      host_call_timeout_ms_(host_call_timeout_ms) {}

std::string ActionHost::dispatch_json(const std::string& action, const std::string& params_json) {
    auto dispatcher = system_.spawn<DispatchActorImpl, caf::detached>(provider_);

    std::string reply;
    caf::scoped_actor self{system_};
    self->request(dispatcher, std::chrono::milliseconds(host_call_timeout_ms_),
                  caf::atom("dispatch"), action, params_json)
        .receive(
            [&](std::string& result) {
                reply = std::move(result);
            },
            [&](caf::error& err) {
                reply = ResultConverter::dump(ResultConverter::error_json(
                    action, "", ErrorKind::unknown_backend_error, "host call failed: " + caf::to_string(err)));
            });

    self->send_exit(dispatcher, caf::exit_reason::user_shutdown);
    return reply;
}

} // namespace cpi
} // namespace cumulus
