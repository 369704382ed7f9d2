#pragma once

#include "cumulus/cpi/action_catalog.hpp"
#include "cumulus/cpi/backend_client.hpp"
#include "cumulus/cpi/config.hpp"
#include "cumulus/cpi/core.hpp"
#include "cumulus/cpi/observability.hpp"
#include "cumulus/cpi/provider.hpp"
#include "cumulus/cpi/session_registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include <caf/error.hpp>

namespace cumulus {
namespace cpi {

// One validated request as seen by a handler
struct ActionContext {
    std::string action;
    std::string region;
    nlohmann::json params;   // Canonical names only, defaults applied

    bool has(const std::string& name) const;
    std::string string_param(const std::string& name) const;
    std::optional<std::string> optional_string(const std::string& name) const;
    int64_t int_param(const std::string& name, int64_t fallback = 0) const;
    bool bool_param(const std::string& name, bool fallback = false) const;
    TagMap tags_param(const std::string& name) const;
};

/**
 * EC2 action dispatcher
 *
 * Validates a request against the action catalog, selects the region session,
 * runs the handler and turns every outcome into exactly one ActionResult.
 * Composite actions run their steps in order and report later-step failures as
 * warnings on a partial success; nothing is rolled back.
 */
class ActionDispatcher : public ProviderExtension {
public:
    ActionDispatcher(std::shared_ptr<SessionRegistry> sessions,
                     AdapterConfig config,
                     std::shared_ptr<Observability> observability,
                     const ActionCatalog& catalog = ActionCatalog::ec2());

    std::string name() const override { return "ec2"; }
    std::string provider_type() const override { return "cloud"; }

    std::vector<std::string> list_actions() const override;
    std::optional<ActionDefinition> action_definition(const std::string& action) const override;

    ActionResult dispatch(const std::string& action, const nlohmann::json& params) override;

    const AdapterConfig& config() const { return config_; }
    std::shared_ptr<Observability> observability() const { return observability_; }

private:
    using Handler = ActionResult (ActionDispatcher::*)(const BackendClient&, const ActionContext&);

    std::shared_ptr<SessionRegistry> sessions_;
    AdapterConfig config_;
    std::shared_ptr<Observability> observability_;
    const ActionCatalog& catalog_;
    std::unordered_map<std::string, Handler> handlers_;

    ActionResult run(const std::string& action, const nlohmann::json& params, std::string& region);

    // Workers
    ActionResult test_install(const BackendClient& client, const ActionContext& ctx);
    ActionResult list_workers(const BackendClient& client, const ActionContext& ctx);
    ActionResult create_worker(const BackendClient& client, const ActionContext& ctx);
    ActionResult delete_worker(const BackendClient& client, const ActionContext& ctx);
    ActionResult get_worker(const BackendClient& client, const ActionContext& ctx);
    ActionResult has_worker(const BackendClient& client, const ActionContext& ctx);
    ActionResult start_worker(const BackendClient& client, const ActionContext& ctx);
    ActionResult reboot_worker(const BackendClient& client, const ActionContext& ctx);
    ActionResult set_worker_metadata(const BackendClient& client, const ActionContext& ctx);

    // Volumes
    ActionResult get_volumes(const BackendClient& client, const ActionContext& ctx);
    ActionResult has_volume(const BackendClient& client, const ActionContext& ctx);
    ActionResult create_volume(const BackendClient& client, const ActionContext& ctx);
    ActionResult delete_volume(const BackendClient& client, const ActionContext& ctx);
    ActionResult attach_volume(const BackendClient& client, const ActionContext& ctx);
    ActionResult detach_volume(const BackendClient& client, const ActionContext& ctx);

    // Snapshots
    ActionResult create_snapshot(const BackendClient& client, const ActionContext& ctx);
    ActionResult delete_snapshot(const BackendClient& client, const ActionContext& ctx);
    ActionResult has_snapshot(const BackendClient& client, const ActionContext& ctx);

    void wait_for_running(const BackendClient& client, const ActionContext& ctx,
                          Worker& worker, std::vector<ActionWarning>& warnings);

    // Re-reads the volume after attach/detach. A describe that still shows the
    // pre-call attachment is overridden by the attachment record.
    ActionResult refresh_volume(const BackendClient& client, const ActionContext& ctx,
                                const NativeVolumeAttachment& attachment, bool attaching);

    static ActionResult failure_from(const caf::error& err);
    static std::string describe_failure(const caf::error& err);
};

} // namespace cpi
} // namespace cumulus
