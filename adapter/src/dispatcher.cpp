#include "cumulus/cpi/dispatcher.hpp"
#include "cumulus/cpi/error_classifier.hpp"
#include "cumulus/cpi/resource_mapper.hpp"
#include "cumulus/cpi/result_converter.hpp"
#include "cumulus/cpi/wait_policy.hpp"
#include <opentelemetry/trace/span.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <thread>

namespace cumulus {
namespace cpi {

using json = nlohmann::json;

namespace {

std::vector<NativeTag> to_native_tags(const TagMap& tags) {
    std::vector<NativeTag> result(tags.begin(), tags.end());
    std::sort(result.begin(), result.end());
    return result;
}

// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF
bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + length > text.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }
        static const uint32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < min_for_length[length] || code_point > 0x10FFFF
            || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

} // namespace

// ActionContext

bool ActionContext::has(const std::string& name) const {
    auto it = params.find(name);
    return it != params.end() && !it->is_null();
}

std::string ActionContext::string_param(const std::string& name) const {
    auto it = params.find(name);
    if (it == params.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::optional<std::string> ActionContext::optional_string(const std::string& name) const {
    auto it = params.find(name);
    if (it == params.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

int64_t ActionContext::int_param(const std::string& name, int64_t fallback) const {
    auto it = params.find(name);
    if (it == params.end() || !it->is_number_integer()) {
        return fallback;
    }
    return it->get<int64_t>();
}

bool ActionContext::bool_param(const std::string& name, bool fallback) const {
    auto it = params.find(name);
    if (it == params.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

TagMap ActionContext::tags_param(const std::string& name) const {
    TagMap tags;
    auto it = params.find(name);
    if (it == params.end() || !it->is_object()) {
        return tags;
    }
    for (const auto& item : it->items()) {
        if (item.value().is_string()) {
            tags[item.key()] = item.value().get<std::string>();
        }
    }
    return tags;
}

// ActionDispatcher

ActionDispatcher::ActionDispatcher(std::shared_ptr<SessionRegistry> sessions,
                                   AdapterConfig config,
                                   std::shared_ptr<Observability> observability,
                                   const ActionCatalog& catalog)
    : sessions_(std::move(sessions)),
      config_(std::move(config)),
      observability_(std::move(observability)),
      catalog_(catalog) {
    if (!observability_) {
        observability_ = Observability::from_config(name(), config_);
    }

    handlers_ = {
        {"test_install", &ActionDispatcher::test_install},
        {"list_workers", &ActionDispatcher::list_workers},
        {"create_worker", &ActionDispatcher::create_worker},
        {"delete_worker", &ActionDispatcher::delete_worker},
        {"get_worker", &ActionDispatcher::get_worker},
        {"has_worker", &ActionDispatcher::has_worker},
        {"start_worker", &ActionDispatcher::start_worker},
        {"reboot_worker", &ActionDispatcher::reboot_worker},
        {"set_worker_metadata", &ActionDispatcher::set_worker_metadata},
        {"get_volumes", &ActionDispatcher::get_volumes},
        {"has_volume", &ActionDispatcher::has_volume},
        {"create_volume", &ActionDispatcher::create_volume},
        {"delete_volume", &ActionDispatcher::delete_volume},
        {"attach_volume", &ActionDispatcher::attach_volume},
        {"detach_volume", &ActionDispatcher::detach_volume},
        {"create_snapshot", &ActionDispatcher::create_snapshot},
        {"snapshot_volume", &ActionDispatcher::create_snapshot},
        {"delete_snapshot", &ActionDispatcher::delete_snapshot},
        {"has_snapshot", &ActionDispatcher::has_snapshot}
    };
}

std::vector<std::string> ActionDispatcher::list_actions() const {
    return catalog_.names();
}

std::optional<ActionDefinition> ActionDispatcher::action_definition(const std::string& action) const {
    const ActionDefinition* definition = catalog_.find(action);
    if (definition == nullptr) {
        return std::nullopt;
    }
    return *definition;
}

ActionResult ActionDispatcher::dispatch(const std::string& action, const json& params) {
    auto start_time = std::chrono::steady_clock::now();
    std::string region = config_.default_region;

    observability_->log_debug("Dispatching action", action, region);

    ActionResult result = run(action, params, region);

    result.metadata.action = action;
    result.metadata.region = region;
    result.latency_ms = elapsed_ms(start_time);

    std::string status = ResultConverter::status_to_string(result.status);
    observability_->record_action(action, status, static_cast<double>(result.latency_ms) / 1000.0);

    std::unordered_map<std::string, std::string> context = {
        {"status", status},
        {"latency_ms", std::to_string(result.latency_ms)}
    };

    if (result.is_error()) {
        std::string kind = ErrorClassifier::kind_to_string(result.error_kind);
        observability_->record_backend_error(action, kind);
        context["error_kind"] = kind;
        context["error_message"] = result.error_message;
        observability_->log_error("Action failed", action, region, context);
    } else if (result.is_partial()) {
        for (const auto& warning : result.warnings) {
            observability_->record_backend_error(action, ErrorClassifier::kind_to_string(warning.kind));
        }
        context["warnings"] = std::to_string(result.warnings.size());
        observability_->log_warn("Action completed with warnings", action, region, context);
    } else {
        observability_->log_info("Action completed", action, region, context);
    }

    return result;
}

ActionResult ActionDispatcher::run(const std::string& action, const json& params, std::string& region) {
    // Report the requested region even when validation fails
    if (params.is_object()) {
        auto it = params.find("region");
        if (it != params.end() && it->is_string()) {
            region = it->get<std::string>();
        }
    }

    if (!is_valid_utf8(action)) {
        return ActionResult::failure(ErrorKind::unsupported_action,
                                     "unsupported action: name is not valid UTF-8");
    }

    const ActionDefinition* definition = catalog_.find(action);
    auto handler_it = handlers_.find(action);
    if (definition == nullptr || handler_it == handlers_.end()) {
        return ActionResult::failure(ErrorKind::unsupported_action,
                                     "unsupported action '" + action + "'");
    }

    auto normalized = catalog_.normalize(*definition, params);
    if (!normalized) {
        return failure_from(normalized.error());
    }

    ActionContext ctx;
    ctx.action = action;
    ctx.region = normalized->value("region", config_.default_region);
    ctx.params = std::move(*normalized);
    region = ctx.region;

    auto session = sessions_->session_for(ctx.region);
    if (!session) {
        return failure_from(session.error());
    }
    observability_->set_sessions(static_cast<int64_t>(sessions_->size()));

    auto span = observability_->start_action_span(action, ctx.region);
    ActionResult result;
    try {
        result = (this->*(handler_it->second))(**session, ctx);
    } catch (const std::exception& e) {
        result = ActionResult::failure(ErrorKind::unknown_backend_error,
                                       std::string("unexpected failure: ") + e.what());
    }

    if (result.is_error()) {
        span->SetStatus(opentelemetry::trace::StatusCode::kError, result.error_message);
    } else {
        span->SetStatus(opentelemetry::trace::StatusCode::kOk);
    }
    span->End();
    return result;
}

ActionResult ActionDispatcher::failure_from(const caf::error& err) {
    return ActionResult::failure(ErrorClassifier::classify(err), describe_failure(err));
}

std::string ActionDispatcher::describe_failure(const caf::error& err) {
    if (is_backend_error(err)) {
        BackendError native = to_backend_error(err);
        if (!native.code.empty()) {
            return native.code + ": " + native.message;
        }
        return native.message;
    }
    return error_message(err);
}

// Workers

ActionResult ActionDispatcher::test_install(const BackendClient& client, const ActionContext&) {
    auto regions = client.describe_regions();
    if (!regions) {
        return ActionResult::failure(ErrorKind::authentication_error,
                                     "credential check failed: " + describe_failure(regions.error()));
    }
    return ActionResult::success();
}

ActionResult ActionDispatcher::list_workers(const BackendClient& client, const ActionContext& ctx) {
    auto instances = client.describe_instances({});
    if (!instances) {
        return failure_from(instances.error());
    }
    std::vector<Worker> workers;
    workers.reserve(instances->size());
    for (const auto& instance : *instances) {
        workers.push_back(ResourceMapper::map_worker(instance, ctx.region));
    }
    return ActionResult::success(std::move(workers));
}

ActionResult ActionDispatcher::create_worker(const BackendClient& client, const ActionContext& ctx) {
    RunInstanceSpec spec;
    spec.image_id = ctx.string_param("image_id");
    spec.instance_type = ctx.string_param("instance_type");
    spec.key_name = ctx.optional_string("key_name");
    spec.subnet_id = ctx.optional_string("subnet_id");

    auto launched = client.run_instance(spec);
    if (!launched) {
        return failure_from(launched.error());
    }

    Worker worker = ResourceMapper::map_worker(*launched, ctx.region);
    std::vector<ActionWarning> warnings;

    if (ctx.bool_param("wait_for_running")) {
        wait_for_running(client, ctx, worker, warnings);
    }

    // Tags go on even if the wait failed; the instance exists either way
    TagMap tags = ctx.tags_param("tags");
    if (auto worker_name = ctx.optional_string("worker_name")) {
        tags["Name"] = *worker_name;
    }
    if (!tags.empty()) {
        auto tagged = client.create_tags(worker.id, to_native_tags(tags));
        if (tagged) {
            for (const auto& [key, value] : tags) {
                worker.tags[key] = value;
            }
        } else {
            warnings.push_back({ErrorClassifier::classify(tagged.error()), "apply_tags",
                                describe_failure(tagged.error())});
        }
    }

    if (!warnings.empty()) {
        return ActionResult::partial_success(std::move(worker), std::move(warnings));
    }
    return ActionResult::success(std::move(worker));
}

void ActionDispatcher::wait_for_running(const BackendClient& client, const ActionContext& ctx,
                                        Worker& worker, std::vector<ActionWarning>& warnings) {
    WaitPolicy::Config wait_config;
    wait_config.poll_interval_ms = config_.wait_poll_interval_ms;
    wait_config.ceiling_ms = config_.wait_timeout_ms;
    wait_config.host_budget_ms = config_.host_call_timeout_ms;
    WaitPolicy policy(wait_config);

    int64_t timeout_ms = policy.effective_timeout_ms(ctx.int_param("wait_timeout_ms", -1));
    auto started = std::chrono::steady_clock::now();

    while (true) {
        auto described = client.describe_instances({worker.id});
        if (described) {
            auto match = std::find_if(described->begin(), described->end(),
                                      [&](const NativeInstance& i) { return i.instance_id == worker.id; });
            if (match != described->end()) {
                TagMap known_tags = worker.tags;
                worker = ResourceMapper::map_worker(*match, ctx.region);
                worker.tags.insert(known_tags.begin(), known_tags.end());

                if (WaitPolicy::is_target_state(worker.state)) {
                    return;
                }
                if (WaitPolicy::is_dead_end_state(worker.state)) {
                    warnings.push_back({ErrorKind::conflict, "wait_for_running",
                                        "worker " + worker.id + " entered state "
                                            + ResultConverter::worker_state_to_string(worker.state)
                                            + " while waiting for running"});
                    return;
                }
            }
        } else {
            ErrorKind kind = ErrorClassifier::classify(described.error());
            if (!policy.should_keep_polling(kind)) {
                warnings.push_back({kind, "wait_for_running", describe_failure(described.error())});
                return;
            }
        }

        int64_t elapsed = elapsed_ms(started);
        if (policy.is_budget_exhausted(elapsed, timeout_ms)) {
            warnings.push_back({ErrorKind::unknown_backend_error, "wait_for_running",
                                "timed out after " + std::to_string(elapsed) + " ms (limit "
                                    + std::to_string(timeout_ms) + " ms) waiting for worker "
                                    + worker.id + " to reach running"});
            return;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(policy.next_sleep_ms(elapsed, timeout_ms)));
    }
}

ActionResult ActionDispatcher::delete_worker(const BackendClient& client, const ActionContext& ctx) {
    std::string worker_id = ctx.string_param("worker_id");

    auto terminated = client.terminate_instance(worker_id);
    if (terminated) {
        return ActionResult::success();
    }

    ErrorKind kind = ErrorClassifier::classify(terminated.error());
    if (kind == ErrorKind::conflict) {
        // Already gone counts as done
        auto described = client.describe_instances({worker_id});
        if (described && !described->empty()
            && ResourceMapper::worker_state_from_native(described->front().state_name)
                   == WorkerState::terminated) {
            return ActionResult::success();
        }
    }
    return ActionResult::failure(kind, describe_failure(terminated.error()));
}

ActionResult ActionDispatcher::get_worker(const BackendClient& client, const ActionContext& ctx) {
    std::string worker_id = ctx.string_param("worker_id");

    auto described = client.describe_instances({worker_id});
    if (!described) {
        return failure_from(described.error());
    }
    auto match = std::find_if(described->begin(), described->end(),
                              [&](const NativeInstance& i) { return i.instance_id == worker_id; });
    if (match == described->end()) {
        return ActionResult::failure(ErrorKind::not_found, "worker " + worker_id + " not found");
    }
    return ActionResult::success(ResourceMapper::map_worker(*match, ctx.region));
}

ActionResult ActionDispatcher::has_worker(const BackendClient& client, const ActionContext& ctx) {
    auto described = client.describe_instances({ctx.string_param("worker_id")});
    if (!described) {
        if (ErrorClassifier::classify(described.error()) == ErrorKind::not_found) {
            return ActionResult::success(false);
        }
        return failure_from(described.error());
    }
    return ActionResult::success(!described->empty());
}

ActionResult ActionDispatcher::start_worker(const BackendClient& client, const ActionContext& ctx) {
    auto changed = client.start_instance(ctx.string_param("worker_id"));
    if (!changed) {
        return failure_from(changed.error());
    }
    return ActionResult::success(ResourceMapper::map_worker(*changed, ctx.region));
}

ActionResult ActionDispatcher::reboot_worker(const BackendClient& client, const ActionContext& ctx) {
    auto rebooted = client.reboot_instance(ctx.string_param("worker_id"));
    if (!rebooted) {
        return failure_from(rebooted.error());
    }
    return ActionResult::success();
}

ActionResult ActionDispatcher::set_worker_metadata(const BackendClient& client, const ActionContext& ctx) {
    TagMap tags = ctx.tags_param("tags");

    if (ctx.has("key") || ctx.has("value")) {
        std::string key = ctx.string_param("key");
        if (key.empty() || !ctx.has("value")) {
            return ActionResult::failure(ErrorKind::invalid_parameters,
                                         "set_worker_metadata: 'key' and 'value' must be given together");
        }
        tags[key] = ctx.string_param("value");
    }

    if (tags.empty()) {
        return ActionResult::failure(ErrorKind::invalid_parameters,
                                     "set_worker_metadata: requires 'tags' or 'key' and 'value'");
    }

    auto tagged = client.create_tags(ctx.string_param("worker_id"), to_native_tags(tags));
    if (!tagged) {
        return failure_from(tagged.error());
    }
    return ActionResult::success();
}

// Volumes

ActionResult ActionDispatcher::get_volumes(const BackendClient& client, const ActionContext& ctx) {
    auto described = client.describe_volumes({});
    if (!described) {
        return failure_from(described.error());
    }
    std::vector<Volume> volumes;
    volumes.reserve(described->size());
    for (const auto& native : *described) {
        volumes.push_back(ResourceMapper::map_volume(native, ctx.region));
    }
    return ActionResult::success(std::move(volumes));
}

ActionResult ActionDispatcher::has_volume(const BackendClient& client, const ActionContext& ctx) {
    auto described = client.describe_volumes({ctx.string_param("volume_id")});
    if (!described) {
        if (ErrorClassifier::classify(described.error()) == ErrorKind::not_found) {
            return ActionResult::success(false);
        }
        return failure_from(described.error());
    }
    return ActionResult::success(!described->empty());
}

ActionResult ActionDispatcher::create_volume(const BackendClient& client, const ActionContext& ctx) {
    CreateVolumeSpec spec;
    spec.size_gib = ctx.int_param("size_gb");
    spec.availability_zone = ctx.string_param("availability_zone");
    spec.volume_type = ctx.optional_string("volume_type").value_or(config_.default_volume_type);

    auto created = client.create_volume(spec);
    if (!created) {
        return failure_from(created.error());
    }
    return ActionResult::success(ResourceMapper::map_volume(*created, ctx.region));
}

ActionResult ActionDispatcher::delete_volume(const BackendClient& client, const ActionContext& ctx) {
    auto deleted = client.delete_volume(ctx.string_param("volume_id"));
    if (!deleted) {
        return failure_from(deleted.error());
    }
    return ActionResult::success();
}

ActionResult ActionDispatcher::attach_volume(const BackendClient& client, const ActionContext& ctx) {
    AttachVolumeSpec spec;
    spec.volume_id = ctx.string_param("volume_id");
    spec.instance_id = ctx.string_param("worker_id");
    spec.device = ctx.string_param("device_name");

    auto attachment = client.attach_volume(spec);
    if (!attachment) {
        return failure_from(attachment.error());
    }
    return refresh_volume(client, ctx, *attachment, true);
}

ActionResult ActionDispatcher::detach_volume(const BackendClient& client, const ActionContext& ctx) {
    DetachVolumeSpec spec;
    spec.volume_id = ctx.string_param("volume_id");
    spec.instance_id = ctx.optional_string("worker_id");
    spec.device = ctx.optional_string("device_name");
    spec.force = ctx.bool_param("force");

    auto attachment = client.detach_volume(spec);
    if (!attachment) {
        return failure_from(attachment.error());
    }
    return refresh_volume(client, ctx, *attachment, false);
}

ActionResult ActionDispatcher::refresh_volume(const BackendClient& client, const ActionContext& ctx,
                                              const NativeVolumeAttachment& attachment, bool attaching) {
    std::string volume_id = attachment.volume_id.empty() ? ctx.string_param("volume_id")
                                                         : attachment.volume_id;
    std::string instance_id = attachment.instance_id.value_or(ctx.string_param("worker_id"));

    NativeVolumeAttachment reported = attachment;
    reported.volume_id = volume_id;

    auto described = client.describe_volumes({volume_id});
    if (described) {
        for (const auto& native : *described) {
            if (native.volume_id != volume_id) {
                continue;
            }
            Volume volume = ResourceMapper::map_volume(native, ctx.region);
            bool current = attaching
                ? volume.attached_to == instance_id
                : !volume.attached_to || (!instance_id.empty() && *volume.attached_to != instance_id);
            if (!current) {
                // Describe is eventually consistent and may predate the call
                Volume from_record = ResourceMapper::map_volume(reported, ctx.region);
                volume.state = from_record.state;
                volume.attached_to = from_record.attached_to;
            }
            return ActionResult::success(std::move(volume));
        }
    }

    ActionWarning warning;
    warning.step = "refresh_volume";
    if (described) {
        warning.kind = ErrorKind::not_found;
        warning.message = "volume " + volume_id + " missing from describe after " + ctx.action;
    } else {
        warning.kind = ErrorClassifier::classify(described.error());
        warning.message = describe_failure(described.error());
    }

    return ActionResult::partial_success(ResourceMapper::map_volume(reported, ctx.region), {warning});
}

// Snapshots

ActionResult ActionDispatcher::create_snapshot(const BackendClient& client, const ActionContext& ctx) {
    CreateSnapshotSpec spec;
    spec.volume_id = ctx.string_param("volume_id");
    spec.description = ctx.optional_string("description").value_or("Snapshot of " + spec.volume_id);
    if (auto snapshot_name = ctx.optional_string("snapshot_name")) {
        spec.tags.emplace_back("Name", *snapshot_name);
    }

    auto created = client.create_snapshot(spec);
    if (!created) {
        return failure_from(created.error());
    }
    return ActionResult::success(ResourceMapper::map_snapshot(*created, ctx.region));
}

ActionResult ActionDispatcher::delete_snapshot(const BackendClient& client, const ActionContext& ctx) {
    auto deleted = client.delete_snapshot(ctx.string_param("snapshot_id"));
    if (!deleted) {
        return failure_from(deleted.error());
    }
    return ActionResult::success();
}

ActionResult ActionDispatcher::has_snapshot(const BackendClient& client, const ActionContext& ctx) {
    auto described = client.describe_snapshots({ctx.string_param("snapshot_id")});
    if (!described) {
        if (ErrorClassifier::classify(described.error()) == ErrorKind::not_found) {
            return ActionResult::success(false);
        }
        return failure_from(described.error());
    }
    return ActionResult::success(!described->empty());
}

} // namespace cpi
} // namespace cumulus
