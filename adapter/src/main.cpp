#include <iostream>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <nlohmann/json.hpp>
#include <opentelemetry/exporters/ostream/span_exporter.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/simple_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include "cumulus/cpi/actors.hpp"
#include "cumulus/cpi/backends/ec2_client.hpp"
#include "cumulus/cpi/config.hpp"
#include "cumulus/cpi/core.hpp"
#include "cumulus/cpi/observability.hpp"
#include "cumulus/cpi/result_converter.hpp"

class CliConfig : public caf::actor_system_config {
public:
    CliConfig() {
        opt_group{custom_options_, "global"}
            .add(action, "action,a", "Action to run")
            .add(params, "params,p", "Action parameters as a JSON object")
            .add(region, "region,r", "Region for this action (overrides the default region)")
            .add(config_json, "config", "Adapter configuration as a JSON object")
            .add(log_level, "log-level", "debug, info, warn or error")
            .add(wait_timeout_ms, "wait-timeout-ms", "Ceiling for the running-state wait")
            .add(poll_interval_ms, "poll-interval-ms", "Delay between wait polls")
            .add(endpoint, "endpoint", "EC2 endpoint override")
            .add(list_actions, "list-actions", "Print the action names and exit")
            .add(describe_action, "describe", "Print the definition of an action and exit")
            .add(trace, "trace", "Export spans to stderr")
            .add(dump_metrics, "dump-metrics", "Print Prometheus metrics to stderr after the action");
    }

    std::string action;
    std::string params = "{}";
    std::string region;
    std::string config_json;
    std::string log_level;
    int64_t wait_timeout_ms = -1;
    int64_t poll_interval_ms = -1;
    std::string endpoint;
    bool list_actions = false;
    std::string describe_action;
    bool trace = false;
    bool dump_metrics = false;
};

namespace {

void install_stderr_tracing() {
    auto exporter = std::unique_ptr<opentelemetry::sdk::trace::SpanExporter>(
        new opentelemetry::exporter::trace::OStreamSpanExporter(std::cerr));
    auto processor = std::unique_ptr<opentelemetry::sdk::trace::SpanProcessor>(
        new opentelemetry::sdk::trace::SimpleSpanProcessor(std::move(exporter)));
    auto provider = opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(
        new opentelemetry::sdk::trace::TracerProvider(std::move(processor)));

    // Set as global provider
    opentelemetry::trace::Provider::SetTracerProvider(provider);
}

caf::expected<cumulus::cpi::AdapterConfig> build_adapter_config(const CliConfig& cli) {
    using cumulus::cpi::AdapterConfig;

    AdapterConfig config = AdapterConfig::from_env();
    nlohmann::json overrides = nlohmann::json::object();
    if (!cli.config_json.empty()) {
        overrides = nlohmann::json::parse(cli.config_json, nullptr, false);
        if (overrides.is_discarded() || !overrides.is_object()) {
            return cumulus::cpi::make_error(cumulus::cpi::ErrorKind::invalid_parameters,
                                            "--config must be a JSON object");
        }
    }
    if (!cli.log_level.empty()) {
        overrides["log_level"] = cli.log_level;
    }
    if (cli.wait_timeout_ms >= 0) {
        overrides["wait_timeout_ms"] = cli.wait_timeout_ms;
    }
    if (cli.poll_interval_ms >= 0) {
        overrides["wait_poll_interval_ms"] = cli.poll_interval_ms;
    }
    if (!cli.endpoint.empty()) {
        overrides["endpoint_override"] = cli.endpoint;
    }

    auto applied = config.apply_json(overrides);
    if (!applied) {
        return applied.error();
    }
    return config;
}

} // namespace

int caf_main(caf::actor_system& system, const CliConfig& cli) {
    using namespace cumulus::cpi;

    auto config = build_adapter_config(cli);
    if (!config) {
        std::cerr << "Invalid configuration: " << error_message(config.error()) << std::endl;
        return 2;
    }

    if (cli.trace) {
        install_stderr_tracing();
    }

    auto observability = Observability::from_config("ec2", *config);

    try {
        auto provider = make_ec2_provider(*config, observability);

        if (cli.list_actions) {
            std::cout << nlohmann::json(provider->list_actions()).dump(2) << std::endl;
            return 0;
        }

        if (!cli.describe_action.empty()) {
            auto definition = provider->action_definition(cli.describe_action);
            if (!definition) {
                std::cerr << "Unknown action: " << cli.describe_action << std::endl;
                return 1;
            }
            std::cout << ActionCatalog::to_json(*definition).dump(2) << std::endl;
            return 0;
        }

        if (cli.action.empty()) {
            std::cerr << "Missing --action (see --list-actions)" << std::endl;
            return 2;
        }

        auto params = nlohmann::json::parse(cli.params, nullptr, false);
        if (params.is_discarded() || !(params.is_object() || params.is_null())) {
            std::cout << ResultConverter::dump(ResultConverter::error_json(
                             cli.action, config->default_region, ErrorKind::invalid_parameters,
                             "--params must be a JSON object"), 2)
                      << std::endl;
            return 1;
        }
        if (!cli.region.empty()) {
            params["region"] = cli.region;
        }

        observability->log_debug("Running action", cli.action, cli.region, {
            {"config", ResultConverter::dump(config->to_json())}
        });

        ActionHost host(system, provider, config->host_call_timeout_ms);
        std::string reply = host.dispatch_json(cli.action, ResultConverter::dump(params));

        auto result = nlohmann::json::parse(reply, nullptr, false);
        if (result.is_discarded()) {
            std::cout << reply << std::endl;
            return 1;
        }
        std::cout << result.dump(2) << std::endl;

        if (cli.dump_metrics) {
            std::cerr << observability->get_metrics_response();
        }

        return result.value("status", std::string("error")) == "error" ? 1 : 0;

    } catch (const std::exception& e) {
        observability->log_error("CLI fatal error", cli.action, cli.region, {{"error", e.what()}});
        return 1;
    }
}

int main(int argc, char** argv) {
    CliConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 2;
    }
    if (config.cli_helptext_printed) {
        return 0;
    }

    // Run the actor system
    caf::actor_system system(config);
    return caf_main(system, config);
}
