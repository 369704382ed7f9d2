// C ABI of the EC2 provider plugin.
// Exposes only extern "C" functions; everything behind them is the C++ API.

#include "cumulus/cpi/c_api.h"
#include "cumulus/cpi/actors.hpp"
#include "cumulus/cpi/backends/ec2_client.hpp"
#include "cumulus/cpi/config.hpp"
#include "cumulus/cpi/dispatcher.hpp"
#include "cumulus/cpi/observability.hpp"
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>

struct cumulus_cpi_extension {
    cumulus::cpi::AdapterConfig config;
    std::shared_ptr<cumulus::cpi::ActionDispatcher> dispatcher;
    std::unique_ptr<caf::actor_system_config> system_config;
    std::unique_ptr<caf::actor_system> system;
    std::unique_ptr<cumulus::cpi::ActionHost> host;
    std::string name;
    std::string provider_type;
};

namespace {

char* copy_string(const std::string& value) {
    char* out = static_cast<char*>(std::malloc(value.size() + 1));
    if (out == nullptr) {
        return nullptr;
    }
    std::memcpy(out, value.c_str(), value.size() + 1);
    return out;
}

void set_error(char** error_out, const std::string& message) {
    if (error_out != nullptr) {
        *error_out = copy_string(message);
    }
}

} // namespace

extern "C" {

uint32_t cumulus_cpi_abi_version(void) {
    return CUMULUS_CPI_ABI_VERSION;
}

cumulus_cpi_extension_t* cumulus_cpi_create(const char* config_json, char** error_out) {
    using namespace cumulus::cpi;

    if (error_out != nullptr) {
        *error_out = nullptr;
    }

    try {
        auto ext = std::make_unique<cumulus_cpi_extension>();
        ext->config = AdapterConfig::from_env();

        if (config_json != nullptr && *config_json != '\0') {
            auto overrides = nlohmann::json::parse(config_json, nullptr, false);
            if (overrides.is_discarded()) {
                set_error(error_out, "config is not valid JSON");
                return nullptr;
            }
            auto applied = ext->config.apply_json(overrides);
            if (!applied) {
                set_error(error_out, error_message(applied.error()));
                return nullptr;
            }
        } else if (auto valid = ext->config.validate(); !valid) {
            set_error(error_out, error_message(valid.error()));
            return nullptr;
        }

        auto observability = Observability::from_config("ec2", ext->config);
        ext->dispatcher = make_ec2_provider(ext->config, observability);
        ext->name = ext->dispatcher->name();
        ext->provider_type = ext->dispatcher->provider_type();

        ext->system_config = std::make_unique<caf::actor_system_config>();
        ext->system = std::make_unique<caf::actor_system>(*ext->system_config);
        ext->host = std::make_unique<ActionHost>(*ext->system, ext->dispatcher,
                                                 ext->config.host_call_timeout_ms);

        observability->log_info("Provider created", "", ext->config.default_region, {
            {"abi_version", std::to_string(CUMULUS_CPI_ABI_VERSION)},
            {"metrics_enabled", ext->config.metrics_enabled ? "true" : "false"}
        });
        return ext.release();
    } catch (const std::exception& e) {
        set_error(error_out, std::string("failed to create provider: ") + e.what());
        return nullptr;
    }
}

void cumulus_cpi_destroy(cumulus_cpi_extension_t* ext) {
    if (ext == nullptr) {
        return;
    }
    // Actors go before the system, the system before the dispatcher they used
    ext->host.reset();
    ext->system.reset();
    ext->system_config.reset();
    delete ext;
}

const char* cumulus_cpi_name(const cumulus_cpi_extension_t* ext) {
    return ext != nullptr ? ext->name.c_str() : nullptr;
}

const char* cumulus_cpi_provider_type(const cumulus_cpi_extension_t* ext) {
    return ext != nullptr ? ext->provider_type.c_str() : nullptr;
}

char* cumulus_cpi_list_actions(const cumulus_cpi_extension_t* ext) {
    if (ext == nullptr) {
        return nullptr;
    }
    try {
        return copy_string(nlohmann::json(ext->dispatcher->list_actions()).dump());
    } catch (const std::exception&) {
        return nullptr;
    }
}

char* cumulus_cpi_describe_action(const cumulus_cpi_extension_t* ext, const char* action) {
    if (ext == nullptr || action == nullptr) {
        return nullptr;
    }
    try {
        auto definition = ext->dispatcher->action_definition(action);
        if (!definition) {
            return nullptr;
        }
        return copy_string(cumulus::cpi::ActionCatalog::to_json(*definition).dump());
    } catch (const std::exception&) {
        return nullptr;
    }
}

char* cumulus_cpi_dispatch(cumulus_cpi_extension_t* ext, const char* action, const char* params_json) {
    if (ext == nullptr || action == nullptr) {
        return nullptr;
    }
    try {
        return copy_string(ext->host->dispatch_json(action, params_json != nullptr ? params_json : ""));
    } catch (const std::exception& e) {
        ext->dispatcher->observability()->log_error("Host call failed", action, "", {{"error", e.what()}});
        return nullptr;
    }
}

void cumulus_cpi_free_string(char* str) {
    std::free(str);
}

} // extern "C"
