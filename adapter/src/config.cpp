#include "cumulus/cpi/config.hpp"
#include "cumulus/cpi/core.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace cumulus {
namespace cpi {

using json = nlohmann::json;

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/**
 * Get boolean value from environment variable
 *
 * "true", "1", "yes" (case-insensitive) are true, "false", "0", "no" are false.
 * Anything else, or an unset variable, yields `default_value`.
 */
bool get_env_bool(const char* env_var, bool default_value) {
    const char* value = std::getenv(env_var);
    if (value == nullptr) {
        return default_value;
    }
    std::string str_value = to_lower(value);
    if (str_value == "true" || str_value == "1" || str_value == "yes") {
        return true;
    }
    if (str_value == "false" || str_value == "0" || str_value == "no") {
        return false;
    }
    return default_value;
}

int64_t get_env_int(const char* env_var, int64_t default_value) {
    const char* value = std::getenv(env_var);
    if (value == nullptr || *value == '\0') {
        return default_value;
    }
    char* end = nullptr;
    long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0') {
        return default_value;
    }
    return static_cast<int64_t>(parsed);
}

std::string get_env_string(const char* env_var, const std::string& default_value) {
    const char* value = std::getenv(env_var);
    if (value == nullptr || *value == '\0') {
        return default_value;
    }
    return value;
}

caf::error type_error(const std::string& key, const char* expected) {
    return make_error(ErrorKind::invalid_parameters,
                      "config key '" + key + "' must be " + expected);
}

} // namespace

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
    std::string lower = to_lower(value);
    if (lower == "debug" || lower == "trace") {
        return LogLevel::debug;
    } else if (lower == "info") {
        return LogLevel::info;
    } else if (lower == "warn" || lower == "warning") {
        return LogLevel::warn;
    } else if (lower == "error") {
        return LogLevel::error;
    }
    return fallback;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug:
            return "DEBUG";
        case LogLevel::info:
            return "INFO";
        case LogLevel::warn:
            return "WARN";
        case LogLevel::error:
            return "ERROR";
    }
    return "INFO";
}

AdapterConfig AdapterConfig::from_env() {
    AdapterConfig config;
    config.default_region = get_env_string("CUMULUS_CPI_DEFAULT_REGION", config.default_region);
    config.default_volume_type = get_env_string("CUMULUS_CPI_DEFAULT_VOLUME_TYPE", config.default_volume_type);
    config.wait_poll_interval_ms = get_env_int("CUMULUS_CPI_WAIT_POLL_INTERVAL_MS", config.wait_poll_interval_ms);
    config.wait_timeout_ms = get_env_int("CUMULUS_CPI_WAIT_TIMEOUT_MS", config.wait_timeout_ms);
    config.host_call_timeout_ms = get_env_int("CUMULUS_CPI_HOST_CALL_TIMEOUT_MS", config.host_call_timeout_ms);
    config.endpoint_override = get_env_string("CUMULUS_CPI_ENDPOINT", config.endpoint_override);
    config.log_level = get_env_string("CUMULUS_CPI_LOG_LEVEL", config.log_level);
    config.metrics_enabled = get_env_bool("CUMULUS_CPI_METRICS_ENABLED", config.metrics_enabled);
    return config;
}

caf::expected<void> AdapterConfig::apply_json(const json& overrides) {
    if (overrides.is_null()) {
        return caf::unit;
    }
    if (!overrides.is_object()) {
        return make_error(ErrorKind::invalid_parameters, "config must be a JSON object");
    }

    // Work on a copy so a rejected key leaves the config untouched
    AdapterConfig next = *this;
    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == "default_region" || key == "default_volume_type"
            || key == "endpoint_override" || key == "log_level") {
            if (!value.is_string()) {
                return type_error(key, "a string");
            }
            auto str = value.get<std::string>();
            if (key == "default_region") {
                next.default_region = str;
            } else if (key == "default_volume_type") {
                next.default_volume_type = str;
            } else if (key == "endpoint_override") {
                next.endpoint_override = str;
            } else {
                next.log_level = str;
            }
        } else if (key == "wait_poll_interval_ms" || key == "wait_timeout_ms"
                   || key == "host_call_timeout_ms") {
            if (!value.is_number_integer()) {
                return type_error(key, "an integer");
            }
            auto number = value.get<int64_t>();
            if (key == "wait_poll_interval_ms") {
                next.wait_poll_interval_ms = number;
            } else if (key == "wait_timeout_ms") {
                next.wait_timeout_ms = number;
            } else {
                next.host_call_timeout_ms = number;
            }
        } else if (key == "metrics_enabled") {
            if (!value.is_boolean()) {
                return type_error(key, "a boolean");
            }
            next.metrics_enabled = value.get<bool>();
        } else {
            return make_error(ErrorKind::invalid_parameters, "unknown config key '" + key + "'");
        }
    }

    auto valid = next.validate();
    if (!valid) {
        return valid.error();
    }
    *this = std::move(next);
    return caf::unit;
}

caf::expected<void> AdapterConfig::validate() const {
    if (default_region.empty()) {
        return make_error(ErrorKind::invalid_parameters, "default_region must not be empty");
    }
    if (default_volume_type.empty()) {
        return make_error(ErrorKind::invalid_parameters, "default_volume_type must not be empty");
    }
    if (wait_poll_interval_ms < 0) {
        return make_error(ErrorKind::invalid_parameters, "wait_poll_interval_ms must be >= 0");
    }
    if (wait_timeout_ms < 0) {
        return make_error(ErrorKind::invalid_parameters, "wait_timeout_ms must be >= 0");
    }
    if (host_call_timeout_ms <= 0) {
        return make_error(ErrorKind::invalid_parameters, "host_call_timeout_ms must be > 0");
    }
    if (host_call_timeout_ms < wait_timeout_ms + HOST_CALL_RESERVE_MS) {
        return make_error(ErrorKind::invalid_parameters,
                          "host_call_timeout_ms must be at least wait_timeout_ms + "
                              + std::to_string(HOST_CALL_RESERVE_MS));
    }
    return caf::unit;
}

LogLevel AdapterConfig::parsed_log_level() const {
    return parse_log_level(log_level);
}

json AdapterConfig::to_json() const {
    return json{
        {"default_region", default_region},
        {"default_volume_type", default_volume_type},
        {"wait_poll_interval_ms", wait_poll_interval_ms},
        {"wait_timeout_ms", wait_timeout_ms},
        {"host_call_timeout_ms", host_call_timeout_ms},
        {"endpoint_override", endpoint_override},
        {"log_level", log_level},
        {"metrics_enabled", metrics_enabled}
    };
}

} // namespace cpi
} // namespace cumulus
