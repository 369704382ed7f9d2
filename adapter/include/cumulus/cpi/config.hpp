#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include <caf/expected.hpp>

namespace cumulus {
namespace cpi {

enum class LogLevel {
    debug,
    info,
    warn,
    error
};

// Part of a host call kept free for launch, tagging and reply once the wait is over
constexpr int64_t HOST_CALL_RESERVE_MS = 5000;

/**
 * Adapter configuration
 *
 * Sources, later wins:
 * - built-in defaults below
 * - environment (from_env):
 *   CUMULUS_CPI_DEFAULT_REGION, CUMULUS_CPI_DEFAULT_VOLUME_TYPE,
 *   CUMULUS_CPI_WAIT_POLL_INTERVAL_MS, CUMULUS_CPI_WAIT_TIMEOUT_MS,
 *   CUMULUS_CPI_HOST_CALL_TIMEOUT_MS, CUMULUS_CPI_ENDPOINT,
 *   CUMULUS_CPI_LOG_LEVEL, CUMULUS_CPI_METRICS_ENABLED
 * - an explicit JSON object (apply_json) or CLI options
 */
struct AdapterConfig {
    std::string default_region = "us-east-1";
    std::string default_volume_type = "gp2";
    int64_t wait_poll_interval_ms = 2000;
    int64_t wait_timeout_ms = 300000;       // Ceiling for create_worker's running-state wait
    int64_t host_call_timeout_ms = 900000;  // Upper bound a host call waits for its reply
    std::string endpoint_override;          // Empty = regional AWS endpoint
    std::string log_level = "info";
    bool metrics_enabled = true;

    static AdapterConfig from_env();

    // Overlays keys present in `overrides`; unknown keys and wrong types are rejected
    caf::expected<void> apply_json(const nlohmann::json& overrides);

    // host_call_timeout_ms must exceed wait_timeout_ms by HOST_CALL_RESERVE_MS
    caf::expected<void> validate() const;

    LogLevel parsed_log_level() const;

    nlohmann::json to_json() const;
};

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::info);

std::string to_string(LogLevel level);

} // namespace cpi
} // namespace cumulus
