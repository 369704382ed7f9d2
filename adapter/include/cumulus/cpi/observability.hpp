#pragma once

#include "cumulus/cpi/config.hpp"
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cumulus {
namespace cpi {

using SpanPtr = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>;

class Observability {
public:
    explicit Observability(const std::string& provider_name,
                           LogLevel level = LogLevel::info,
                           bool metrics_enabled = true,
                           std::ostream& sink = std::clog);

    static std::shared_ptr<Observability> from_config(const std::string& provider_name,
                                                      const AdapterConfig& config);

    // Metrics (no-ops when metrics are disabled)
    void record_action(const std::string& action, const std::string& status, double duration_seconds);
    void record_backend_error(const std::string& action, const std::string& error_kind);
    void set_sessions(int64_t count);

    std::string get_metrics_response() const; // Prometheus text format
    bool metrics_enabled() const { return metrics_enabled_; }

    // Tracing, through the global tracer provider
    SpanPtr start_action_span(const std::string& action, const std::string& region);

    // Logging
    void log_info(const std::string& message,
                  const std::string& action = "",
                  const std::string& region = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_warn(const std::string& message,
                  const std::string& action = "",
                  const std::string& region = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_error(const std::string& message,
                   const std::string& action = "",
                   const std::string& region = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    void log_debug(const std::string& message,
                   const std::string& action = "",
                   const std::string& region = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    bool should_log(LogLevel level) const { return level >= level_; }

    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& action,
                                const std::string& region,
                                const std::unordered_map<std::string, std::string>& context) const;

    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

private:
    std::string provider_name_;
    LogLevel level_;
    bool metrics_enabled_;
    std::ostream& sink_;
    std::mutex sink_mutex_;

    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Family<prometheus::Counter>* actions_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* action_duration_seconds_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* backend_errors_total_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* sessions_family_ = nullptr;

    void initialize_metrics();
    void write(LogLevel level, const std::string& message, const std::string& action,
               const std::string& region, const std::unordered_map<std::string, std::string>& context);
};

} // namespace cpi
} // namespace cumulus
