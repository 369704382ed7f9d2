#include "cumulus/cpi/observability.hpp"
#include <prometheus/text_serializer.h>
#include <opentelemetry/nostd/string_view.h>
#include <opentelemetry/trace/provider.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <vector>

namespace cumulus {
namespace cpi {

using json = nlohmann::json;

// Secret-bearing fields to redact
static const std::vector<std::string> SECRET_FIELDS = {
    "secret", "token", "password", "access_key",
    "authorization", "credential", "session"
};

// Helper function to check if a field name should be redacted (case-insensitive)
static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static void redact_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_secret_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                redact_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                redact_recursive(item);
            }
        }
    }
}

// ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

Observability::Observability(const std::string& provider_name,
                             LogLevel level,
                             bool metrics_enabled,
                             std::ostream& sink)
    : provider_name_(provider_name),
      level_(level),
      metrics_enabled_(metrics_enabled),
      sink_(sink),
      registry_(std::make_shared<prometheus::Registry>()) {
    if (metrics_enabled_) {
        initialize_metrics();
    }
}

std::shared_ptr<Observability> Observability::from_config(const std::string& provider_name,
                                                          const AdapterConfig& config) {
    return std::make_shared<Observability>(provider_name, config.parsed_log_level(),
                                           config.metrics_enabled);
}

void Observability::initialize_metrics() {
    actions_total_family_ = &prometheus::BuildCounter()
        .Name("cpi_actions_total")
        .Help("Total number of dispatched actions")
        .Labels({{"provider", provider_name_}})
        .Register(*registry_);

    action_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("cpi_action_duration_seconds")
        .Help("Action duration in seconds")
        .Labels({{"provider", provider_name_}})
        .Register(*registry_);

    backend_errors_total_family_ = &prometheus::BuildCounter()
        .Name("cpi_backend_errors_total")
        .Help("Total number of classified action failures")
        .Labels({{"provider", provider_name_}})
        .Register(*registry_);

    sessions_family_ = &prometheus::BuildGauge()
        .Name("cpi_sessions")
        .Help("Number of cached backend sessions")
        .Labels({{"provider", provider_name_}})
        .Register(*registry_);
}

void Observability::record_action(const std::string& action,
                                  const std::string& status,
                                  double duration_seconds) {
    if (!metrics_enabled_) {
        return;
    }

    actions_total_family_->Add({{"action", action}, {"status", status}}).Increment();

    static const prometheus::Histogram::BucketBoundaries buckets = {
        0.01, 0.05, 0.1, 0.5, 1.0, 2.0, 5.0, 10.0, 30.0, 60.0, 120.0, 300.0
    };
    action_duration_seconds_family_->Add({{"action", action}}, buckets).Observe(duration_seconds);
}

void Observability::record_backend_error(const std::string& action, const std::string& error_kind) {
    if (!metrics_enabled_) {
        return;
    }
    backend_errors_total_family_->Add({{"action", action}, {"kind", error_kind}}).Increment();
}

void Observability::set_sessions(int64_t count) {
    if (!metrics_enabled_) {
        return;
    }
    sessions_family_->Add({}).Set(static_cast<double>(count));
}

std::string Observability::get_metrics_response() const {
    if (!metrics_enabled_) {
        return "";
    }
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

SpanPtr Observability::start_action_span(const std::string& action, const std::string& region) {
    namespace nostd = opentelemetry::nostd;

    auto provider = opentelemetry::trace::Provider::GetTracerProvider();
    auto tracer = provider->GetTracer("cumulus-cpi", "1.0.0");

    auto span = tracer->StartSpan("cpi." + action);
    span->SetAttribute("cpi.provider", nostd::string_view(provider_name_));
    span->SetAttribute("cpi.action", nostd::string_view(action));
    span->SetAttribute("cpi.region", nostd::string_view(region));
    return span;
}

void Observability::log_info(const std::string& message,
                             const std::string& action,
                             const std::string& region,
                             const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::info, message, action, region, context);
}

void Observability::log_warn(const std::string& message,
                             const std::string& action,
                             const std::string& region,
                             const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::warn, message, action, region, context);
}

void Observability::log_error(const std::string& message,
                              const std::string& action,
                              const std::string& region,
                              const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::error, message, action, region, context);
}

void Observability::log_debug(const std::string& message,
                              const std::string& action,
                              const std::string& region,
                              const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::debug, message, action, region, context);
}

void Observability::write(LogLevel level,
                          const std::string& message,
                          const std::string& action,
                          const std::string& region,
                          const std::unordered_map<std::string, std::string>& context) {
    if (!should_log(level)) {
        return;
    }
    std::string line = format_json_log(to_string(level), message, action, region, context);
    std::lock_guard<std::mutex> guard(sink_mutex_);
    sink_ << line << std::endl;
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& action,
                                           const std::string& region,
                                           const std::unordered_map<std::string, std::string>& context) const {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = "cpi";
    log_entry["message"] = message;

    if (!action.empty()) {
        log_entry["action"] = action;
    }
    if (!region.empty()) {
        log_entry["region"] = region;
    }

    json context_obj;
    context_obj["provider"] = provider_name_;
    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }

    redact_recursive(context_obj);
    log_entry["context"] = context_obj;

    // Host-supplied strings may carry invalid UTF-8; log them with U+FFFD
    return log_entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace cpi
} // namespace cumulus
