#pragma once

#include "cumulus/cpi/core.hpp"
#include "cumulus/cpi/error_classifier.hpp"
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace cumulus {
namespace cpi {

// ActionResult -> host wire format (JSON, version "1")

class ResultConverter {
public:
    // Contract: "success" | "partial_success" | "error"
    static std::string status_to_string(ActionStatus status) {
        switch (status) {
            case ActionStatus::ok:
                return "success";
            case ActionStatus::partial:
                return "partial_success";
            case ActionStatus::error:
                return "error";
            default:
                return "error";
        }
    }

    static ActionStatus string_to_status(const std::string& status_str) {
        if (status_str == "success") {
            return ActionStatus::ok;
        } else if (status_str == "partial_success") {
            return ActionStatus::partial;
        }
        return ActionStatus::error;  // Default to error for unknown status
    }

    static std::string worker_state_to_string(WorkerState state) {
        switch (state) {
            case WorkerState::pending:
                return "pending";
            case WorkerState::running:
                return "running";
            case WorkerState::stopping:
                return "stopping";
            case WorkerState::stopped:
                return "stopped";
            case WorkerState::terminated:
                return "terminated";
            default:
                return "unknown";
        }
    }

    static std::string volume_state_to_string(VolumeState state) {
        switch (state) {
            case VolumeState::creating:
                return "creating";
            case VolumeState::available:
                return "available";
            case VolumeState::in_use:
                return "in_use";
            case VolumeState::deleting:
                return "deleting";
            default:
                return "unknown";
        }
    }

    static std::string snapshot_state_to_string(SnapshotState state) {
        switch (state) {
            case SnapshotState::pending:
                return "pending";
            case SnapshotState::completed:
                return "completed";
            case SnapshotState::error:
                return "error";
            default:
                return "unknown";
        }
    }

    static nlohmann::json to_json(const Worker& worker) {
        nlohmann::json tags = nlohmann::json::object();
        for (const auto& [key, value] : worker.tags) {
            tags[key] = value;
        }
        return {
            {"id", worker.id},
            {"state", worker_state_to_string(worker.state)},
            {"region", worker.region},
            {"tags", tags}
        };
    }

    static nlohmann::json to_json(const Volume& volume) {
        return {
            {"id", volume.id},
            {"size_gb", volume.size_gb},
            {"state", volume_state_to_string(volume.state)},
            {"attached_to", volume.attached_to ? nlohmann::json(*volume.attached_to) : nlohmann::json()},
            {"region", volume.region}
        };
    }

    static nlohmann::json to_json(const Snapshot& snapshot) {
        return {
            {"id", snapshot.id},
            {"source_volume_id", snapshot.source_volume_id},
            {"state", snapshot_state_to_string(snapshot.state)},
            {"region", snapshot.region}
        };
    }

    static nlohmann::json payload_to_json(const ActionPayload& payload) {
        return std::visit([](const auto& value) -> nlohmann::json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, bool>) {
                return value;
            } else if constexpr (std::is_same_v<T, std::vector<Worker>>
                                 || std::is_same_v<T, std::vector<Volume>>) {
                nlohmann::json list = nlohmann::json::array();
                for (const auto& item : value) {
                    list.push_back(to_json(item));
                }
                return list;
            } else {
                return to_json(value);
            }
        }, payload);
    }

    // Wire format of one result. "result" is null on errors, "error" is null otherwise.
    static nlohmann::json to_wire_json(const ActionResult& result) {
        nlohmann::json warnings = nlohmann::json::array();
        for (const auto& warning : result.warnings) {
            warnings.push_back({
                {"kind", ErrorClassifier::kind_to_string(warning.kind)},
                {"step", warning.step},
                {"message", warning.message}
            });
        }

        nlohmann::json wire = {
            {"version", "1"},
            {"action", result.metadata.action},
            {"region", result.metadata.region},
            {"status", status_to_string(result.status)},
            {"result", nullptr},
            {"warnings", warnings},
            {"error", nullptr},
            {"latency_ms", result.latency_ms}
        };

        if (result.status == ActionStatus::error) {
            wire["error"] = {
                {"kind", ErrorClassifier::kind_to_string(result.error_kind)},
                {"message", result.error_message}
            };
        } else {
            wire["result"] = payload_to_json(result.payload);
        }
        return wire;
    }

    // Error-only wire result for failures that never reached a dispatcher
    static nlohmann::json error_json(const std::string& action,
                                     const std::string& region,
                                     ErrorKind kind,
                                     const std::string& message) {
        ActionResult result = ActionResult::failure(kind, message);
        result.metadata.action = action;
        result.metadata.region = region;
        return to_wire_json(result);
    }

    // Text form of a wire document. Invalid UTF-8 from the host becomes U+FFFD
    // instead of a serializer exception.
    static std::string dump(const nlohmann::json& wire, int indent = -1) {
        return wire.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    // Ensures the result can be reported without contradicting itself
    static bool validate_result(const ActionResult& result) {
        if (result.status == ActionStatus::error && result.error_kind == ErrorKind::none) {
            return false;  // Invalid: error status without error kind
        }

        if (result.status != ActionStatus::error && result.error_kind != ErrorKind::none) {
            return false;
        }

        // Partial success must say what went wrong
        if (result.status == ActionStatus::partial && result.warnings.empty()) {
            return false;
        }

        if (const auto* volume = result.get_if<Volume>()) {
            if ((volume->state == VolumeState::in_use) != volume->attached_to.has_value()) {
                return false;
            }
        }

        if (result.latency_ms < 0) {
            return false;
        }

        return true;
    }
};

} // namespace cpi
} // namespace cumulus
