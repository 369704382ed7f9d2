#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include <caf/atom.hpp>
#include <caf/error.hpp>
#include <caf/message.hpp>

namespace cumulus {
namespace cpi {

using TagMap = std::unordered_map<std::string, std::string>;

// Canonical entities. Built only by the resource mapper, never persisted.

enum class WorkerState {
    pending,
    running,
    stopping,
    stopped,
    terminated,
    unknown
};

struct Worker {
    std::string id;
    WorkerState state = WorkerState::unknown;
    std::string region;
    TagMap tags;
};

enum class VolumeState {
    creating,
    available,
    in_use,
    deleting,
    unknown
};

// attached_to is set iff state == in_use
struct Volume {
    std::string id;
    int64_t size_gb = 0;
    VolumeState state = VolumeState::unknown;
    std::optional<std::string> attached_to;
    std::string region;
};

enum class SnapshotState {
    pending,
    completed,
    error,
    unknown
};

struct Snapshot {
    std::string id;
    std::string source_volume_id;
    SnapshotState state = SnapshotState::unknown;
    std::string region;
};

// Closed error taxonomy shared by every provider.
// Values double as caf::error codes in the "cpi" category, so 0 stays reserved.
enum class ErrorKind : uint8_t {
    none = 0,
    invalid_parameters = 1,
    not_found = 2,
    authentication_error = 3,
    rate_limited = 4,
    conflict = 5,
    unknown_backend_error = 6,
    unsupported_action = 7
};

inline caf::error make_error(ErrorKind kind, std::string message) {
    return caf::error{static_cast<uint8_t>(kind), caf::atom("cpi"),
                      caf::make_message(std::move(message))};
}

// Outcome of one dispatched action
enum class ActionStatus {
    ok,       // Maps to "success"
    partial,  // Maps to "partial_success": payload valid, follow-up step failed
    error     // Maps to "error"
};

// Non-fatal failure of a composite step after the primary resource exists
struct ActionWarning {
    ErrorKind kind = ErrorKind::unknown_backend_error;
    std::string step;
    std::string message;
};

using ActionPayload = std::variant<
    std::monostate,
    bool,
    Worker,
    Volume,
    Snapshot,
    std::vector<Worker>,
    std::vector<Volume>
>;

struct ResultMetadata {
    std::string action;
    std::string region;
};

// Unified result type for all actions.
// Exactly one is produced per request; it can always be converted to the wire format.
struct ActionResult {
    ActionStatus status = ActionStatus::ok;
    ErrorKind error_kind = ErrorKind::none;
    std::string error_message;
    ActionPayload payload;
    std::vector<ActionWarning> warnings;
    ResultMetadata metadata;
    int64_t latency_ms = 0;

    bool is_success() const { return status == ActionStatus::ok; }
    bool is_partial() const { return status == ActionStatus::partial; }
    bool is_error() const { return status == ActionStatus::error; }

    template <class T>
    const T* get_if() const { return std::get_if<T>(&payload); }

    static ActionResult success(ActionPayload payload = std::monostate{}) {
        ActionResult result;
        result.status = ActionStatus::ok;
        result.payload = std::move(payload);
        return result;
    }

    static ActionResult partial_success(ActionPayload payload,
                                        std::vector<ActionWarning> warnings) {
        ActionResult result;
        result.status = ActionStatus::partial;
        result.payload = std::move(payload);
        result.warnings = std::move(warnings);
        return result;
    }

    static ActionResult failure(ErrorKind kind, std::string message) {
        ActionResult result;
        result.status = ActionStatus::error;
        result.error_kind = kind;
        result.error_message = std::move(message);
        return result;
    }
};

} // namespace cpi
} // namespace cumulus
