#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <caf/error.hpp>

namespace cumulus {
namespace cpi {

// Backend-native records as returned by the facade. Field names and state strings
// follow the EC2 API; every field the backend may omit is optional.

using NativeTag = std::pair<std::string, std::string>;

struct NativeInstance {
    std::string instance_id;
    std::optional<std::string> state_name;        // "pending", "running", "shutting-down", ...
    std::optional<std::string> instance_type;
    std::optional<std::string> image_id;
    std::optional<std::string> availability_zone;
    std::optional<std::string> public_ip;
    std::optional<std::string> private_ip;
    std::vector<NativeTag> tags;
};

// Returned by start/stop/terminate calls
struct NativeStateChange {
    std::string instance_id;
    std::optional<std::string> current_state;
    std::optional<std::string> previous_state;
};

struct NativeVolumeAttachment {
    std::string volume_id;
    std::optional<std::string> instance_id;
    std::optional<std::string> device;
    std::optional<std::string> state;             // "attaching", "attached", "detaching", "detached", "busy"
};

struct NativeVolume {
    std::string volume_id;
    std::optional<int64_t> size_gib;
    std::optional<std::string> state;             // "creating", "available", "in-use", ...
    std::optional<std::string> availability_zone;
    std::optional<std::string> volume_type;
    std::vector<NativeVolumeAttachment> attachments;
    std::vector<NativeTag> tags;
};

struct NativeSnapshot {
    std::string snapshot_id;
    std::optional<std::string> volume_id;
    std::optional<std::string> state;             // "pending", "completed", "error", ...
    std::optional<std::string> progress;
    std::optional<int64_t> volume_size_gib;
    std::optional<std::string> description;
};

// A failed backend call as the backend reported it
struct BackendError {
    int32_t http_status = 0;   // 0 when no HTTP response was received
    std::string code;          // e.g. "InvalidInstanceID.NotFound"
    std::string message;
};

// Backend failures travel inside caf::expected as errors of the "backend" category.
// The context message holds (http_status, code, message).
caf::error make_backend_error(BackendError err);

caf::error make_backend_error(int32_t http_status, std::string code, std::string message);

// Recovers the native error. Errors of other categories come back with an empty
// code and their rendered text as message.
BackendError to_backend_error(const caf::error& err);

bool is_backend_error(const caf::error& err);

// Text carried by an error: backend message, cpi message, or the CAF rendering
std::string error_message(const caf::error& err);

} // namespace cpi
} // namespace cumulus
