#include "cumulus/cpi/resource_mapper.hpp"

namespace cumulus {
namespace cpi {

WorkerState ResourceMapper::worker_state_from_native(const std::optional<std::string>& state_name) {
    if (!state_name) {
        return WorkerState::unknown;
    }
    const std::string& s = *state_name;
    if (s == "pending") {
        return WorkerState::pending;
    } else if (s == "running") {
        return WorkerState::running;
    } else if (s == "stopping" || s == "shutting-down") {
        return WorkerState::stopping;
    } else if (s == "stopped") {
        return WorkerState::stopped;
    } else if (s == "terminated") {
        return WorkerState::terminated;
    }
    return WorkerState::unknown;
}

VolumeState ResourceMapper::volume_state_from_native(const std::optional<std::string>& state_name) {
    if (!state_name) {
        return VolumeState::unknown;
    }
    const std::string& s = *state_name;
    if (s == "creating") {
        return VolumeState::creating;
    } else if (s == "available") {
        return VolumeState::available;
    } else if (s == "in-use") {
        return VolumeState::in_use;
    } else if (s == "deleting") {
        return VolumeState::deleting;
    }
    // "deleted", "error" and anything newer
    return VolumeState::unknown;
}

SnapshotState ResourceMapper::snapshot_state_from_native(const std::optional<std::string>& state_name) {
    if (!state_name) {
        return SnapshotState::unknown;
    }
    const std::string& s = *state_name;
    if (s == "pending") {
        return SnapshotState::pending;
    } else if (s == "completed") {
        return SnapshotState::completed;
    } else if (s == "error") {
        return SnapshotState::error;
    }
    return SnapshotState::unknown;
}

bool ResourceMapper::is_active_attachment(const NativeVolumeAttachment& attachment) {
    if (!attachment.instance_id || attachment.instance_id->empty() || !attachment.state) {
        return false;
    }
    const std::string& s = *attachment.state;
    return s == "attaching" || s == "attached" || s == "busy";
}

Worker ResourceMapper::map_worker(const NativeInstance& native, const std::string& region) {
    Worker worker;
    worker.id = native.instance_id;
    worker.state = worker_state_from_native(native.state_name);
    worker.region = region;
    for (const auto& [key, value] : native.tags) {
        if (!key.empty()) {
            worker.tags[key] = value;
        }
    }
    return worker;
}

Worker ResourceMapper::map_worker(const NativeStateChange& native, const std::string& region) {
    Worker worker;
    worker.id = native.instance_id;
    worker.state = worker_state_from_native(native.current_state);
    worker.region = region;
    return worker;
}

Volume ResourceMapper::map_volume(const NativeVolume& native, const std::string& region) {
    Volume volume;
    volume.id = native.volume_id;
    volume.size_gb = native.size_gib.value_or(0);
    volume.region = region;

    VolumeState state = volume_state_from_native(native.state);
    const NativeVolumeAttachment* active = nullptr;
    for (const auto& attachment : native.attachments) {
        if (is_active_attachment(attachment)) {
            active = &attachment;
            break;
        }
    }

    if (state == VolumeState::in_use) {
        if (active != nullptr) {
            volume.attached_to = *active->instance_id;
        } else {
            // in-use without a live attachment (e.g. mid-detach) has no stable reading
            state = VolumeState::unknown;
        }
    }
    volume.state = state;
    return volume;
}

Volume ResourceMapper::map_volume(const NativeVolumeAttachment& native, const std::string& region) {
    Volume volume;
    volume.id = native.volume_id;
    volume.region = region;

    if (is_active_attachment(native)) {
        volume.state = VolumeState::in_use;
        volume.attached_to = *native.instance_id;
    } else if (native.state && *native.state == "detached") {
        volume.state = VolumeState::available;
    } else {
        volume.state = VolumeState::unknown;
    }
    return volume;
}

Snapshot ResourceMapper::map_snapshot(const NativeSnapshot& native, const std::string& region) {
    Snapshot snapshot;
    snapshot.id = native.snapshot_id;
    snapshot.source_volume_id = native.volume_id.value_or("");
    snapshot.state = snapshot_state_from_native(native.state);
    snapshot.region = region;
    return snapshot;
}

} // namespace cpi
} // namespace cumulus
