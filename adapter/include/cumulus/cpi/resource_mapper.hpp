#pragma once

#include "cumulus/cpi/core.hpp"
#include "cumulus/cpi/native_types.hpp"
#include <string>

namespace cumulus {
namespace cpi {

/**
 * Native record -> canonical entity.
 *
 * All functions are pure and total: absent or unrecognized native values map to
 * the Unknown state or an empty default, never to an error. Native fields without
 * a canonical counterpart are dropped.
 */
class ResourceMapper {
public:
    static Worker map_worker(const NativeInstance& native, const std::string& region);

    // Used when a call only reports the state transition
    static Worker map_worker(const NativeStateChange& native, const std::string& region);

    static Volume map_volume(const NativeVolume& native, const std::string& region);

    // Volume view derived from an attach/detach response; size is not known here
    static Volume map_volume(const NativeVolumeAttachment& native, const std::string& region);

    static Snapshot map_snapshot(const NativeSnapshot& native, const std::string& region);

    static WorkerState worker_state_from_native(const std::optional<std::string>& state_name);
    static VolumeState volume_state_from_native(const std::optional<std::string>& state_name);
    static SnapshotState snapshot_state_from_native(const std::optional<std::string>& state_name);

    // "attaching", "attached" and "busy" hold the volume on an instance
    static bool is_active_attachment(const NativeVolumeAttachment& attachment);
};

} // namespace cpi
} // namespace cumulus
