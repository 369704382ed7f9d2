#pragma once

#include "cumulus/cpi/native_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <caf/expected.hpp>

namespace cumulus {
namespace cpi {

struct RunInstanceSpec {
    std::string image_id;
    std::string instance_type;
    std::optional<std::string> key_name;
    std::optional<std::string> subnet_id;
};

struct CreateVolumeSpec {
    int64_t size_gib = 0;
    std::string availability_zone;
    std::string volume_type;
};

struct AttachVolumeSpec {
    std::string volume_id;
    std::string instance_id;
    std::string device;
};

struct DetachVolumeSpec {
    std::string volume_id;
    std::optional<std::string> instance_id;
    std::optional<std::string> device;
    bool force = false;
};

struct CreateSnapshotSpec {
    std::string volume_id;
    std::string description;
    std::vector<NativeTag> tags;
};

/**
 * Backend Client Facade
 *
 * One method per backend operation. Parameters arrive already validated; results
 * are native records or a backend error (see make_backend_error). No mapping or
 * classification happens here.
 *
 * A facade instance is bound to one region and one credential source and is never
 * mutated after construction, so it can be shared by concurrent calls.
 */
class BackendClient {
public:
    virtual ~BackendClient() = default;

    virtual const std::string& region() const = 0;

    // Empty id list describes everything visible to the caller
    virtual caf::expected<std::vector<NativeInstance>>
    describe_instances(const std::vector<std::string>& instance_ids) const = 0;

    virtual caf::expected<NativeInstance> run_instance(const RunInstanceSpec& spec) const = 0;

    virtual caf::expected<NativeStateChange> terminate_instance(const std::string& instance_id) const = 0;

    virtual caf::expected<NativeStateChange> start_instance(const std::string& instance_id) const = 0;

    virtual caf::expected<void> reboot_instance(const std::string& instance_id) const = 0;

    virtual caf::expected<std::vector<NativeVolume>>
    describe_volumes(const std::vector<std::string>& volume_ids) const = 0;

    virtual caf::expected<NativeVolume> create_volume(const CreateVolumeSpec& spec) const = 0;

    virtual caf::expected<void> delete_volume(const std::string& volume_id) const = 0;

    virtual caf::expected<NativeVolumeAttachment> attach_volume(const AttachVolumeSpec& spec) const = 0;

    virtual caf::expected<NativeVolumeAttachment> detach_volume(const DetachVolumeSpec& spec) const = 0;

    virtual caf::expected<std::vector<NativeSnapshot>>
    describe_snapshots(const std::vector<std::string>& snapshot_ids) const = 0;

    virtual caf::expected<NativeSnapshot> create_snapshot(const CreateSnapshotSpec& spec) const = 0;

    virtual caf::expected<void> delete_snapshot(const std::string& snapshot_id) const = 0;

    virtual caf::expected<void> create_tags(const std::string& resource_id,
                                            const std::vector<NativeTag>& tags) const = 0;

    // Cheap read used to verify credentials and endpoint
    virtual caf::expected<std::vector<std::string>> describe_regions() const = 0;
};

} // namespace cpi
} // namespace cumulus
