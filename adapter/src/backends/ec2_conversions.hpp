#pragma once

// SDK model <-> native record conversions shared by Ec2BackendClient and its tests

#include "cumulus/cpi/native_types.hpp"
#include <aws/core/utils/memory/stl/AWSString.h>
#include <aws/core/utils/memory/stl/AWSVector.h>
#include <aws/ec2/model/Instance.h>
#include <aws/ec2/model/InstanceStateChange.h>
#include <aws/ec2/model/InstanceStateName.h>
#include <aws/ec2/model/InstanceType.h>
#include <aws/ec2/model/SnapshotState.h>
#include <aws/ec2/model/Tag.h>
#include <aws/ec2/model/VolumeAttachmentState.h>
#include <aws/ec2/model/VolumeState.h>
#include <aws/ec2/model/VolumeType.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cumulus {
namespace cpi {
namespace ec2 {

namespace Model = Aws::EC2::Model;

inline Aws::String to_aws(const std::string& value) {
    return Aws::String(value.c_str(), value.size());
}

inline std::string from_aws(const Aws::String& value) {
    return std::string(value.c_str(), value.size());
}

inline std::optional<std::string> optional_from_aws(const Aws::String& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return from_aws(value);
}

inline Aws::Vector<Aws::String> to_aws(const std::vector<std::string>& values) {
    Aws::Vector<Aws::String> result;
    result.reserve(values.size());
    for (const auto& value : values) {
        result.push_back(to_aws(value));
    }
    return result;
}

template <class AwsError>
caf::error convert_error(const AwsError& error) {
    int32_t http_status = static_cast<int32_t>(error.GetResponseCode());
    if (http_status < 0) {
        http_status = 0;  // Request never left the client
    }
    return make_backend_error(http_status, from_aws(error.GetExceptionName()),
                              from_aws(error.GetMessage()));
}

template <class TagList>
std::vector<NativeTag> convert_tags(const TagList& tags) {
    std::vector<NativeTag> result;
    result.reserve(tags.size());
    for (const auto& tag : tags) {
        result.emplace_back(from_aws(tag.GetKey()), from_aws(tag.GetValue()));
    }
    return result;
}

inline NativeInstance convert_instance(const Model::Instance& instance) {
    NativeInstance native;
    native.instance_id = from_aws(instance.GetInstanceId());
    if (instance.StateHasBeenSet()) {
        native.state_name = optional_from_aws(
            Model::InstanceStateNameMapper::GetNameForInstanceStateName(instance.GetState().GetName()));
    }
    if (instance.InstanceTypeHasBeenSet()) {
        native.instance_type = optional_from_aws(
            Model::InstanceTypeMapper::GetNameForInstanceType(instance.GetInstanceType()));
    }
    native.image_id = optional_from_aws(instance.GetImageId());
    native.availability_zone = optional_from_aws(instance.GetPlacement().GetAvailabilityZone());
    native.public_ip = optional_from_aws(instance.GetPublicIpAddress());
    native.private_ip = optional_from_aws(instance.GetPrivateIpAddress());
    native.tags = convert_tags(instance.GetTags());
    return native;
}

inline NativeStateChange convert_state_change(const Model::InstanceStateChange& change) {
    NativeStateChange native;
    native.instance_id = from_aws(change.GetInstanceId());
    if (change.CurrentStateHasBeenSet()) {
        native.current_state = optional_from_aws(
            Model::InstanceStateNameMapper::GetNameForInstanceStateName(change.GetCurrentState().GetName()));
    }
    if (change.PreviousStateHasBeenSet()) {
        native.previous_state = optional_from_aws(
            Model::InstanceStateNameMapper::GetNameForInstanceStateName(change.GetPreviousState().GetName()));
    }
    return native;
}

// VolumeAttachment and the attach/detach responses share these accessors
template <class Attachment>
NativeVolumeAttachment convert_attachment(const Attachment& attachment) {
    NativeVolumeAttachment native;
    native.volume_id = from_aws(attachment.GetVolumeId());
    native.instance_id = optional_from_aws(attachment.GetInstanceId());
    native.device = optional_from_aws(attachment.GetDevice());
    native.state = optional_from_aws(
        Model::VolumeAttachmentStateMapper::GetNameForVolumeAttachmentState(attachment.GetState()));
    return native;
}

// Model::Volume and the CreateVolume response share these accessors
template <class VolumeLike>
NativeVolume convert_volume(const VolumeLike& volume) {
    NativeVolume native;
    native.volume_id = from_aws(volume.GetVolumeId());
    native.size_gib = static_cast<int64_t>(volume.GetSize());
    native.state = optional_from_aws(Model::VolumeStateMapper::GetNameForVolumeState(volume.GetState()));
    native.availability_zone = optional_from_aws(volume.GetAvailabilityZone());
    native.volume_type = optional_from_aws(Model::VolumeTypeMapper::GetNameForVolumeType(volume.GetVolumeType()));
    for (const auto& attachment : volume.GetAttachments()) {
        native.attachments.push_back(convert_attachment(attachment));
    }
    native.tags = convert_tags(volume.GetTags());
    return native;
}

// Model::Snapshot and the CreateSnapshot response share these accessors
template <class SnapshotLike>
NativeSnapshot convert_snapshot(const SnapshotLike& snapshot) {
    NativeSnapshot native;
    native.snapshot_id = from_aws(snapshot.GetSnapshotId());
    native.volume_id = optional_from_aws(snapshot.GetVolumeId());
    native.state = optional_from_aws(Model::SnapshotStateMapper::GetNameForSnapshotState(snapshot.GetState()));
    native.progress = optional_from_aws(snapshot.GetProgress());
    native.volume_size_gib = static_cast<int64_t>(snapshot.GetVolumeSize());
    native.description = optional_from_aws(snapshot.GetDescription());
    return native;
}

inline Model::Tag make_tag(const NativeTag& tag) {
    Model::Tag aws_tag;
    aws_tag.SetKey(to_aws(tag.first));
    aws_tag.SetValue(to_aws(tag.second));
    return aws_tag;
}

} // namespace ec2
} // namespace cpi
} // namespace cumulus
