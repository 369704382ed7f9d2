#include "cumulus/cpi/backends/ec2_client.hpp"
#include "cumulus/cpi/core.hpp"
#include "aws_sdk_guard.hpp"
#include "ec2_conversions.hpp"
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/ec2/EC2Client.h>
#include <aws/ec2/model/AttachVolumeRequest.h>
#include <aws/ec2/model/CreateSnapshotRequest.h>
#include <aws/ec2/model/CreateTagsRequest.h>
#include <aws/ec2/model/CreateVolumeRequest.h>
#include <aws/ec2/model/DeleteSnapshotRequest.h>
#include <aws/ec2/model/DeleteVolumeRequest.h>
#include <aws/ec2/model/DescribeInstancesRequest.h>
#include <aws/ec2/model/DescribeRegionsRequest.h>
#include <aws/ec2/model/DescribeSnapshotsRequest.h>
#include <aws/ec2/model/DescribeVolumesRequest.h>
#include <aws/ec2/model/DetachVolumeRequest.h>
#include <aws/ec2/model/RebootInstancesRequest.h>
#include <aws/ec2/model/RunInstancesRequest.h>
#include <aws/ec2/model/StartInstancesRequest.h>
#include <aws/ec2/model/TerminateInstancesRequest.h>
#include <limits>

namespace cumulus {
namespace cpi {

using namespace ec2;

namespace {

const char* const ALLOC_TAG = "cumulus-cpi";

// Exposes a CredentialProvider to the SDK. Resolution failures yield empty
// credentials, which the service rejects with AuthFailure.
class CredentialProviderBridge : public Aws::Auth::AWSCredentialsProvider {
public:
    explicit CredentialProviderBridge(std::shared_ptr<const CredentialProvider> provider)
        : provider_(std::move(provider)) {}

    Aws::Auth::AWSCredentials GetAWSCredentials() override {
        auto resolved = provider_->get_credentials();
        if (!resolved || resolved->empty()) {
            return Aws::Auth::AWSCredentials();
        }
        return Aws::Auth::AWSCredentials(to_aws(resolved->access_key_id),
                                         to_aws(resolved->secret_access_key),
                                         to_aws(resolved->session_token));
    }

private:
    std::shared_ptr<const CredentialProvider> provider_;
};

} // namespace

Ec2BackendClient::Ec2BackendClient(std::string region,
                                   std::shared_ptr<const CredentialProvider> credentials,
                                   const AdapterConfig& config)
    : region_(std::move(region)), sdk_(AwsSdkGuard::acquire()) {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = to_aws(region_);
    if (!config.endpoint_override.empty()) {
        client_config.endpointOverride = to_aws(config.endpoint_override);
    }

    std::shared_ptr<Aws::Auth::AWSCredentialsProvider> bridge =
        Aws::MakeShared<CredentialProviderBridge>(ALLOC_TAG, std::move(credentials));
    client_ = std::make_unique<Aws::EC2::EC2Client>(bridge, client_config);
}

Ec2BackendClient::~Ec2BackendClient() {
    client_.reset();
}

// Instances

caf::expected<std::vector<NativeInstance>>
Ec2BackendClient::describe_instances(const std::vector<std::string>& instance_ids) const {
    Model::DescribeInstancesRequest request;
    if (!instance_ids.empty()) {
        request.SetInstanceIds(to_aws(instance_ids));
    }

    std::vector<NativeInstance> result;
    while (true) {
        auto outcome = client_->DescribeInstances(request);
        if (!outcome.IsSuccess()) {
            return convert_error(outcome.GetError());
        }
        for (const auto& reservation : outcome.GetResult().GetReservations()) {
            for (const auto& instance : reservation.GetInstances()) {
                result.push_back(convert_instance(instance));
            }
        }
        const auto& next_token = outcome.GetResult().GetNextToken();
        if (next_token.empty()) {
            break;
        }
        request.SetNextToken(next_token);
    }
    return result;
}

caf::expected<NativeInstance> Ec2BackendClient::run_instance(const RunInstanceSpec& spec) const {
    Model::RunInstancesRequest request;
    request.SetImageId(to_aws(spec.image_id));
    request.SetInstanceType(Model::InstanceTypeMapper::GetInstanceTypeForName(to_aws(spec.instance_type)));
    request.SetMinCount(1);
    request.SetMaxCount(1);
    if (spec.key_name) {
        request.SetKeyName(to_aws(*spec.key_name));
    }
    if (spec.subnet_id) {
        request.SetSubnetId(to_aws(*spec.subnet_id));
    }

    auto outcome = client_->RunInstances(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    const auto& instances = outcome.GetResult().GetInstances();
    if (instances.empty()) {
        return make_backend_error(0, "", "RunInstances returned no instance");
    }
    return convert_instance(instances.front());
}

caf::expected<NativeStateChange> Ec2BackendClient::terminate_instance(const std::string& instance_id) const {
    Model::TerminateInstancesRequest request;
    request.AddInstanceIds(to_aws(instance_id));

    auto outcome = client_->TerminateInstances(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    const auto& changes = outcome.GetResult().GetTerminatingInstances();
    if (changes.empty()) {
        NativeStateChange change;
        change.instance_id = instance_id;
        return change;
    }
    return convert_state_change(changes.front());
}

caf::expected<NativeStateChange> Ec2BackendClient::start_instance(const std::string& instance_id) const {
    Model::StartInstancesRequest request;
    request.AddInstanceIds(to_aws(instance_id));

    auto outcome = client_->StartInstances(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    const auto& changes = outcome.GetResult().GetStartingInstances();
    if (changes.empty()) {
        NativeStateChange change;
        change.instance_id = instance_id;
        return change;
    }
    return convert_state_change(changes.front());
}

caf::expected<void> Ec2BackendClient::reboot_instance(const std::string& instance_id) const {
    Model::RebootInstancesRequest request;
    request.AddInstanceIds(to_aws(instance_id));

    auto outcome = client_->RebootInstances(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    return caf::unit;
}

// Volumes

caf::expected<std::vector<NativeVolume>>
Ec2BackendClient::describe_volumes(const std::vector<std::string>& volume_ids) const {
    Model::DescribeVolumesRequest request;
    if (!volume_ids.empty()) {
        request.SetVolumeIds(to_aws(volume_ids));
    }

    std::vector<NativeVolume> result;
    while (true) {
        auto outcome = client_->DescribeVolumes(request);
        if (!outcome.IsSuccess()) {
            return convert_error(outcome.GetError());
        }
        for (const auto& volume : outcome.GetResult().GetVolumes()) {
            result.push_back(convert_volume(volume));
        }
        const auto& next_token = outcome.GetResult().GetNextToken();
        if (next_token.empty()) {
            break;
        }
        request.SetNextToken(next_token);
    }
    return result;
}

caf::expected<NativeVolume> Ec2BackendClient::create_volume(const CreateVolumeSpec& spec) const {
    if (spec.size_gib < 1 || spec.size_gib > std::numeric_limits<int>::max()) {
        return make_error(ErrorKind::invalid_parameters,
                          "volume size " + std::to_string(spec.size_gib) + " GiB is out of range");
    }
    Model::CreateVolumeRequest request;
    request.SetSize(static_cast<int>(spec.size_gib));
    request.SetAvailabilityZone(to_aws(spec.availability_zone));
    if (!spec.volume_type.empty()) {
        request.SetVolumeType(Model::VolumeTypeMapper::GetVolumeTypeForName(to_aws(spec.volume_type)));
    }

    auto outcome = client_->CreateVolume(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    return convert_volume(outcome.GetResult());
}

caf::expected<void> Ec2BackendClient::delete_volume(const std::string& volume_id) const {
    Model::DeleteVolumeRequest request;
    request.SetVolumeId(to_aws(volume_id));

    auto outcome = client_->DeleteVolume(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    return caf::unit;
}

caf::expected<NativeVolumeAttachment> Ec2BackendClient::attach_volume(const AttachVolumeSpec& spec) const {
    Model::AttachVolumeRequest request;
    request.SetVolumeId(to_aws(spec.volume_id));
    request.SetInstanceId(to_aws(spec.instance_id));
    request.SetDevice(to_aws(spec.device));

    auto outcome = client_->AttachVolume(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    return convert_attachment(outcome.GetResult());
}

caf::expected<NativeVolumeAttachment> Ec2BackendClient::detach_volume(const DetachVolumeSpec& spec) const {
    Model::DetachVolumeRequest request;
    request.SetVolumeId(to_aws(spec.volume_id));
    if (spec.instance_id) {
        request.SetInstanceId(to_aws(*spec.instance_id));
    }
    if (spec.device) {
        request.SetDevice(to_aws(*spec.device));
    }
    if (spec.force) {
        request.SetForce(true);
    }

    auto outcome = client_->DetachVolume(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    return convert_attachment(outcome.GetResult());
}

// Snapshots

caf::expected<std::vector<NativeSnapshot>>
Ec2BackendClient::describe_snapshots(const std::vector<std::string>& snapshot_ids) const {
    Model::DescribeSnapshotsRequest request;
    if (snapshot_ids.empty()) {
        // Without ids EC2 also lists every public snapshot
        request.AddOwnerIds("self");
    } else {
        request.SetSnapshotIds(to_aws(snapshot_ids));
    }

    std::vector<NativeSnapshot> result;
    while (true) {
        auto outcome = client_->DescribeSnapshots(request);
        if (!outcome.IsSuccess()) {
            return convert_error(outcome.GetError());
        }
        for (const auto& snapshot : outcome.GetResult().GetSnapshots()) {
            result.push_back(convert_snapshot(snapshot));
        }
        const auto& next_token = outcome.GetResult().GetNextToken();
        if (next_token.empty()) {
            break;
        }
        request.SetNextToken(next_token);
    }
    return result;
}

caf::expected<NativeSnapshot> Ec2BackendClient::create_snapshot(const CreateSnapshotSpec& spec) const {
    Model::CreateSnapshotRequest request;
    request.SetVolumeId(to_aws(spec.volume_id));
    if (!spec.description.empty()) {
        request.SetDescription(to_aws(spec.description));
    }
    if (!spec.tags.empty()) {
        Model::TagSpecification tag_spec;
        tag_spec.SetResourceType(Model::ResourceType::snapshot);
        for (const auto& tag : spec.tags) {
            tag_spec.AddTags(make_tag(tag));
        }
        request.AddTagSpecifications(tag_spec);
    }

    auto outcome = client_->CreateSnapshot(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    return convert_snapshot(outcome.GetResult());
}

caf::expected<void> Ec2BackendClient::delete_snapshot(const std::string& snapshot_id) const {
    Model::DeleteSnapshotRequest request;
    request.SetSnapshotId(to_aws(snapshot_id));

    auto outcome = client_->DeleteSnapshot(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    return caf::unit;
}

// Tags and regions

caf::expected<void> Ec2BackendClient::create_tags(const std::string& resource_id,
                                                  const std::vector<NativeTag>& tags) const {
    Model::CreateTagsRequest request;
    request.AddResources(to_aws(resource_id));
    for (const auto& tag : tags) {
        request.AddTags(make_tag(tag));
    }

    auto outcome = client_->CreateTags(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    return caf::unit;
}

caf::expected<std::vector<std::string>> Ec2BackendClient::describe_regions() const {
    Model::DescribeRegionsRequest request;

    auto outcome = client_->DescribeRegions(request);
    if (!outcome.IsSuccess()) {
        return convert_error(outcome.GetError());
    }
    std::vector<std::string> regions;
    for (const auto& region : outcome.GetResult().GetRegions()) {
        regions.push_back(from_aws(region.GetRegionName()));
    }
    return regions;
}

// Wiring

SessionRegistry::Factory make_ec2_session_factory(const AdapterConfig& config,
                                                  std::shared_ptr<const CredentialProvider> credentials) {
    return [config, credentials](const std::string& region) -> caf::expected<SessionRegistry::Session> {
        std::shared_ptr<const CredentialProvider> provider = credentials;
        if (!provider) {
            provider = std::make_shared<AwsChainCredentialProvider>();
        }

        auto resolved = provider->get_credentials();
        if (!resolved) {
            return resolved.error();
        }
        if (resolved->empty()) {
            return make_error(ErrorKind::authentication_error, "credential provider returned empty credentials");
        }

        return std::make_shared<const Ec2BackendClient>(region, provider, config);
    };
}

std::shared_ptr<ActionDispatcher> make_ec2_provider(const AdapterConfig& config,
                                                    std::shared_ptr<Observability> observability,
                                                    std::shared_ptr<const CredentialProvider> credentials) {
    auto sessions = std::make_shared<SessionRegistry>(make_ec2_session_factory(config, std::move(credentials)));
    if (!observability) {
        observability = Observability::from_config("ec2", config);
    }
    return std::make_shared<ActionDispatcher>(std::move(sessions), config, std::move(observability));
}

} // namespace cpi
} // namespace cumulus
