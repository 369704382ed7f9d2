#pragma once

#include "cumulus/cpi/backend_client.hpp"
#include "cumulus/cpi/config.hpp"
#include "cumulus/cpi/credentials.hpp"
#include "cumulus/cpi/dispatcher.hpp"
#include "cumulus/cpi/observability.hpp"
#include "cumulus/cpi/session_registry.hpp"
#include <memory>
#include <string>

namespace Aws {
namespace EC2 {
class EC2Client;
} // namespace EC2
namespace Auth {
class DefaultAWSCredentialsProviderChain;
} // namespace Auth
} // namespace Aws

namespace cumulus {
namespace cpi {

// Keeps the AWS SDK initialized while any holder is alive
class AwsSdkGuard;

// Standard AWS chain: environment, profile files, SSO, container and instance roles
class AwsChainCredentialProvider : public CredentialProvider {
public:
    AwsChainCredentialProvider();
    ~AwsChainCredentialProvider() override;

    caf::expected<Credentials> get_credentials() const override;

private:
    std::shared_ptr<AwsSdkGuard> sdk_;
    std::shared_ptr<Aws::Auth::DefaultAWSCredentialsProviderChain> chain_;
};

/**
 * BackendClient over the AWS SDK EC2 client
 *
 * Bound to one region; describe calls follow NextToken until exhausted.
 * SDK errors become backend errors carrying the HTTP status, the AWS error code
 * and its message.
 */
class Ec2BackendClient : public BackendClient {
public:
    Ec2BackendClient(std::string region,
                     std::shared_ptr<const CredentialProvider> credentials,
                     const AdapterConfig& config);
    ~Ec2BackendClient() override;

    const std::string& region() const override { return region_; }

    caf::expected<std::vector<NativeInstance>>
    describe_instances(const std::vector<std::string>& instance_ids) const override;
    caf::expected<NativeInstance> run_instance(const RunInstanceSpec& spec) const override;
    caf::expected<NativeStateChange> terminate_instance(const std::string& instance_id) const override;
    caf::expected<NativeStateChange> start_instance(const std::string& instance_id) const override;
    caf::expected<void> reboot_instance(const std::string& instance_id) const override;

    caf::expected<std::vector<NativeVolume>>
    describe_volumes(const std::vector<std::string>& volume_ids) const override;
    caf::expected<NativeVolume> create_volume(const CreateVolumeSpec& spec) const override;
    caf::expected<void> delete_volume(const std::string& volume_id) const override;
    caf::expected<NativeVolumeAttachment> attach_volume(const AttachVolumeSpec& spec) const override;
    caf::expected<NativeVolumeAttachment> detach_volume(const DetachVolumeSpec& spec) const override;

    caf::expected<std::vector<NativeSnapshot>>
    describe_snapshots(const std::vector<std::string>& snapshot_ids) const override;
    caf::expected<NativeSnapshot> create_snapshot(const CreateSnapshotSpec& spec) const override;
    caf::expected<void> delete_snapshot(const std::string& snapshot_id) const override;

    caf::expected<void> create_tags(const std::string& resource_id,
                                    const std::vector<NativeTag>& tags) const override;

    caf::expected<std::vector<std::string>> describe_regions() const override;

private:
    std::string region_;
    std::shared_ptr<AwsSdkGuard> sdk_;   // Declared first so it outlives client_
    std::unique_ptr<Aws::EC2::EC2Client> client_;
};

// Region -> Ec2BackendClient. Uses the AWS chain when no credential provider is given.
SessionRegistry::Factory make_ec2_session_factory(const AdapterConfig& config,
                                                  std::shared_ptr<const CredentialProvider> credentials = nullptr);

// Dispatcher wired to EC2 sessions; builds observability from config when none is given
std::shared_ptr<ActionDispatcher> make_ec2_provider(const AdapterConfig& config,
                                                    std::shared_ptr<Observability> observability = nullptr,
                                                    std::shared_ptr<const CredentialProvider> credentials = nullptr);

} // namespace cpi
} // namespace cumulus
