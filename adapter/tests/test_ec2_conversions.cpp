#include <iostream>
#include <cassert>
#include <memory>
#include <string>
#include <aws/core/client/AWSError.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/ec2/EC2Errors.h>
#include <aws/ec2/model/Instance.h>
#include <aws/ec2/model/InstanceState.h>
#include <aws/ec2/model/InstanceStateChange.h>
#include <aws/ec2/model/Placement.h>
#include <aws/ec2/model/Snapshot.h>
#include <aws/ec2/model/Tag.h>
#include <aws/ec2/model/Volume.h>
#include <aws/ec2/model/VolumeAttachment.h>
#include "aws_sdk_guard.hpp"
#include "ec2_conversions.hpp"
#include "cumulus/cpi/error_classifier.hpp"
#include "cumulus/cpi/resource_mapper.hpp"

using namespace cumulus::cpi;
namespace Model = Aws::EC2::Model;

namespace {

Model::Tag tag(const char* key, const char* value) {
    Model::Tag result;
    result.SetKey(key);
    result.SetValue(value);
    return result;
}

Model::InstanceState instance_state(Model::InstanceStateName name) {
    Model::InstanceState state;
    state.SetName(name);
    return state;
}

} // namespace

void test_volume_in_use() {
    std::cout << "Testing in-use volume conversion..." << std::endl;

    Model::VolumeAttachment attachment;
    attachment.SetVolumeId("vol-0abc");
    attachment.SetInstanceId("i-0123");
    attachment.SetDevice("/dev/sdf");
    attachment.SetState(Model::VolumeAttachmentState::attached);

    Model::Volume volume;
    volume.SetVolumeId("vol-0abc");
    volume.SetSize(100);
    volume.SetState(Model::VolumeState::in_use);
    volume.SetAvailabilityZone("eu-west-1b");
    volume.SetVolumeType(Model::VolumeType::gp3);
    volume.AddAttachments(attachment);
    volume.AddTags(tag("Name", "data"));

    NativeVolume native = ec2::convert_volume(volume);
    assert(native.volume_id == "vol-0abc");
    assert(native.size_gib == 100);
    assert(native.state == std::string("in-use"));
    assert(native.availability_zone == std::string("eu-west-1b"));
    assert(native.volume_type == std::string("gp3"));
    assert(native.attachments.size() == 1);
    assert(native.attachments[0].state == std::string("attached"));
    assert(native.attachments[0].device == std::string("/dev/sdf"));
    assert(native.tags.size() == 1);
    assert(native.tags[0].first == "Name");

    Volume mapped = ResourceMapper::map_volume(native, "eu-west-1");
    assert(mapped.state == VolumeState::in_use);
    assert(mapped.attached_to == std::string("i-0123"));
    assert(mapped.size_gb == 100);

    std::cout << "✓ In-use volume conversion test passed" << std::endl;
}

void test_detaching_attachment() {
    std::cout << "Testing detaching attachment conversion..." << std::endl;

    Model::VolumeAttachment attachment;
    attachment.SetVolumeId("vol-0abc");
    attachment.SetInstanceId("i-0123");
    attachment.SetState(Model::VolumeAttachmentState::detaching);

    NativeVolumeAttachment native = ec2::convert_attachment(attachment);
    assert(native.state == std::string("detaching"));
    assert(!native.device.has_value());

    Volume mapped = ResourceMapper::map_volume(native, "eu-west-1");
    assert(mapped.state == VolumeState::unknown);
    assert(!mapped.attached_to.has_value());

    std::cout << "✓ Detaching attachment conversion test passed" << std::endl;
}

void test_instance_conversion() {
    std::cout << "Testing instance conversion..." << std::endl;

    Model::Placement placement;
    placement.SetAvailabilityZone("us-east-1c");

    Model::Instance instance;
    instance.SetInstanceId("i-0123");
    instance.SetState(instance_state(Model::InstanceStateName::running));
    instance.SetInstanceType(Model::InstanceType::t3_micro);
    instance.SetImageId("ami-12345678");
    instance.SetPlacement(placement);
    instance.SetPrivateIpAddress("10.0.0.12");
    instance.AddTags(tag("Name", "build-agent"));

    NativeInstance native = ec2::convert_instance(instance);
    assert(native.instance_id == "i-0123");
    assert(native.state_name == std::string("running"));
    assert(native.instance_type == std::string("t3.micro"));
    assert(native.availability_zone == std::string("us-east-1c"));
    assert(native.private_ip == std::string("10.0.0.12"));
    assert(!native.public_ip.has_value());

    Worker worker = ResourceMapper::map_worker(native, "us-east-1");
    assert(worker.state == WorkerState::running);
    assert(worker.tags.at("Name") == "build-agent");

    // No state in the response reads as unknown, not pending
    Model::Instance bare;
    bare.SetInstanceId("i-0456");
    NativeInstance bare_native = ec2::convert_instance(bare);
    assert(!bare_native.state_name.has_value());
    assert(ResourceMapper::map_worker(bare_native, "us-east-1").state == WorkerState::unknown);

    std::cout << "✓ Instance conversion test passed" << std::endl;
}

void test_state_change_conversion() {
    std::cout << "Testing state change conversion..." << std::endl;

    Model::InstanceStateChange change;
    change.SetInstanceId("i-0123");
    change.SetCurrentState(instance_state(Model::InstanceStateName::shutting_down));
    change.SetPreviousState(instance_state(Model::InstanceStateName::running));

    NativeStateChange native = ec2::convert_state_change(change);
    assert(native.current_state == std::string("shutting-down"));
    assert(native.previous_state == std::string("running"));
    assert(ResourceMapper::map_worker(native, "us-east-1").state == WorkerState::stopping);

    std::cout << "✓ State change conversion test passed" << std::endl;
}

void test_snapshot_conversion() {
    std::cout << "Testing snapshot conversion..." << std::endl;

    Model::Snapshot snapshot;
    snapshot.SetSnapshotId("snap-0abc");
    snapshot.SetVolumeId("vol-0abc");
    snapshot.SetState(Model::SnapshotState::completed);
    snapshot.SetProgress("100%");
    snapshot.SetVolumeSize(8);
    snapshot.SetDescription("nightly");

    NativeSnapshot native = ec2::convert_snapshot(snapshot);
    assert(native.state == std::string("completed"));
    assert(native.volume_size_gib == 8);
    assert(native.progress == std::string("100%"));

    Snapshot mapped = ResourceMapper::map_snapshot(native, "us-east-1");
    assert(mapped.state == SnapshotState::completed);
    assert(mapped.source_volume_id == "vol-0abc");

    std::cout << "✓ Snapshot conversion test passed" << std::endl;
}

void test_error_conversion() {
    std::cout << "Testing SDK error conversion..." << std::endl;

    Aws::Client::AWSError<Aws::EC2::EC2Errors> missing(
        Aws::EC2::EC2Errors::UNKNOWN, "InvalidVolume.NotFound", "The volume 'vol-1' does not exist", false);
    missing.SetResponseCode(Aws::Http::HttpResponseCode::BAD_REQUEST);

    caf::error converted = ec2::convert_error(missing);
    assert(is_backend_error(converted));
    BackendError native = to_backend_error(converted);
    assert(native.http_status == 400);
    assert(native.code == "InvalidVolume.NotFound");
    assert(native.message == "The volume 'vol-1' does not exist");
    assert(ErrorClassifier::classify(converted) == ErrorKind::not_found);

    Aws::Client::AWSError<Aws::EC2::EC2Errors> throttled(
        Aws::EC2::EC2Errors::UNKNOWN, "RequestLimitExceeded", "Request limit exceeded.", true);
    throttled.SetResponseCode(Aws::Http::HttpResponseCode::SERVICE_UNAVAILABLE);
    assert(ErrorClassifier::classify(ec2::convert_error(throttled)) == ErrorKind::rate_limited);

    // No response at all
    Aws::Client::AWSError<Aws::EC2::EC2Errors> offline(
        Aws::EC2::EC2Errors::NETWORK_CONNECTION, "", "Unable to connect to endpoint", true);
    BackendError offline_native = to_backend_error(ec2::convert_error(offline));
    assert(offline_native.http_status == 0);
    assert(offline_native.code.empty());

    std::cout << "✓ SDK error conversion test passed" << std::endl;
}

int main() {
    std::cout << "Running EC2 Conversion Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        auto sdk = AwsSdkGuard::acquire();

        std::cout << "\n[Volume Tests]" << std::endl;
        test_volume_in_use();
        test_detaching_attachment();

        std::cout << "\n[Instance Tests]" << std::endl;
        test_instance_conversion();
        test_state_change_conversion();

        std::cout << "\n[Snapshot Tests]" << std::endl;
        test_snapshot_conversion();

        std::cout << "\n[Error Tests]" << std::endl;
        test_error_conversion();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All EC2 conversion tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
