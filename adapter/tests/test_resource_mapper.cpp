#include <iostream>
#include <cassert>
#include <string>
#include "cumulus/cpi/resource_mapper.hpp"

using namespace cumulus::cpi;

void test_worker_states() {
    std::cout << "Testing worker state mapping..." << std::endl;

    assert(ResourceMapper::worker_state_from_native(std::string("pending")) == WorkerState::pending);
    assert(ResourceMapper::worker_state_from_native(std::string("running")) == WorkerState::running);
    assert(ResourceMapper::worker_state_from_native(std::string("stopping")) == WorkerState::stopping);
    assert(ResourceMapper::worker_state_from_native(std::string("shutting-down")) == WorkerState::stopping);
    assert(ResourceMapper::worker_state_from_native(std::string("stopped")) == WorkerState::stopped);
    assert(ResourceMapper::worker_state_from_native(std::string("terminated")) == WorkerState::terminated);
    assert(ResourceMapper::worker_state_from_native(std::string("hibernating")) == WorkerState::unknown);
    assert(ResourceMapper::worker_state_from_native(std::nullopt) == WorkerState::unknown);

    std::cout << "✓ Worker state mapping test passed" << std::endl;
}

void test_map_worker() {
    std::cout << "Testing map_worker..." << std::endl;

    NativeInstance native;
    native.instance_id = "i-0abc";
    native.state_name = "running";
    native.instance_type = "t3.micro";
    native.public_ip = "203.0.113.10";
    native.tags = {{"Name", "agent"}, {"", "dropped"}, {"team", "infra"}};

    Worker worker = ResourceMapper::map_worker(native, "eu-west-1");
    assert(worker.id == "i-0abc");
    assert(worker.state == WorkerState::running);
    assert(worker.region == "eu-west-1");
    assert(worker.tags.size() == 2);
    assert(worker.tags.at("Name") == "agent");
    assert(worker.tags.at("team") == "infra");

    std::cout << "✓ map_worker test passed" << std::endl;
}

void test_map_worker_state_change() {
    std::cout << "Testing map_worker from state change..." << std::endl;

    NativeStateChange change;
    change.instance_id = "i-0abc";
    change.previous_state = "stopped";
    change.current_state = "pending";

    Worker worker = ResourceMapper::map_worker(change, "us-east-1");
    assert(worker.id == "i-0abc");
    assert(worker.state == WorkerState::pending);
    assert(worker.tags.empty());

    NativeStateChange blank;
    blank.instance_id = "i-0def";
    assert(ResourceMapper::map_worker(blank, "us-east-1").state == WorkerState::unknown);

    std::cout << "✓ map_worker state change test passed" << std::endl;
}

void test_map_volume_attached() {
    std::cout << "Testing map_volume attached..." << std::endl;

    NativeVolumeAttachment attachment;
    attachment.volume_id = "vol-1";
    attachment.instance_id = "i-1";
    attachment.device = "/dev/sdf";
    attachment.state = "attached";

    NativeVolume native;
    native.volume_id = "vol-1";
    native.size_gib = 50;
    native.state = "in-use";
    native.attachments = {attachment};

    Volume volume = ResourceMapper::map_volume(native, "us-east-1");
    assert(volume.id == "vol-1");
    assert(volume.size_gb == 50);
    assert(volume.state == VolumeState::in_use);
    assert(volume.attached_to == std::string("i-1"));

    std::cout << "✓ map_volume attached test passed" << std::endl;
}

void test_map_volume_available() {
    std::cout << "Testing map_volume available..." << std::endl;

    NativeVolume native;
    native.volume_id = "vol-2";
    native.size_gib = 8;
    native.state = "available";

    Volume volume = ResourceMapper::map_volume(native, "us-east-1");
    assert(volume.state == VolumeState::available);
    assert(!volume.attached_to.has_value());

    NativeVolume creating = native;
    creating.state = "creating";
    assert(ResourceMapper::map_volume(creating, "us-east-1").state == VolumeState::creating);

    NativeVolume deleting = native;
    deleting.state = "deleting";
    assert(ResourceMapper::map_volume(deleting, "us-east-1").state == VolumeState::deleting);

    std::cout << "✓ map_volume available test passed" << std::endl;
}

void test_map_volume_in_use_without_attachment() {
    std::cout << "Testing map_volume in-use without live attachment..." << std::endl;

    NativeVolumeAttachment detaching;
    detaching.volume_id = "vol-3";
    detaching.instance_id = "i-3";
    detaching.state = "detaching";

    NativeVolume native;
    native.volume_id = "vol-3";
    native.state = "in-use";
    native.attachments = {detaching};

    Volume volume = ResourceMapper::map_volume(native, "us-east-1");
    assert(volume.state == VolumeState::unknown);
    assert(!volume.attached_to.has_value());

    std::cout << "✓ map_volume in-use without attachment test passed" << std::endl;
}

void test_map_volume_ignores_stale_attachment() {
    std::cout << "Testing map_volume with stale attachment..." << std::endl;

    NativeVolumeAttachment stale;
    stale.volume_id = "vol-4";
    stale.instance_id = "i-4";
    stale.state = "detached";

    NativeVolume native;
    native.volume_id = "vol-4";
    native.state = "available";
    native.attachments = {stale};

    Volume volume = ResourceMapper::map_volume(native, "us-east-1");
    assert(volume.state == VolumeState::available);
    assert(!volume.attached_to.has_value());

    std::cout << "✓ map_volume stale attachment test passed" << std::endl;
}

void test_map_volume_from_attachment() {
    std::cout << "Testing map_volume from attachment..." << std::endl;

    NativeVolumeAttachment attaching;
    attaching.volume_id = "vol-5";
    attaching.instance_id = "i-5";
    attaching.state = "attaching";

    Volume attached = ResourceMapper::map_volume(attaching, "us-east-1");
    assert(attached.state == VolumeState::in_use);
    assert(attached.attached_to == std::string("i-5"));
    assert(attached.size_gb == 0);

    NativeVolumeAttachment detached = attaching;
    detached.state = "detached";
    Volume released = ResourceMapper::map_volume(detached, "us-east-1");
    assert(released.state == VolumeState::available);
    assert(!released.attached_to.has_value());

    NativeVolumeAttachment detaching = attaching;
    detaching.state = "detaching";
    assert(ResourceMapper::map_volume(detaching, "us-east-1").state == VolumeState::unknown);

    std::cout << "✓ map_volume from attachment test passed" << std::endl;
}

void test_map_snapshot() {
    std::cout << "Testing map_snapshot..." << std::endl;

    NativeSnapshot native;
    native.snapshot_id = "snap-1";
    native.volume_id = "vol-1";
    native.state = "completed";
    native.progress = "100%";

    Snapshot snapshot = ResourceMapper::map_snapshot(native, "ap-south-1");
    assert(snapshot.id == "snap-1");
    assert(snapshot.source_volume_id == "vol-1");
    assert(snapshot.state == SnapshotState::completed);
    assert(snapshot.region == "ap-south-1");

    NativeSnapshot bare;
    bare.snapshot_id = "snap-2";
    Snapshot unknown = ResourceMapper::map_snapshot(bare, "ap-south-1");
    assert(unknown.source_volume_id.empty());
    assert(unknown.state == SnapshotState::unknown);

    assert(ResourceMapper::snapshot_state_from_native(std::string("error")) == SnapshotState::error);
    assert(ResourceMapper::snapshot_state_from_native(std::string("recoverable")) == SnapshotState::unknown);

    std::cout << "✓ map_snapshot test passed" << std::endl;
}

int main() {
    std::cout << "Running Resource Mapper Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        std::cout << "\n[Worker Tests]" << std::endl;
        test_worker_states();
        test_map_worker();
        test_map_worker_state_change();

        std::cout << "\n[Volume Tests]" << std::endl;
        test_map_volume_attached();
        test_map_volume_available();
        test_map_volume_in_use_without_attachment();
        test_map_volume_ignores_stale_attachment();
        test_map_volume_from_attachment();

        std::cout << "\n[Snapshot Tests]" << std::endl;
        test_map_snapshot();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All resource mapper tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
