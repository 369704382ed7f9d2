#include <iostream>
#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include "cumulus/cpi/actors.hpp"
#include "fake_backend.hpp"

using namespace cumulus::cpi;
using namespace cumulus::cpi::testing;
using json = nlohmann::json;

namespace {

// Provider whose dispatch outlives the host timeout
class SlowProvider : public ProviderExtension {
public:
    explicit SlowProvider(std::chrono::milliseconds delay) : delay_(delay) {}

    std::string name() const override { return "slow"; }
    std::string provider_type() const override { return "test"; }
    std::vector<std::string> list_actions() const override { return {"list_workers"}; }
    std::optional<ActionDefinition> action_definition(const std::string&) const override {
        return std::nullopt;
    }

    ActionResult dispatch(const std::string&, const json&) override {
        std::this_thread::sleep_for(delay_);
        return ActionResult::success(std::vector<Worker>{});
    }

private:
    std::chrono::milliseconds delay_;
};

class ThrowingProvider : public SlowProvider {
public:
    ThrowingProvider() : SlowProvider(std::chrono::milliseconds(0)) {}

    ActionResult dispatch(const std::string&, const json&) override {
        throw std::runtime_error("provider exploded");
    }
};

} // namespace

void test_dispatch_json_round_trip(caf::actor_system& system) {
    std::cout << "Testing host dispatch round trip..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    ActionHost host(system, make_test_dispatcher(cloud), 5000);

    json created = json::parse(host.dispatch_json("create_volume",
        R"({"size_gb": 4, "availability_zone": "us-east-1a"})"));
    assert(created["version"] == "1");
    assert(created["action"] == "create_volume");
    assert(created["region"] == "us-east-1");
    assert(created["status"] == "success");
    assert(created["result"]["size_gb"] == 4);
    assert(created["result"]["state"] == "available");

    json listed = json::parse(host.dispatch_json("get_volumes", "{}"));
    assert(listed["status"] == "success");
    assert(listed["result"].size() == 1);

    assert(host.provider().name() == "ec2");

    std::cout << "✓ Host dispatch round trip test passed" << std::endl;
}

void test_invalid_params_json(caf::actor_system& system) {
    std::cout << "Testing host with malformed params..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    ActionHost host(system, make_test_dispatcher(cloud), 5000);

    json reply = json::parse(host.dispatch_json("get_worker", "{not json"));
    assert(reply["status"] == "error");
    assert(reply["error"]["kind"] == "InvalidParameters");
    assert(reply["result"].is_null());
    assert(cloud->total_calls() == 0);

    std::cout << "✓ Host malformed params test passed" << std::endl;
}

void test_empty_params(caf::actor_system& system) {
    std::cout << "Testing host with empty params..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    ActionHost host(system, make_test_dispatcher(cloud), 5000);

    json reply = json::parse(host.dispatch_json("list_workers", ""));
    assert(reply["status"] == "success");
    assert(reply["result"].is_array());

    std::cout << "✓ Host empty params test passed" << std::endl;
}

void test_unsupported_action(caf::actor_system& system) {
    std::cout << "Testing host with unsupported action..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    ActionHost host(system, make_test_dispatcher(cloud), 5000);

    json reply = json::parse(host.dispatch_json("resize_worker", "{}"));
    assert(reply["status"] == "error");
    assert(reply["error"]["kind"] == "UnsupportedAction");
    assert(cloud->total_calls() == 0);

    std::cout << "✓ Host unsupported action test passed" << std::endl;
}

void test_host_timeout(caf::actor_system& system) {
    std::cout << "Testing host call timeout..." << std::endl;

    ActionHost host(system, std::make_shared<SlowProvider>(std::chrono::milliseconds(300)), 50);

    json reply = json::parse(host.dispatch_json("list_workers", "{}"));
    assert(reply["status"] == "error");
    assert(reply["error"]["kind"] == "UnknownBackendError");
    assert(reply["error"]["message"].get<std::string>().find("host call failed") != std::string::npos);

    std::cout << "✓ Host call timeout test passed" << std::endl;
}

void test_wait_fits_in_host_timeout(caf::actor_system& system) {
    std::cout << "Testing create_worker wait under a short host timeout..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    AdapterConfig config = test_config();
    config.wait_timeout_ms = 300000;
    config.host_call_timeout_ms = 400;
    ActionHost host(system, make_test_dispatcher(cloud, config), config.host_call_timeout_ms);

    // The instance never reaches running; the wait must give up before the host does
    json reply = json::parse(host.dispatch_json("create_worker", json{
        {"image_id", "ami-12345678"},
        {"instance_type", "t3.micro"},
        {"wait_for_running", true}
    }.dump()));

    assert(reply["status"] == "partial_success");
    assert(reply["error"].is_null());
    std::string worker_id = reply["result"]["id"];
    assert(!worker_id.empty());
    assert(cloud->region_state("us-east-1").instances.count(worker_id) == 1);
    assert(reply["warnings"].size() == 1);
    assert(reply["warnings"][0]["step"] == "wait_for_running");

    std::cout << "✓ create_worker wait under a short host timeout test passed" << std::endl;
}

void test_provider_exception(caf::actor_system& system) {
    std::cout << "Testing provider exception..." << std::endl;

    ActionHost host(system, std::make_shared<ThrowingProvider>(), 5000);

    json reply = json::parse(host.dispatch_json("list_workers", "{}"));
    assert(reply["status"] == "error");
    assert(reply["error"]["kind"] == "UnknownBackendError");
    assert(reply["error"]["message"].get<std::string>().find("provider exploded") != std::string::npos);

    std::cout << "✓ Provider exception test passed" << std::endl;
}

void test_concurrent_host_calls(caf::actor_system& system) {
    std::cout << "Testing concurrent host calls..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    ActionHost host(system, make_test_dispatcher(cloud), 5000);

    std::vector<std::string> replies(6);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < replies.size(); ++i) {
        threads.emplace_back([&, i]() {
            std::string region = (i % 2 == 0) ? "us-east-1" : "eu-west-1";
            replies[i] = host.dispatch_json("create_volume", json{
                {"size_gb", 1},
                {"availability_zone", region + "a"},
                {"region", region}
            }.dump());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (size_t i = 0; i < replies.size(); ++i) {
        json reply = json::parse(replies[i]);
        assert(reply["status"] == "success");
        assert(reply["region"] == ((i % 2 == 0) ? "us-east-1" : "eu-west-1"));
    }
    assert(cloud->region_state("us-east-1").volumes.size() == 3);
    assert(cloud->region_state("eu-west-1").volumes.size() == 3);

    std::cout << "✓ Concurrent host calls test passed" << std::endl;
}

int main() {
    std::cout << "Running Action Host Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        caf::actor_system_config cfg;
        caf::actor_system system{cfg};

        std::cout << "\n[Round Trip Tests]" << std::endl;
        test_dispatch_json_round_trip(system);
        test_empty_params(system);

        std::cout << "\n[Error Handling Tests]" << std::endl;
        test_invalid_params_json(system);
        test_unsupported_action(system);
        test_host_timeout(system);
        test_wait_fits_in_host_timeout(system);
        test_provider_exception(system);

        std::cout << "\n[Concurrency Tests]" << std::endl;
        test_concurrent_host_calls(system);

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All action host tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "\n❌ Test failed with unknown exception" << std::endl;
        return 1;
    }
}
