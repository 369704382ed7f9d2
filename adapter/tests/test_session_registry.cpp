#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "cumulus/cpi/error_classifier.hpp"
#include "cumulus/cpi/session_registry.hpp"
#include "fake_backend.hpp"

using namespace cumulus::cpi;
using namespace cumulus::cpi::testing;

void test_session_built_once_per_region() {
    std::cout << "Testing one session per region..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    auto built = std::make_shared<std::vector<std::string>>();
    SessionRegistry registry(fake_session_factory(cloud, built));

    auto first = registry.session_for("us-east-1");
    auto second = registry.session_for("us-east-1");
    auto other = registry.session_for("eu-west-1");

    assert(first && second && other);
    assert(first->get() == second->get());
    assert(first->get() != other->get());
    assert((*other)->region() == "eu-west-1");
    assert(built->size() == 2);
    assert(registry.size() == 2);

    auto regions = registry.regions();
    assert(regions.size() == 2);
    assert(regions[0] == "eu-west-1");
    assert(regions[1] == "us-east-1");

    std::cout << "✓ One session per region test passed" << std::endl;
}

void test_empty_region_rejected() {
    std::cout << "Testing empty region..." << std::endl;

    auto built = std::make_shared<std::vector<std::string>>();
    SessionRegistry registry(fake_session_factory(std::make_shared<FakeCloud>(), built));

    auto session = registry.session_for("");
    assert(!session);
    assert(ErrorClassifier::classify(session.error()) == ErrorKind::invalid_parameters);
    assert(built->empty());

    std::cout << "✓ Empty region test passed" << std::endl;
}

void test_failed_construction_not_cached() {
    std::cout << "Testing failed session construction..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    int attempts = 0;
    SessionRegistry registry([&](const std::string& region) -> caf::expected<SessionRegistry::Session> {
        ++attempts;
        if (attempts == 1) {
            return make_error(ErrorKind::authentication_error, "no credentials");
        }
        return SessionRegistry::Session(std::make_shared<FakeBackend>(region, cloud));
    });

    auto failed = registry.session_for("us-east-1");
    assert(!failed);
    assert(ErrorClassifier::classify(failed.error()) == ErrorKind::authentication_error);
    assert(registry.size() == 0);

    auto retried = registry.session_for("us-east-1");
    assert(retried);
    assert(attempts == 2);
    assert(registry.size() == 1);

    std::cout << "✓ Failed session construction test passed" << std::endl;
}

void test_null_session_rejected() {
    std::cout << "Testing factory returning no client..." << std::endl;

    SessionRegistry registry([](const std::string&) -> caf::expected<SessionRegistry::Session> {
        return SessionRegistry::Session{};
    });

    auto session = registry.session_for("us-east-1");
    assert(!session);
    assert(ErrorClassifier::classify(session.error()) == ErrorKind::unknown_backend_error);
    assert(registry.size() == 0);

    std::cout << "✓ Factory returning no client test passed" << std::endl;
}

void test_concurrent_lookups_share_session() {
    std::cout << "Testing concurrent lookups..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    std::atomic<int> constructions{0};
    SessionRegistry registry([&](const std::string& region) -> caf::expected<SessionRegistry::Session> {
        ++constructions;
        return SessionRegistry::Session(std::make_shared<FakeBackend>(region, cloud));
    });

    std::vector<const BackendClient*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i]() {
            auto session = registry.session_for("ap-south-1");
            if (session) {
                seen[i] = session->get();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(constructions == 1);
    for (const auto* client : seen) {
        assert(client != nullptr);
        assert(client == seen.front());
    }

    std::cout << "✓ Concurrent lookups test passed" << std::endl;
}

void test_slow_region_does_not_block_others() {
    std::cout << "Testing slow session construction..." << std::endl;

    auto cloud = std::make_shared<FakeCloud>();
    std::promise<void> slow_entered;
    std::promise<void> release_slow;
    std::shared_future<void> released = release_slow.get_future().share();

    SessionRegistry registry([&](const std::string& region) -> caf::expected<SessionRegistry::Session> {
        if (region == "ap-southeast-2") {
            // Stands in for a credential lookup that blocks on the network
            slow_entered.set_value();
            released.wait();
        }
        return SessionRegistry::Session(std::make_shared<FakeBackend>(region, cloud));
    });

    auto slow = std::async(std::launch::async, [&]() { return registry.session_for("ap-southeast-2"); });
    slow_entered.get_future().wait();

    auto fast = std::async(std::launch::async, [&]() { return registry.session_for("eu-west-1"); });
    bool fast_ready = fast.wait_for(std::chrono::seconds(5)) == std::future_status::ready;

    release_slow.set_value();
    assert(fast_ready);
    assert(fast.get());
    assert(slow.get());
    assert(registry.size() == 2);

    std::cout << "✓ Slow session construction test passed" << std::endl;
}

int main() {
    std::cout << "Running Session Registry Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        std::cout << "\n[Basic Tests]" << std::endl;
        test_session_built_once_per_region();
        test_empty_region_rejected();

        std::cout << "\n[Error Handling Tests]" << std::endl;
        test_failed_construction_not_cached();
        test_null_session_rejected();

        std::cout << "\n[Concurrency Tests]" << std::endl;
        test_concurrent_lookups_share_session();
        test_slow_region_does_not_block_others();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All session registry tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
