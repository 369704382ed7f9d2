#include "cumulus/cpi/session_registry.hpp"
#include "cumulus/cpi/core.hpp"
#include <algorithm>

namespace cumulus {
namespace cpi {

SessionRegistry::SessionRegistry(Factory factory) : factory_(std::move(factory)) {}

std::optional<SessionRegistry::Session> SessionRegistry::find(const std::string& region) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = sessions_.find(region);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

caf::expected<SessionRegistry::Session> SessionRegistry::session_for(const std::string& region) {
    if (region.empty()) {
        return make_error(ErrorKind::invalid_parameters, "region must not be empty");
    }
    if (!factory_) {
        return make_error(ErrorKind::unknown_backend_error, "no session factory configured");
    }

    std::shared_ptr<std::mutex> build_lock;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = sessions_.find(region);
        if (it != sessions_.end()) {
            return it->second;
        }
        auto& slot = build_locks_[region];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        build_lock = slot;
    }

    std::lock_guard<std::mutex> building(*build_lock);
    // Another caller may have finished while this one waited for the build lock
    if (auto existing = find(region)) {
        return *existing;
    }

    auto created = factory_(region);
    if (!created) {
        // Nothing is cached on failure so a later call can retry construction
        return created.error();
    }
    if (*created == nullptr) {
        return make_error(ErrorKind::unknown_backend_error,
                          "session factory returned no client for region " + region);
    }

    std::lock_guard<std::mutex> guard(mutex_);
    return sessions_.emplace(region, *created).first->second;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::regions() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        result.reserve(sessions_.size());
        for (const auto& entry : sessions_) {
            result.push_back(entry.first);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace cpi
} // namespace cumulus
