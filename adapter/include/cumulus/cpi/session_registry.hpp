#pragma once

#include "cumulus/cpi/backend_client.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <caf/expected.hpp>

namespace cumulus {
namespace cpi {

// Region-keyed arena of backend sessions.
// Each session is built on first use by the factory and never mutated afterwards.
// Construction holds only that region's build lock, so a slow credential lookup for
// one region does not stall the others.
class SessionRegistry {
public:
    using Session = std::shared_ptr<const BackendClient>;
    using Factory = std::function<caf::expected<Session>(const std::string& region)>;

    explicit SessionRegistry(Factory factory);

    caf::expected<Session> session_for(const std::string& region);

    size_t size() const;
    std::vector<std::string> regions() const;

private:
    std::optional<Session> find(const std::string& region) const;

    Factory factory_;
    mutable std::mutex mutex_;   // Guards both maps, never held while building
    std::unordered_map<std::string, Session> sessions_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> build_locks_;
};

} // namespace cpi
} // namespace cumulus
