#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <caf/expected.hpp>

namespace cumulus {
namespace cpi {

struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::optional<std::chrono::system_clock::time_point> expiration;

    bool empty() const { return access_key_id.empty() || secret_access_key.empty(); }
};

// Opaque credential source. Implementations resolve and refresh on their own;
// failures come back as ErrorKind::authentication_error.
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    virtual caf::expected<Credentials> get_credentials() const = 0;
};

} // namespace cpi
} // namespace cumulus
