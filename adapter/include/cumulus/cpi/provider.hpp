#pragma once

#include "cumulus/cpi/action_catalog.hpp"
#include "cumulus/cpi/core.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cumulus {
namespace cpi {

/**
 * Provider extension interface
 *
 * What a CPI host sees of a provider. The host picks one implementation at load
 * time and drives it through dispatch() only.
 */
class ProviderExtension {
public:
    virtual ~ProviderExtension() = default;

    virtual std::string name() const = 0;
    virtual std::string provider_type() const = 0;

    virtual std::vector<std::string> list_actions() const = 0;
    virtual std::optional<ActionDefinition> action_definition(const std::string& action) const = 0;

    // Never throws; every outcome, including unknown actions, is an ActionResult
    virtual ActionResult dispatch(const std::string& action, const nlohmann::json& params) = 0;
};

} // namespace cpi
} // namespace cumulus
