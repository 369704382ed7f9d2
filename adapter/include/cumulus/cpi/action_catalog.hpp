#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <caf/expected.hpp>

namespace cumulus {
namespace cpi {

enum class ParamType {
    string,
    integer,
    boolean,
    string_map   // JSON object whose values are all strings
};

struct ParamDefinition {
    std::string name;
    std::vector<std::string> aliases;
    std::string description;
    ParamType type = ParamType::string;
    bool required = false;
    nlohmann::json default_value;            // null = no default
    std::optional<int64_t> minimum;          // integer params only
    std::optional<int64_t> maximum;
};

struct ActionDefinition {
    std::string name;
    std::string description;
    std::vector<ParamDefinition> params;

    const ParamDefinition* find_param(const std::string& name) const;
};

/**
 * Action vocabulary of a provider
 *
 * Every action accepts an optional string "region"; it is appended to each
 * definition so hosts see it when describing an action.
 */
class ActionCatalog {
public:
    explicit ActionCatalog(std::vector<ActionDefinition> definitions);

    // Built-in EC2 vocabulary
    static const ActionCatalog& ec2();

    const ActionDefinition* find(const std::string& action) const;

    // Catalog order
    std::vector<std::string> names() const;

    /**
     * Check raw host parameters against a definition.
     *
     * Returns an object holding only canonical parameter names: aliases are
     * resolved, defaults filled in, unknown keys dropped. Missing required
     * parameters, type mismatches and integers outside their bounds are
     * invalid_parameters errors.
     * A null input is treated as an empty object.
     */
    caf::expected<nlohmann::json> normalize(const ActionDefinition& definition,
                                            const nlohmann::json& params) const;

    static nlohmann::json to_json(const ActionDefinition& definition);
    static std::string param_type_to_string(ParamType type);

private:
    std::vector<ActionDefinition> definitions_;
};

} // namespace cpi
} // namespace cumulus
