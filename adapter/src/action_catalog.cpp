#include "cumulus/cpi/action_catalog.hpp"
#include "cumulus/cpi/core.hpp"
#include <cstdint>
#include <limits>

namespace cumulus {
namespace cpi {

using json = nlohmann::json;

namespace {

ParamDefinition required_string(std::string name, std::string description,
                                std::vector<std::string> aliases = {}) {
    ParamDefinition param;
    param.name = std::move(name);
    param.aliases = std::move(aliases);
    param.description = std::move(description);
    param.type = ParamType::string;
    param.required = true;
    return param;
}

ParamDefinition optional_param(std::string name, std::string description, ParamType type,
                               json default_value = nullptr) {
    ParamDefinition param;
    param.name = std::move(name);
    param.description = std::move(description);
    param.type = type;
    param.required = false;
    param.default_value = std::move(default_value);
    return param;
}

ActionDefinition action(std::string name, std::string description,
                        std::vector<ParamDefinition> params) {
    ActionDefinition definition;
    definition.name = std::move(name);
    definition.description = std::move(description);
    definition.params = std::move(params);
    return definition;
}

std::vector<ActionDefinition> ec2_definitions() {
    ParamDefinition size_gb;
    size_gb.name = "size_gb";
    size_gb.description = "Size in GiB";
    size_gb.type = ParamType::integer;
    size_gb.required = true;
    size_gb.minimum = 1;
    size_gb.maximum = 65536;   // Largest EBS volume (io2 Block Express)

    ParamDefinition wait_timeout = optional_param(
        "wait_timeout_ms", "Upper bound for the running-state wait, clamped to the configured ceiling",
        ParamType::integer);
    wait_timeout.minimum = 0;

    return {
        action("test_install", "Check that credentials and endpoint are usable", {}),
        action("list_workers", "List all EC2 instances", {}),
        action("create_worker", "Launch a new EC2 instance", {
            required_string("image_id", "Amazon Machine Image ID", {"ami"}),
            required_string("instance_type", "EC2 instance type"),
            optional_param("worker_name", "Value of the Name tag", ParamType::string),
            optional_param("tags", "Additional tags", ParamType::string_map),
            optional_param("wait_for_running", "Poll until the instance is running",
                           ParamType::boolean, false),
            wait_timeout,
            optional_param("key_name", "Key pair name", ParamType::string),
            optional_param("subnet_id", "Subnet to launch into", ParamType::string),
        }),
        action("delete_worker", "Terminate an EC2 instance", {
            required_string("worker_id", "ID of the instance to terminate"),
        }),
        action("get_worker", "Get information about an EC2 instance", {
            required_string("worker_id", "ID of the instance"),
        }),
        action("has_worker", "Check if an EC2 instance exists", {
            required_string("worker_id", "ID of the instance"),
        }),
        action("start_worker", "Start an EC2 instance", {
            required_string("worker_id", "ID of the instance to start"),
        }),
        action("get_volumes", "List all EBS volumes", {}),
        action("has_volume", "Check if an EBS volume exists", {
            required_string("volume_id", "ID of the volume"),
        }),
        action("create_volume", "Create a new EBS volume", {
            size_gb,
            required_string("availability_zone", "Availability zone"),
            optional_param("volume_type", "Volume type (gp2, gp3, io1, ...)", ParamType::string),
        }),
        action("delete_volume", "Delete an EBS volume", {
            required_string("volume_id", "ID of the volume"),
        }),
        action("attach_volume", "Attach an EBS volume to an EC2 instance", {
            required_string("volume_id", "ID of the volume"),
            required_string("worker_id", "ID of the instance"),
            required_string("device_name", "Device name (e.g. /dev/sdf)", {"device"}),
        }),
        action("detach_volume", "Detach an EBS volume from its instance", {
            required_string("volume_id", "ID of the volume"),
            optional_param("worker_id", "ID of the instance", ParamType::string),
            optional_param("device_name", "Device name", ParamType::string),
            optional_param("force", "Force detachment", ParamType::boolean, false),
        }),
        action("create_snapshot", "Create a snapshot of an EBS volume", {
            required_string("volume_id", "ID of the volume"),
            optional_param("snapshot_name", "Value of the Name tag", ParamType::string),
            optional_param("description", "Snapshot description", ParamType::string),
        }),
        action("delete_snapshot", "Delete a snapshot", {
            required_string("snapshot_id", "ID of the snapshot"),
        }),
        action("has_snapshot", "Check if a snapshot exists", {
            required_string("snapshot_id", "ID of the snapshot"),
        }),
        action("reboot_worker", "Reboot an EC2 instance", {
            required_string("worker_id", "ID of the instance"),
        }),
        action("set_worker_metadata", "Set tags on an EC2 instance", {
            required_string("worker_id", "ID of the instance"),
            optional_param("tags", "Tags to apply", ParamType::string_map),
            optional_param("key", "Single tag key", ParamType::string),
            optional_param("value", "Single tag value", ParamType::string),
        }),
        action("snapshot_volume", "Create a snapshot of an EBS volume", {
            required_string("volume_id", "ID of the source volume", {"source_volume_id"}),
            optional_param("snapshot_name", "Value of the Name tag", ParamType::string),
            optional_param("description", "Snapshot description", ParamType::string),
        }),
    };
}

bool matches_type(const json& value, ParamType type) {
    switch (type) {
        case ParamType::string:
            return value.is_string();
        case ParamType::integer:
            // Anything past int64 would wrap on the way to the backend
            return value.is_number_integer()
                && !(value.is_number_unsigned()
                     && value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
        case ParamType::boolean:
            return value.is_boolean();
        case ParamType::string_map:
            if (!value.is_object()) {
                return false;
            }
            for (const auto& item : value.items()) {
                if (!item.value().is_string()) {
                    return false;
                }
            }
            return true;
    }
    return false;
}

} // namespace

const ParamDefinition* ActionDefinition::find_param(const std::string& param_name) const {
    for (const auto& param : params) {
        if (param.name == param_name) {
            return &param;
        }
    }
    return nullptr;
}

ActionCatalog::ActionCatalog(std::vector<ActionDefinition> definitions)
    : definitions_(std::move(definitions)) {
    for (auto& definition : definitions_) {
        if (definition.find_param("region") == nullptr) {
            definition.params.push_back(
                optional_param("region", "Backend region, defaults to the configured region",
                               ParamType::string));
        }
    }
}

const ActionCatalog& ActionCatalog::ec2() {
    static const ActionCatalog catalog(ec2_definitions());
    return catalog;
}

const ActionDefinition* ActionCatalog::find(const std::string& action_name) const {
    for (const auto& definition : definitions_) {
        if (definition.name == action_name) {
            return &definition;
        }
    }
    return nullptr;
}

std::vector<std::string> ActionCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(definitions_.size());
    for (const auto& definition : definitions_) {
        result.push_back(definition.name);
    }
    return result;
}

caf::expected<json> ActionCatalog::normalize(const ActionDefinition& definition,
                                             const json& params) const {
    if (params.is_null()) {
        return normalize(definition, json::object());
    }
    if (!params.is_object()) {
        return make_error(ErrorKind::invalid_parameters,
                          definition.name + ": parameters must be a JSON object");
    }

    json normalized = json::object();
    for (const auto& param : definition.params) {
        const json* value = nullptr;
        auto it = params.find(param.name);
        if (it != params.end() && !it->is_null()) {
            value = &*it;
        } else {
            for (const auto& alias : param.aliases) {
                auto alias_it = params.find(alias);
                if (alias_it != params.end() && !alias_it->is_null()) {
                    value = &*alias_it;
                    break;
                }
            }
        }

        if (value == nullptr) {
            if (param.required) {
                return make_error(ErrorKind::invalid_parameters,
                                  definition.name + ": missing required parameter '" + param.name + "'");
            }
            if (!param.default_value.is_null()) {
                normalized[param.name] = param.default_value;
            }
            continue;
        }

        if (!matches_type(*value, param.type)) {
            return make_error(ErrorKind::invalid_parameters,
                              definition.name + ": parameter '" + param.name + "' must be of type "
                                  + param_type_to_string(param.type));
        }
        if (param.required && param.type == ParamType::string && value->get<std::string>().empty()) {
            return make_error(ErrorKind::invalid_parameters,
                              definition.name + ": parameter '" + param.name + "' must not be empty");
        }
        if (param.minimum && param.type == ParamType::integer
            && value->get<int64_t>() < *param.minimum) {
            return make_error(ErrorKind::invalid_parameters,
                              definition.name + ": parameter '" + param.name + "' must be >= "
                                  + std::to_string(*param.minimum));
        }
        if (param.maximum && param.type == ParamType::integer
            && value->get<int64_t>() > *param.maximum) {
            return make_error(ErrorKind::invalid_parameters,
                              definition.name + ": parameter '" + param.name + "' must be <= "
                                  + std::to_string(*param.maximum));
        }
        normalized[param.name] = *value;
    }
    return normalized;
}

json ActionCatalog::to_json(const ActionDefinition& definition) {
    json params = json::array();
    for (const auto& param : definition.params) {
        json entry = {
            {"name", param.name},
            {"description", param.description},
            {"type", param_type_to_string(param.type)},
            {"required", param.required},
            {"default", param.default_value}
        };
        if (!param.aliases.empty()) {
            entry["aliases"] = param.aliases;
        }
        if (param.minimum) {
            entry["minimum"] = *param.minimum;
        }
        if (param.maximum) {
            entry["maximum"] = *param.maximum;
        }
        params.push_back(std::move(entry));
    }
    return json{
        {"name", definition.name},
        {"description", definition.description},
        {"parameters", std::move(params)}
    };
}

std::string ActionCatalog::param_type_to_string(ParamType type) {
    switch (type) {
        case ParamType::string:
            return "string";
        case ParamType::integer:
            return "integer";
        case ParamType::boolean:
            return "boolean";
        case ParamType::string_map:
            return "string_map";
    }
    return "string";
}

} // namespace cpi
} // namespace cumulus
