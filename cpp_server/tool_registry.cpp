#include "tool_registry.hpp"
#include "errors.hpp"
#include <stdexcept>

std::string FieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::String: return "string";
        case FieldType::Integer: return "integer";
        case FieldType::Number: return "number";
        case FieldType::Boolean: return "boolean";
        case FieldType::Object: return "object";
        case FieldType::Array: return "array";
    }
    return "string";
}

namespace {

bool Matches(FieldType type, const nlohmann::json& value) {
    switch (type) {
        case FieldType::String: return value.is_string();
        case FieldType::Integer: return value.is_number_integer();
        case FieldType::Number: return value.is_number();
        case FieldType::Boolean: return value.is_boolean();
        case FieldType::Object: return value.is_object();
        case FieldType::Array: return value.is_array();
    }
    return false;
}

std::string JsonTypeName(const nlohmann::json& value) {
    if (value.is_number_integer()) return "integer";
    return value.type_name();
}

} // namespace

void ValidateArguments(const ToolDescriptor& tool, const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        throw SchemaValidationError("Arguments of '" + tool.name + "' must be an object, got " +
                                    JsonTypeName(arguments));
    }

    for (const auto& field : tool.fields) {
        auto it = arguments.find(field.name);
        // An explicit null counts as absent.
        if (it == arguments.end() || it->is_null()) {
            if (field.required) {
                throw SchemaValidationError("Missing required field '" + field.name + "' for tool '" +
                                            tool.name + "'");
            }
            continue;
        }
        if (!Matches(field.type, *it)) {
            throw SchemaValidationError("Field '" + field.name + "' of tool '" + tool.name + "' must be " +
                                        FieldTypeName(field.type) + ", got " + JsonTypeName(*it));
        }
    }

    if (!tool.allow_unknown_fields) {
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            bool known = false;
            for (const auto& field : tool.fields) {
                if (field.name == it.key()) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                throw SchemaValidationError("Unknown field '" + it.key() + "' for tool '" + tool.name + "'");
            }
        }
    }
}

nlohmann::json ToJsonSchema(const ToolDescriptor& tool) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& field : tool.fields) {
        nlohmann::json property;
        property["type"] = FieldTypeName(field.type);
        if (!field.description.empty()) {
            property["description"] = field.description;
        }
        properties[field.name] = property;
        if (field.required) {
            required.push_back(field.name);
        }
    }

    nlohmann::json schema;
    schema["type"] = "object";
    schema["properties"] = properties;
    schema["required"] = required;
    schema["additionalProperties"] = tool.allow_unknown_fields;
    return schema;
}

void ToolRegistry::Register(ToolDescriptor descriptor, ToolHandler handler) {
    if (frozen_) {
        throw std::logic_error("Tool registry is frozen; cannot register '" + descriptor.name + "'");
    }
    if (tools_.count(descriptor.name) != 0) {
        throw std::logic_error("Tool '" + descriptor.name + "' registered twice");
    }
    std::string name = descriptor.name;
    tools_.emplace(name, RegisteredTool{std::move(descriptor), std::move(handler)});
    order_.push_back(name);
}

const RegisteredTool* ToolRegistry::Find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

std::vector<const ToolDescriptor*> ToolRegistry::List() const {
    std::vector<const ToolDescriptor*> result;
    for (const auto& name : order_) {
        result.push_back(&tools_.at(name).descriptor);
    }
    return result;
}

nlohmann::json ToolRegistry::Describe() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto* descriptor : List()) {
        tools.push_back({{"name", descriptor->name},
                         {"description", descriptor->description},
                         {"inputSchema", ToJsonSchema(*descriptor)}});
    }
    return {{"tools", tools}};
}
