#ifndef TOOL_REGISTRY_HPP
#define TOOL_REGISTRY_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "cancellation.hpp"

enum class FieldType {
    String,
    Integer,
    Number,
    Boolean,
    Object,
    Array
};

std::string FieldTypeName(FieldType type);

struct FieldSpec {
    std::string name;
    FieldType type;
    bool required;
    std::string description;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<FieldSpec> fields; // declaration order is the documented order
    bool allow_unknown_fields = false;
};

// Throws SchemaValidationError naming the first offending field.
void ValidateArguments(const ToolDescriptor& tool, const nlohmann::json& arguments);

// JSON Schema ("inputSchema") for a descriptor.
nlohmann::json ToJsonSchema(const ToolDescriptor& tool);

using ToolHandler = std::function<nlohmann::json(const nlohmann::json& arguments,
                                                 const CancellationToken& token)>;

struct RegisteredTool {
    ToolDescriptor descriptor;
    ToolHandler handler;
};

// Populated once at startup, then frozen. Reads after Freeze() need no locking.
class ToolRegistry {
public:
    // Throws std::logic_error after Freeze() or on a duplicate name.
    void Register(ToolDescriptor descriptor, ToolHandler handler);

    void Freeze() { frozen_ = true; }
    bool Frozen() const { return frozen_; }

    // nullptr when unknown.
    const RegisteredTool* Find(const std::string& name) const;

    std::vector<const ToolDescriptor*> List() const;

    // {"tools": [{name, description, inputSchema}, ...]}
    nlohmann::json Describe() const;

private:
    std::map<std::string, RegisteredTool> tools_;
    std::vector<std::string> order_;
    bool frozen_ = false;
};

#endif // TOOL_REGISTRY_HPP
