#include "tool_registry.h"
#include "tools/webhook_tool.h"
#include "logger.h"
#include "utils.h"

namespace rtvoice {

const char* to_string(ExecutionType type) {
    return type == ExecutionType::Webhook ? "webhook" : "mcp";
}

ExecutionType parse_execution_type(const std::string& name) {
    return utils::to_lower_copy(name) == "webhook" ? ExecutionType::Webhook : ExecutionType::Mcp;
}

std::string ToolDefinition::integration_id() const {
    if (metadata.is_object() && metadata.contains("integrationId") && metadata["integrationId"].is_string()) {
        return metadata["integrationId"].get<std::string>();
    }
    return "";
}

namespace {

std::string string_or_empty(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return "";
}

json open_object_schema() {
    json schema = json::object();
    schema["type"] = "object";
    schema["properties"] = json::object();
    schema["additionalProperties"] = true;
    return schema;
}

} // namespace

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> tools, uint64_t version)
    : tools_(std::move(tools)), version_(version) {}

std::shared_ptr<const ToolRegistry> ToolRegistry::from_server(const json& serialized, uint64_t version) {
    if (!serialized.is_array() || serialized.empty()) {
        Logger::warn("No serialized tools provided in session payload");
        return std::make_shared<const ToolRegistry>(std::vector<ToolDefinition>(), version);
    }

    std::vector<ToolDefinition> tools;
    for (const auto& entry : serialized) {
        if (!entry.is_object()) {
            Logger::warn("Skipping malformed tool entry");
            continue;
        }

        ToolDefinition tool;
        tool.execution_type = parse_execution_type(string_or_empty(entry, "execution_type"));
        tool.description = string_or_empty(entry, "description");
        tool.connection_id = string_or_empty(entry, "connection_id");
        tool.owner_user_id = string_or_empty(entry, "owner_user_id");
        if (entry.contains("metadata") && entry["metadata"].is_object()) {
            tool.metadata = entry["metadata"];
        }

        tool.name = string_or_empty(entry, "name");
        if (tool.name.empty() && tool.execution_type == ExecutionType::Webhook &&
            !tool.integration_id().empty()) {
            tool.name = tools::build_webhook_tool_name(string_or_empty(tool.metadata, "integrationName"),
                                                       tool.integration_id());
        }
        if (tool.name.empty()) {
            Logger::warn("Skipping tool entry without a name");
            continue;
        }

        if (entry.contains("parameters") && entry["parameters"].is_object()) {
            tool.parameters = entry["parameters"];
        } else if (tool.execution_type == ExecutionType::Webhook) {
            json custom = tool.metadata.contains("payloadParameters") ? tool.metadata["payloadParameters"] : json();
            tool.parameters = tools::build_webhook_schema(custom);
        } else {
            tool.parameters = open_object_schema();
        }

        tools.push_back(std::move(tool));
    }

    Logger::info("Registered " + std::to_string(tools.size()) + " tool(s), version " + std::to_string(version));
    return std::make_shared<const ToolRegistry>(std::move(tools), version);
}

const ToolDefinition* ToolRegistry::get_tool(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return &tool;
        }
    }
    const std::string normalized = utils::normalize_identifier(name);
    for (const auto& tool : tools_) {
        if (utils::normalize_identifier(tool.name) == normalized) {
            return &tool;
        }
    }
    return nullptr;
}

std::optional<json> ToolRegistry::schema_for_slug(const std::string& slug) const {
    if (slug.empty()) return std::nullopt;
    const std::string normalized = utils::normalize_identifier(slug);
    for (const auto& tool : tools_) {
        if (utils::normalize_identifier(tool.name) == normalized) {
            return tool.parameters;
        }
    }
    return std::nullopt;
}

std::vector<std::string> ToolRegistry::get_tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_) {
        names.push_back(tool.name);
    }
    return names;
}

json ToolRegistry::get_tool_schemas() const {
    json tools_array = json::array();
    for (const auto& tool : tools_) {
        json tool_def = json::object();
        tool_def["type"] = "function";
        tool_def["name"] = tool.name;
        tool_def["description"] = tool.description;
        tool_def["parameters"] = tool.parameters;
        tools_array.push_back(tool_def);
    }
    return tools_array;
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return get_tool(name) != nullptr;
}

} // namespace rtvoice
