#pragma once

#include "tool.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rtvoice {

/**
 * @brief Immutable, versioned set of available tools
 *
 * A registry is built once (usually from the broker payload) and shared as
 * std::shared_ptr<const ToolRegistry>. Reconfiguration builds a new
 * snapshot and swaps it in; readers holding the old one are unaffected.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(std::vector<ToolDefinition> tools, uint64_t version);

    /**
     * @brief Build from the broker's serialized tool list
     *
     * Entries need a name (webhook entries may instead carry
     * metadata.integrationName and metadata.integrationId). Missing
     * parameters default to an open object schema, or the webhook trigger
     * schema for webhook tools. A missing or empty list yields an empty registry.
     */
    static std::shared_ptr<const ToolRegistry> from_server(const json& serialized, uint64_t version);

    /**
     * @brief Lookup by exact name, then by normalized identifier
     * @return nullptr if not found
     */
    const ToolDefinition* get_tool(const std::string& name) const;

    /**
     * @brief Declared schema of the tool whose normalized name equals the slug's
     */
    std::optional<json> schema_for_slug(const std::string& slug) const;

    std::vector<std::string> get_tool_names() const;

    const std::vector<ToolDefinition>& get_all_tools() const { return tools_; }

    /**
     * @brief Upstream tool list: [{type: "function", name, description, parameters}]
     */
    json get_tool_schemas() const;

    bool has_tool(const std::string& name) const;

    size_t size() const { return tools_.size(); }

    uint64_t version() const { return version_; }

private:
    std::vector<ToolDefinition> tools_;
    uint64_t version_ = 0;
};

} // namespace rtvoice
