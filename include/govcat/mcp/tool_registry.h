#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace govcat::mcp {

using json = nlohmann::json;

// Wrap a structured result as MCP text content for tools/call
inline json wrapToolResult(const json& structured, bool isError = false) {
    json result;
    result["content"] = json::array({json{{"type", "text"}, {"text", structured.dump()}}});
    if (isError) {
        result["isError"] = true;
    }
    return result;
}

struct ToolRegistryEntry {
    std::string name;
    std::string description;
    // Deterministic and side-effect free across sessions
    bool stable = false;
    // Requires the mutation-enabled switch
    bool mutation = false;
    json inputSchema;
    std::optional<json> outputSchema;

    json toJson() const;
};

// Built once; sorted by name and never modified afterwards
const std::vector<ToolRegistryEntry>& getRegistry();

const ToolRegistryEntry* findTool(std::string_view name);

bool isMutationMethod(std::string_view name);

// {version, tools:[...]} as returned by meta/tools
json registryToJson();

// MCP tools/list result: {tools:[{name, description, inputSchema}]}
json listToolsResult();

} // namespace govcat::mcp
