#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace gemini_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Text returned from a tool call
 */
struct ToolCallResult {
    std::string text;
    bool is_error = false;
};

/**
 * @brief Source of tools served under tools/list and tools/call
 */
class IToolProvider {
public:
    virtual ~IToolProvider() = default;

    virtual std::vector<ToolInfo> list_tools() const = 0;

    /**
     * @brief Execute a tool
     * @param name Tool name as sent by the client
     * @param arguments Argument object (may be null)
     * @throws std::invalid_argument for missing or malformed arguments
     */
    virtual ToolCallResult call_tool(const std::string& name, const json& arguments) = 0;
};

} // namespace gemini_mcp
