#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace gemini_mcp {

using json = nlohmann::json;

struct PromptArgumentInfo {
    std::string name;
    std::string description;
    bool required = false;
};

/**
 * @brief Metadata for an MCP prompt
 */
struct PromptInfo {
    std::string name;
    std::string description;
    std::vector<PromptArgumentInfo> arguments;
};

/**
 * @brief Source of prompts served under prompts/list and prompts/get
 */
class IPromptProvider {
public:
    virtual ~IPromptProvider() = default;

    virtual std::vector<PromptInfo> list_prompts() const = 0;

    /**
     * @brief Render a prompt
     * @return Object with "description" and "messages"
     * @throws std::out_of_range for an unknown prompt name
     * @throws std::invalid_argument for missing arguments
     */
    virtual json get_prompt(const std::string& name, const json& arguments) const = 0;
};

} // namespace gemini_mcp
