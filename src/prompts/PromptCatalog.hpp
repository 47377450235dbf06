#pragma once

#include "mcp/IPromptProvider.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gemini_mcp {

/**
 * @brief Meta-prompt definition: argument schema plus the tool it points at
 */
struct PromptDefinition {
    std::string name;
    std::string description;
    std::vector<PromptArgumentInfo> arguments;

    std::string target_tool;
    std::vector<std::string> list_arguments;  // comma-separated, sent to the tool as arrays
    std::vector<std::pair<std::string, std::string>> defaults;  // applied when an argument is absent
};

/**
 * @brief Static catalog of meta-prompts
 *
 * A rendered prompt is instruction text telling the calling agent which
 * tool to invoke and with which JSON arguments. The catalog never runs
 * a tool itself.
 */
class PromptCatalog : public IPromptProvider {
public:
    PromptCatalog();

    const std::vector<PromptDefinition>& definitions() const { return prompts_; }

    std::vector<PromptInfo> list_prompts() const override;

    /**
     * @brief Render a meta-prompt as an MCP prompts/get result
     * @throws UnknownPromptError for an unknown name
     * @throws MissingArgumentError if a required argument is absent
     * @throws InvalidArgumentError if an argument is not a string
     */
    json get_prompt(const std::string& name, const json& arguments) const override;

    /**
     * @brief Split a comma-separated list, trimming blanks and dropping empties
     */
    static std::vector<std::string> split_list(std::string_view value);

private:
    const PromptDefinition* find(std::string_view name) const;

    std::vector<PromptDefinition> prompts_;
};

} // namespace gemini_mcp
