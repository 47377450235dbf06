#pragma once

#include "core/PathAnnotator.hpp"
#include "core/PromptTemplates.hpp"
#include "mcp/IToolProvider.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gemini_mcp {

enum class ArgumentType {
    String,
    StringArray
};

/**
 * @brief One entry of a tool's argument schema
 */
struct ArgumentSpec {
    std::string name;
    ArgumentType type;
    bool required;
    std::string description;
    std::vector<std::string> allowed_values;  // advertised as a JSON Schema enum
};

/**
 * @brief Where the natural-language part of the prompt comes from
 */
enum class PromptSource {
    Argument,          // verbatim text of prompt_argument
    CategoryTemplate,  // prompt_argument looked up in template_table
    Verification       // prompt_argument is a feature name for the verification template
};

/**
 * @brief Immutable description of a tool plus its dispatch recipe
 *
 * RequestDispatcher interprets these records; there is no per-tool code.
 */
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ArgumentSpec> arguments;

    std::string path_argument;              // empty when the tool takes no paths
    std::optional<PathKind> path_kind;      // forced kind, probed when empty
    PromptSource prompt_source = PromptSource::Argument;
    std::string prompt_argument;
    std::string override_argument;          // non-empty value replaces the derived prompt
    TemplateTable template_table = TemplateTable::SecurityAudit;
    bool all_files = false;                 // adds --all_files

    const ArgumentSpec* find_argument(std::string_view arg_name) const;
};

/**
 * @brief Static catalog of the Gemini analysis tools
 *
 * Built once and never modified; safe to share across threads.
 */
class ToolRegistry {
public:
    static constexpr const char* kWorkingDirectoryArgument = "working_directory";

    ToolRegistry();

    /**
     * @brief All tools in stable registration order
     */
    const std::vector<ToolDefinition>& list_tools() const { return tools_; }

    /**
     * @brief Look up a tool by name
     * @return Definition, or nullptr for an unknown name
     */
    const ToolDefinition* find(std::string_view name) const;

    /**
     * @brief Render a definition as MCP tool metadata with JSON Schema
     */
    static ToolInfo to_tool_info(const ToolDefinition& tool);

private:
    std::vector<ToolDefinition> tools_;
};

} // namespace gemini_mcp
