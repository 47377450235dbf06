#pragma once

#include "core/ProcessExecutor.hpp"
#include "mcp/IToolProvider.hpp"
#include "tools/ToolRegistry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gemini_mcp {

/**
 * @brief How command vectors are assembled
 */
struct DispatcherOptions {
    std::string program = "gemini";
    std::optional<std::string> model;  // passed as -m when set
};

/**
 * @brief Fully assembled external-program call
 */
struct Invocation {
    CommandVector command;
    std::optional<std::string> working_directory;
};

/**
 * @brief Routes tool calls to the Gemini CLI
 *
 * Every tool goes through one routine driven by its ToolDefinition:
 * validate arguments, annotate paths, resolve the prompt, build the
 * command vector and hand it to the executor.
 */
class RequestDispatcher : public IToolProvider {
public:
    /**
     * @param registry Tool catalog, must outlive the dispatcher
     * @param executor Process executor, must outlive the dispatcher
     * @param options Program name and model
     */
    RequestDispatcher(const ToolRegistry& registry,
                      IProcessExecutor& executor,
                      DispatcherOptions options = {});

    std::vector<ToolInfo> list_tools() const override;

    ToolCallResult call_tool(const std::string& name, const json& arguments) override;

    /**
     * @brief Execute a tool call
     *
     * Unknown tools produce "Unknown tool: <name>" rather than an exception.
     * A nonzero exit produces "Error: " followed by the program's stderr.
     *
     * @throws MissingArgumentError if a required argument is absent
     * @throws InvalidArgumentError if an argument has the wrong type
     */
    ToolCallResult dispatch(const std::string& name, const json& arguments);

    /**
     * @brief Assemble the command for a tool call without running it
     * @return Invocation, or std::nullopt for an unknown tool
     */
    std::optional<Invocation> build_invocation(const std::string& name,
                                               const json& arguments) const;

    Invocation build_invocation(const ToolDefinition& tool, const json& arguments) const;

private:
    std::string build_prompt(const ToolDefinition& tool, const json& arguments) const;

    const ToolRegistry& registry_;
    IProcessExecutor& executor_;
    DispatcherOptions options_;
};

} // namespace gemini_mcp
