#include "RequestDispatcher.hpp"
#include "core/Errors.hpp"
#include "core/PathAnnotator.hpp"
#include "core/PromptTemplates.hpp"
#include <spdlog/spdlog.h>

namespace gemini_mcp {

namespace {

bool is_present(const json& args, const std::string& name) {
    return args.contains(name) && !args[name].is_null();
}

void check_type(const ArgumentSpec& spec, const json& value) {
    if (spec.type == ArgumentType::String) {
        if (!value.is_string()) {
            throw InvalidArgumentError(spec.name, "a string");
        }
        return;
    }

    if (!value.is_array()) {
        throw InvalidArgumentError(spec.name, "an array of strings");
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw InvalidArgumentError(spec.name, "an array of strings");
        }
    }
}

/**
 * @brief Normalize and validate arguments against the tool's schema
 * @return Argument object (null input becomes an empty object)
 */
json validated_arguments(const ToolDefinition& tool, const json& arguments) {
    if (arguments.is_null()) {
        return validated_arguments(tool, json::object());
    }
    if (!arguments.is_object()) {
        throw InvalidArgumentError("arguments", "an object");
    }

    for (const auto& spec : tool.arguments) {
        if (!is_present(arguments, spec.name)) {
            if (spec.required) {
                throw MissingArgumentError(spec.name);
            }
            continue;
        }
        check_type(spec, arguments[spec.name]);
    }
    return arguments;
}

std::optional<std::string> optional_string(const json& args, const std::string& name) {
    if (name.empty() || !is_present(args, name)) {
        return std::nullopt;
    }
    return args[name].get<std::string>();
}

} // namespace

RequestDispatcher::RequestDispatcher(const ToolRegistry& registry,
                                     IProcessExecutor& executor,
                                     DispatcherOptions options)
    : registry_(registry), executor_(executor), options_(std::move(options)) {
    if (options_.program.empty()) {
        throw std::invalid_argument("Program name cannot be empty");
    }
}

std::vector<ToolInfo> RequestDispatcher::list_tools() const {
    std::vector<ToolInfo> infos;
    for (const auto& tool : registry_.list_tools()) {
        infos.push_back(ToolRegistry::to_tool_info(tool));
    }
    return infos;
}

ToolCallResult RequestDispatcher::call_tool(const std::string& name, const json& arguments) {
    return dispatch(name, arguments);
}

ToolCallResult RequestDispatcher::dispatch(const std::string& name, const json& arguments) {
    const ToolDefinition* tool = registry_.find(name);
    if (!tool) {
        spdlog::warn("Unknown tool requested: {}", name);
        return {"Unknown tool: " + name, true};
    }

    Invocation invocation = build_invocation(*tool, arguments);
    spdlog::debug("Dispatching {} with {} command arguments", name, invocation.command.size());

    ExecutionResult result = executor_.run(invocation.command, invocation.working_directory);

    if (!result.success()) {
        spdlog::warn("{} failed with exit code {}", name, result.exit_code);
        return {"Error: " + result.stderr_text, true};
    }
    return {result.stdout_text, false};
}

std::optional<Invocation> RequestDispatcher::build_invocation(const std::string& name,
                                                              const json& arguments) const {
    const ToolDefinition* tool = registry_.find(name);
    if (!tool) {
        return std::nullopt;
    }
    return build_invocation(*tool, arguments);
}

Invocation RequestDispatcher::build_invocation(const ToolDefinition& tool,
                                               const json& arguments) const {
    const json args = validated_arguments(tool, arguments);

    Invocation invocation;
    auto cwd = optional_string(args, ToolRegistry::kWorkingDirectoryArgument);
    if (cwd && !cwd->empty()) {
        invocation.working_directory = std::move(cwd);
    }

    std::string prompt = build_prompt(tool, args);
    // Classify paths where gemini will resolve them
    if (!tool.path_argument.empty()) {
        auto paths = args[tool.path_argument].get<std::vector<std::string>>();
        prompt = PathAnnotator::annotate_all(paths, tool.path_kind,
                                             invocation.working_directory.value_or(std::string())) +
                 " " + prompt;
    }

    invocation.command.push_back(options_.program);
    if (options_.model && !options_.model->empty()) {
        invocation.command.push_back("-m");
        invocation.command.push_back(*options_.model);
    }
    if (tool.all_files) {
        invocation.command.push_back("--all_files");
    }
    invocation.command.push_back("-p");
    invocation.command.push_back(std::move(prompt));
    return invocation;
}

std::string RequestDispatcher::build_prompt(const ToolDefinition& tool, const json& args) const {
    if (auto custom = optional_string(args, tool.override_argument); custom && !custom->empty()) {
        return *custom;
    }

    const std::string value = args[tool.prompt_argument].get<std::string>();
    switch (tool.prompt_source) {
        case PromptSource::CategoryTemplate:
            return PromptTemplates::resolve(tool.template_table, value);
        case PromptSource::Verification:
            return PromptTemplates::verification_prompt(value);
        case PromptSource::Argument:
            break;
    }
    return value;
}

} // namespace gemini_mcp
