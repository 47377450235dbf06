#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>

namespace gemini_mcp {

namespace {

ArgumentSpec working_directory_argument(const char* description) {
    return {ToolRegistry::kWorkingDirectoryArgument, ArgumentType::String, false, description, {}};
}

ArgumentSpec analysis_prompt_argument() {
    return {"prompt", ArgumentType::String, true, "Analysis prompt to send to Gemini", {}};
}

ToolDefinition analyze_files_tool() {
    ToolDefinition tool;
    tool.name = "gemini_analyze_files";
    tool.description = "Analyze specific files using Gemini CLI with @ syntax";
    tool.arguments = {
        {"files", ArgumentType::StringArray, true,
         "List of file paths to analyze (relative to current working directory)", {}},
        analysis_prompt_argument(),
        working_directory_argument(
            "Working directory to run gemini command from (optional, defaults to current directory)")
    };
    tool.path_argument = "files";
    tool.path_kind = PathKind::File;
    tool.prompt_argument = "prompt";
    return tool;
}

ToolDefinition analyze_directories_tool() {
    ToolDefinition tool;
    tool.name = "gemini_analyze_directories";
    tool.description = "Analyze entire directories using Gemini CLI with @ syntax";
    tool.arguments = {
        {"directories", ArgumentType::StringArray, true, "List of directory paths to analyze", {}},
        analysis_prompt_argument(),
        working_directory_argument("Working directory to run gemini command from (optional)")
    };
    tool.path_argument = "directories";
    tool.path_kind = PathKind::Directory;
    tool.prompt_argument = "prompt";
    return tool;
}

ToolDefinition analyze_all_files_tool() {
    ToolDefinition tool;
    tool.name = "gemini_analyze_all_files";
    tool.description = "Analyze all files in current directory using Gemini CLI --all_files flag";
    tool.arguments = {
        analysis_prompt_argument(),
        working_directory_argument("Working directory to run gemini command from (optional)")
    };
    tool.prompt_argument = "prompt";
    tool.all_files = true;
    return tool;
}

ToolDefinition verify_implementation_tool() {
    ToolDefinition tool;
    tool.name = "gemini_verify_implementation";
    tool.description = "Verify if specific features/patterns are implemented in the codebase";
    tool.arguments = {
        {"feature_name", ArgumentType::String, true,
         "Name of the feature to verify (e.g., 'dark mode', 'JWT authentication')", {}},
        {"search_paths", ArgumentType::StringArray, true,
         "List of directories/files to search in", {}},
        {"verification_prompt", ArgumentType::String, false,
         "Custom verification prompt (optional)", {}},
        working_directory_argument("Working directory to run gemini command from (optional)")
    };
    tool.path_argument = "search_paths";
    tool.prompt_source = PromptSource::Verification;
    tool.prompt_argument = "feature_name";
    tool.override_argument = "verification_prompt";
    return tool;
}

ToolDefinition security_audit_tool() {
    ToolDefinition tool;
    tool.name = "gemini_security_audit";
    tool.description = "Perform security analysis of the codebase using Gemini";
    tool.arguments = {
        {"audit_type", ArgumentType::String, true, "Type of security audit to perform",
         PromptTemplates::categories(TemplateTable::SecurityAudit)},
        {"paths", ArgumentType::StringArray, true, "Paths to audit (files or directories)", {}},
        working_directory_argument("Working directory to run gemini command from (optional)")
    };
    tool.path_argument = "paths";
    tool.prompt_source = PromptSource::CategoryTemplate;
    tool.prompt_argument = "audit_type";
    tool.template_table = TemplateTable::SecurityAudit;
    return tool;
}

ToolDefinition architecture_analysis_tool() {
    ToolDefinition tool;
    tool.name = "gemini_architecture_analysis";
    tool.description = "Analyze codebase architecture and patterns using Gemini";
    tool.arguments = {
        {"analysis_type", ArgumentType::String, true, "Type of architectural analysis",
         PromptTemplates::categories(TemplateTable::ArchitectureAnalysis)},
        {"paths", ArgumentType::StringArray, true, "Paths to analyze", {}},
        working_directory_argument("Working directory to run gemini command from (optional)")
    };
    tool.path_argument = "paths";
    tool.prompt_source = PromptSource::CategoryTemplate;
    tool.prompt_argument = "analysis_type";
    tool.template_table = TemplateTable::ArchitectureAnalysis;
    return tool;
}

} // namespace

const ArgumentSpec* ToolDefinition::find_argument(std::string_view arg_name) const {
    for (const auto& arg : arguments) {
        if (arg.name == arg_name) {
            return &arg;
        }
    }
    return nullptr;
}

ToolRegistry::ToolRegistry()
    : tools_{
          analyze_files_tool(),
          analyze_directories_tool(),
          analyze_all_files_tool(),
          verify_implementation_tool(),
          security_audit_tool(),
          architecture_analysis_tool()
      } {
    spdlog::debug("ToolRegistry loaded {} tools", tools_.size());
}

const ToolDefinition* ToolRegistry::find(std::string_view name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

ToolInfo ToolRegistry::to_tool_info(const ToolDefinition& tool) {
    json properties = json::object();
    json required = json::array();

    for (const auto& arg : tool.arguments) {
        json property;
        if (arg.type == ArgumentType::StringArray) {
            property = {
                {"type", "array"},
                {"items", {{"type", "string"}}}
            };
        } else {
            property = {{"type", "string"}};
        }
        if (!arg.allowed_values.empty()) {
            property["enum"] = arg.allowed_values;
        }
        property["description"] = arg.description;

        properties[arg.name] = property;
        if (arg.required) {
            required.push_back(arg.name);
        }
    }

    return {
        tool.name,
        tool.description,
        {
            {"type", "object"},
            {"properties", properties},
            {"required", required}
        }
    };
}

} // namespace gemini_mcp
