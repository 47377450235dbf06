#include "PromptCatalog.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace gemini_mcp {

namespace {

constexpr const char* kWorkingDirectoryHelp =
    "Directory to run the analysis from (optional, defaults to the server's directory)";

std::vector<PromptDefinition> build_catalog() {
    std::vector<PromptDefinition> prompts;

    prompts.push_back({
        "analyze_codebase",
        "Ask Gemini a question about every file in a project",
        {
            {"prompt", "What to ask about the codebase", true},
            {"working_directory", kWorkingDirectoryHelp, false}
        },
        "gemini_analyze_all_files",
        {},
        {}
    });

    prompts.push_back({
        "review_files",
        "Have Gemini review a set of files against a question",
        {
            {"files", "Comma-separated list of file paths", true},
            {"prompt", "What to look for in the files", true},
            {"working_directory", kWorkingDirectoryHelp, false}
        },
        "gemini_analyze_files",
        {"files"},
        {}
    });

    prompts.push_back({
        "verify_feature",
        "Check whether a feature is implemented, and where",
        {
            {"feature_name", "Feature to look for, e.g. 'rate limiting'", true},
            {"search_paths", "Comma-separated files or directories to search", true},
            {"working_directory", kWorkingDirectoryHelp, false}
        },
        "gemini_verify_implementation",
        {"search_paths"},
        {}
    });

    prompts.push_back({
        "security_review",
        "Run a focused security audit over part of a codebase",
        {
            {"paths", "Comma-separated files or directories to audit", true},
            {"audit_type", "sql_injection, xss, auth, general or input_validation (default general)", false},
            {"working_directory", kWorkingDirectoryHelp, false}
        },
        "gemini_security_audit",
        {"paths"},
        {{"audit_type", "general"}}
    });

    prompts.push_back({
        "architecture_review",
        "Summarize architecture, dependencies or coupling of a codebase",
        {
            {"paths", "Comma-separated files or directories to analyze", true},
            {"analysis_type", "overview, dependencies, patterns, structure or coupling (default overview)", false},
            {"working_directory", kWorkingDirectoryHelp, false}
        },
        "gemini_architecture_analysis",
        {"paths"},
        {{"analysis_type", "overview"}}
    });

    return prompts;
}

std::string trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(first, last - first + 1));
}

} // namespace

PromptCatalog::PromptCatalog() : prompts_(build_catalog()) {
    spdlog::debug("PromptCatalog loaded {} prompts", prompts_.size());
}

std::vector<PromptInfo> PromptCatalog::list_prompts() const {
    std::vector<PromptInfo> infos;
    infos.reserve(prompts_.size());
    for (const auto& prompt : prompts_) {
        infos.push_back({prompt.name, prompt.description, prompt.arguments});
    }
    return infos;
}

const PromptDefinition* PromptCatalog::find(std::string_view name) const {
    auto it = std::find_if(prompts_.begin(), prompts_.end(),
        [name](const PromptDefinition& p) { return p.name == name; });
    return it == prompts_.end() ? nullptr : &*it;
}

std::vector<std::string> PromptCatalog::split_list(std::string_view value) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t comma = value.find(',', start);
        if (comma == std::string_view::npos) {
            comma = value.size();
        }
        std::string item = trim(value.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        start = comma + 1;
    }
    return items;
}

json PromptCatalog::get_prompt(const std::string& name, const json& arguments) const {
    const PromptDefinition* prompt = find(name);
    if (!prompt) {
        throw UnknownPromptError(name);
    }

    const json args = arguments.is_null() ? json::object() : arguments;
    if (!args.is_object()) {
        throw InvalidArgumentError("arguments", "an object");
    }

    json tool_args = json::object();
    for (const auto& spec : prompt->arguments) {
        const bool present = args.contains(spec.name) && !args[spec.name].is_null();
        if (!present) {
            if (spec.required) {
                throw MissingArgumentError(spec.name);
            }
            continue;
        }
        if (!args[spec.name].is_string()) {
            throw InvalidArgumentError(spec.name, "a string");
        }

        const std::string value = args[spec.name].get<std::string>();
        const bool is_list = std::find(prompt->list_arguments.begin(), prompt->list_arguments.end(),
                                       spec.name) != prompt->list_arguments.end();
        if (is_list) {
            tool_args[spec.name] = split_list(value);
        } else if (!value.empty()) {
            tool_args[spec.name] = value;
        }
    }

    for (const auto& [key, value] : prompt->defaults) {
        if (!tool_args.contains(key)) {
            tool_args[key] = value;
        }
    }

    std::string text =
        prompt->description + ".\n\nCall the " + prompt->target_tool +
        " tool with these arguments:\n" + tool_args.dump(2) +
        "\n\nThen report Gemini's findings back to me.";

    spdlog::debug("Rendered prompt {} targeting {}", name, prompt->target_tool);

    return {
        {"description", prompt->description},
        {"messages", json::array({
            {
                {"role", "user"},
                {"content", {
                    {"type", "text"},
                    {"text", text}
                }}
            }
        })}
    };
}

} // namespace gemini_mcp
