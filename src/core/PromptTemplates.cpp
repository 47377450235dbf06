#include "PromptTemplates.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace gemini_mcp {

namespace {

using TemplateEntries = std::vector<std::pair<std::string, std::string>>;

const TemplateEntries& security_audit_entries() {
    static const TemplateEntries entries = {
        {"sql_injection",
         "Analyze this code for SQL injection vulnerabilities. Show how user inputs are "
         "sanitized and whether prepared statements or ORMs are used properly."},
        {"xss",
         "Check for Cross-Site Scripting (XSS) vulnerabilities. Look for proper input "
         "sanitization and output encoding."},
        {"auth",
         "Analyze the authentication and authorization implementation. Check for JWT "
         "handling, session management, and access controls."},
        {"general",
         "Perform a general security audit. Look for common vulnerabilities like hardcoded "
         "secrets, insecure configurations, and improper error handling."},
        {"input_validation",
         "Analyze input validation throughout the codebase. Check how user inputs are "
         "validated and sanitized."}
    };
    return entries;
}

const TemplateEntries& architecture_entries() {
    static const TemplateEntries entries = {
        {"overview",
         "Provide a high-level overview of this codebase architecture. Describe the main "
         "components, layers, and how they interact."},
        {"dependencies",
         "Analyze the dependencies in this codebase. Show the dependency graph and identify "
         "any potential issues or circular dependencies."},
        {"patterns",
         "Identify the architectural patterns and design patterns used in this codebase. "
         "Explain how they're implemented."},
        {"structure",
         "Analyze the project structure and organization. Evaluate if it follows best "
         "practices and suggest improvements."},
        {"coupling",
         "Analyze the coupling between different modules and components. Identify tightly "
         "coupled areas that could be refactored."}
    };
    return entries;
}

const TemplateEntries& entries_for(TemplateTable table) {
    return table == TemplateTable::SecurityAudit ? security_audit_entries()
                                                 : architecture_entries();
}

const std::string* find_entry(const TemplateEntries& entries, std::string_view key) {
    for (const auto& [name, text] : entries) {
        if (name == key) {
            return &text;
        }
    }
    return nullptr;
}

} // namespace

std::string_view PromptTemplates::default_key(TemplateTable table) {
    return table == TemplateTable::SecurityAudit ? "general" : "overview";
}

const std::string& PromptTemplates::resolve(TemplateTable table, std::string_view category) {
    const auto& entries = entries_for(table);

    if (const std::string* text = find_entry(entries, category)) {
        return *text;
    }

    spdlog::warn("Unrecognized category '{}', falling back to '{}'",
                 category, default_key(table));
    return *find_entry(entries, default_key(table));
}

std::vector<std::string> PromptTemplates::categories(TemplateTable table) {
    std::vector<std::string> keys;
    for (const auto& entry : entries_for(table)) {
        keys.push_back(entry.first);
    }
    return keys;
}

std::string PromptTemplates::verification_prompt(const std::string& feature_name) {
    return "Has " + feature_name + " been implemented in this codebase? Show me the relevant "
           "files and functions if it exists, or confirm if it's missing.";
}

} // namespace gemini_mcp
