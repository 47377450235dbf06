#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gemini_mcp {

/**
 * @brief Category tables of canned analysis instructions
 */
enum class TemplateTable {
    SecurityAudit,        // default key "general"
    ArchitectureAnalysis  // default key "overview"
};

/**
 * @brief Static library of natural-language prompt templates
 *
 * Lookups never fail: an unrecognized category resolves to the
 * table's default entry.
 */
class PromptTemplates {
public:
    /**
     * @brief Resolve a category to its instruction text
     * @param table Which category table to consult
     * @param category Category key supplied by the caller
     * @return Template text, or the table default on a miss
     */
    static const std::string& resolve(TemplateTable table, std::string_view category);

    /**
     * @brief Fallback key used when a category is unrecognized
     */
    static std::string_view default_key(TemplateTable table);

    /**
     * @brief Known category keys, in schema order
     */
    static std::vector<std::string> categories(TemplateTable table);

    /**
     * @brief Default prompt asking whether a feature is implemented
     */
    static std::string verification_prompt(const std::string& feature_name);
};

} // namespace gemini_mcp
