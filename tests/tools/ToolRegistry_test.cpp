#include "tools/ToolRegistry.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace gemini_mcp;
using json = nlohmann::json;

namespace {

std::vector<std::string> required_of(const ToolInfo& info) {
    return info.input_schema["required"].get<std::vector<std::string>>();
}

} // namespace

TEST(ToolRegistryTest, SixToolsInStableOrder) {
    ToolRegistry registry;
    const auto& tools = registry.list_tools();

    ASSERT_EQ(tools.size(), 6u);
    EXPECT_EQ(tools[0].name, "gemini_analyze_files");
    EXPECT_EQ(tools[1].name, "gemini_analyze_directories");
    EXPECT_EQ(tools[2].name, "gemini_analyze_all_files");
    EXPECT_EQ(tools[3].name, "gemini_verify_implementation");
    EXPECT_EQ(tools[4].name, "gemini_security_audit");
    EXPECT_EQ(tools[5].name, "gemini_architecture_analysis");
}

TEST(ToolRegistryTest, ListingIsIdempotent) {
    ToolRegistry registry;

    std::vector<json> first;
    for (const auto& tool : registry.list_tools()) {
        auto info = ToolRegistry::to_tool_info(tool);
        first.push_back({{"name", info.name}, {"schema", info.input_schema}});
    }

    std::vector<json> second;
    for (const auto& tool : registry.list_tools()) {
        auto info = ToolRegistry::to_tool_info(tool);
        second.push_back({{"name", info.name}, {"schema", info.input_schema}});
    }

    EXPECT_EQ(first, second);
    EXPECT_EQ(&registry.list_tools(), &registry.list_tools());
}

TEST(ToolRegistryTest, RequiredArgumentsPerTool) {
    ToolRegistry registry;
    auto required = [&registry](const char* name) {
        return required_of(ToolRegistry::to_tool_info(*registry.find(name)));
    };

    EXPECT_EQ(required("gemini_analyze_files"), (std::vector<std::string>{"files", "prompt"}));
    EXPECT_EQ(required("gemini_analyze_directories"), (std::vector<std::string>{"directories", "prompt"}));
    EXPECT_EQ(required("gemini_analyze_all_files"), (std::vector<std::string>{"prompt"}));
    EXPECT_EQ(required("gemini_verify_implementation"),
              (std::vector<std::string>{"feature_name", "search_paths"}));
    EXPECT_EQ(required("gemini_security_audit"), (std::vector<std::string>{"audit_type", "paths"}));
    EXPECT_EQ(required("gemini_architecture_analysis"),
              (std::vector<std::string>{"analysis_type", "paths"}));
}

TEST(ToolRegistryTest, WorkingDirectoryIsOptionalEverywhere) {
    ToolRegistry registry;

    for (const auto& tool : registry.list_tools()) {
        const ArgumentSpec* wd = tool.find_argument(ToolRegistry::kWorkingDirectoryArgument);
        ASSERT_NE(wd, nullptr) << tool.name;
        EXPECT_FALSE(wd->required) << tool.name;
        EXPECT_EQ(wd->type, ArgumentType::String);

        auto info = ToolRegistry::to_tool_info(tool);
        EXPECT_TRUE(info.input_schema["properties"].contains("working_directory"));
        auto required = required_of(info);
        EXPECT_EQ(std::count(required.begin(), required.end(), "working_directory"), 0);
    }
}

TEST(ToolRegistryTest, SchemaTypesAndEnums) {
    ToolRegistry registry;

    auto files = ToolRegistry::to_tool_info(*registry.find("gemini_analyze_files"));
    EXPECT_EQ(files.input_schema["type"], "object");
    EXPECT_EQ(files.input_schema["properties"]["files"]["type"], "array");
    EXPECT_EQ(files.input_schema["properties"]["files"]["items"]["type"], "string");
    EXPECT_EQ(files.input_schema["properties"]["prompt"]["type"], "string");

    auto audit = ToolRegistry::to_tool_info(*registry.find("gemini_security_audit"));
    EXPECT_EQ(audit.input_schema["properties"]["audit_type"]["enum"],
              json::array({"sql_injection", "xss", "auth", "general", "input_validation"}));

    auto arch = ToolRegistry::to_tool_info(*registry.find("gemini_architecture_analysis"));
    EXPECT_EQ(arch.input_schema["properties"]["analysis_type"]["enum"],
              json::array({"overview", "dependencies", "patterns", "structure", "coupling"}));
}

TEST(ToolRegistryTest, RecipesMatchTools) {
    ToolRegistry registry;

    const auto* files = registry.find("gemini_analyze_files");
    EXPECT_EQ(files->path_argument, "files");
    EXPECT_EQ(files->path_kind, PathKind::File);

    const auto* dirs = registry.find("gemini_analyze_directories");
    EXPECT_EQ(dirs->path_kind, PathKind::Directory);

    const auto* all = registry.find("gemini_analyze_all_files");
    EXPECT_TRUE(all->all_files);
    EXPECT_TRUE(all->path_argument.empty());

    const auto* verify = registry.find("gemini_verify_implementation");
    EXPECT_EQ(verify->prompt_source, PromptSource::Verification);
    EXPECT_EQ(verify->override_argument, "verification_prompt");
    EXPECT_FALSE(verify->path_kind.has_value());
}

TEST(ToolRegistryTest, UnknownNameIsNull) {
    ToolRegistry registry;
    EXPECT_EQ(registry.find("gemini_write_code"), nullptr);
    EXPECT_EQ(registry.find(""), nullptr);
}
