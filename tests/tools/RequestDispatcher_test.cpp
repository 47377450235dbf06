#include "tools/RequestDispatcher.hpp"
#include "tools/SpyExecutor.hpp"
#include "core/Errors.hpp"
#include "core/PromptTemplates.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace gemini_mcp;
using json = nlohmann::json;
namespace fs = std::filesystem;

class RequestDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        workspace_ = fs::temp_directory_path() / "request_dispatcher_test";
        fs::remove_all(workspace_);
        fs::create_directories(workspace_ / "src");
        std::ofstream(workspace_ / "README.md") << "# demo";
    }

    void TearDown() override {
        fs::remove_all(workspace_);
    }

    const std::string& final_prompt() const {
        return spy.last_call().command.back();
    }

    ToolRegistry registry;
    SpyExecutor spy;
    RequestDispatcher dispatcher{registry, spy};
    fs::path workspace_;
};

TEST_F(RequestDispatcherTest, AnalyzeFilesBuildsAnnotatedPrompt) {
    auto result = dispatcher.dispatch("gemini_analyze_files", {
        {"files", {"a.py", "b.py"}},
        {"prompt", "X"}
    });

    ASSERT_EQ(spy.calls.size(), 1u);
    EXPECT_EQ(spy.last_call().command, (CommandVector{"gemini", "-p", "@a.py @b.py X"}));
    EXPECT_FALSE(spy.last_call().cwd.has_value());
    EXPECT_EQ(result.text, "analysis output\n");
    EXPECT_FALSE(result.is_error);
}

TEST_F(RequestDispatcherTest, AnalyzeDirectoriesForcesSeparator) {
    dispatcher.dispatch("gemini_analyze_directories", {
        {"directories", {"src", "not_there"}},
        {"prompt", "Summarize"}
    });

    EXPECT_EQ(spy.last_call().command, (CommandVector{"gemini", "-p", "@src/ @not_there/ Summarize"}));
}

TEST_F(RequestDispatcherTest, AnalyzeAllFilesUsesFlagAndNoPaths) {
    dispatcher.dispatch("gemini_analyze_all_files", {
        {"prompt", "Find dead code"},
        {"working_directory", workspace_.string()}
    });

    EXPECT_EQ(spy.last_call().command,
              (CommandVector{"gemini", "--all_files", "-p", "Find dead code"}));
    EXPECT_EQ(spy.last_call().cwd, workspace_.string());
}

TEST_F(RequestDispatcherTest, VerifyImplementationProbesPaths) {
    std::string dir = (workspace_ / "src").string();
    std::string file = (workspace_ / "README.md").string();

    dispatcher.dispatch("gemini_verify_implementation", {
        {"feature_name", "dark mode"},
        {"search_paths", {dir, file}}
    });

    EXPECT_EQ(final_prompt(),
              "@" + dir + "/ @" + file + " " + PromptTemplates::verification_prompt("dark mode"));
}

TEST_F(RequestDispatcherTest, RelativePathsResolveAgainstWorkingDirectory) {
    dispatcher.dispatch("gemini_verify_implementation", {
        {"feature_name", "dark mode"},
        {"search_paths", {"src", "README.md"}},
        {"working_directory", workspace_.string()}
    });

    EXPECT_EQ(final_prompt(),
              "@src/ @README.md " + PromptTemplates::verification_prompt("dark mode"));
    EXPECT_EQ(spy.last_call().cwd, workspace_.string());
}

TEST_F(RequestDispatcherTest, VerificationOverrideTakesPrecedence) {
    dispatcher.dispatch("gemini_verify_implementation", {
        {"feature_name", "JWT authentication"},
        {"search_paths", {"lib.rs"}},
        {"verification_prompt", "Is token refresh implemented?"}
    });

    EXPECT_EQ(final_prompt(), "@lib.rs Is token refresh implemented?");
}

TEST_F(RequestDispatcherTest, EmptyOverrideFallsBackToTemplate) {
    dispatcher.dispatch("gemini_verify_implementation", {
        {"feature_name", "caching"},
        {"search_paths", {"lib.rs"}},
        {"verification_prompt", ""}
    });

    EXPECT_EQ(final_prompt(), "@lib.rs " + PromptTemplates::verification_prompt("caching"));
}

TEST_F(RequestDispatcherTest, SecurityAuditUsesTemplate) {
    dispatcher.dispatch("gemini_security_audit", {
        {"audit_type", "sql_injection"},
        {"paths", {"db.py"}}
    });

    EXPECT_EQ(final_prompt(),
              "@db.py " + PromptTemplates::resolve(TemplateTable::SecurityAudit, "sql_injection"));
}

TEST_F(RequestDispatcherTest, UnrecognizedAuditTypeFallsBackToGeneral) {
    dispatcher.dispatch("gemini_security_audit", {
        {"audit_type", "side_channels"},
        {"paths", {"app.py"}}
    });

    EXPECT_EQ(final_prompt(),
              "@app.py Perform a general security audit. Look for common vulnerabilities like "
              "hardcoded secrets, insecure configurations, and improper error handling.");
}

TEST_F(RequestDispatcherTest, ArchitectureAnalysisUsesTemplate) {
    std::string dir = (workspace_ / "src").string();

    dispatcher.dispatch("gemini_architecture_analysis", {
        {"analysis_type", "coupling"},
        {"paths", {dir}}
    });

    EXPECT_EQ(final_prompt(),
              "@" + dir + "/ " + PromptTemplates::resolve(TemplateTable::ArchitectureAnalysis, "coupling"));
}

TEST_F(RequestDispatcherTest, UnknownToolReturnsTextWithoutRunning) {
    ToolCallResult result;
    EXPECT_NO_THROW(result = dispatcher.dispatch("gemini_rewrite_everything", json::object()));

    EXPECT_EQ(result.text, "Unknown tool: gemini_rewrite_everything");
    EXPECT_TRUE(spy.calls.empty());
}

TEST_F(RequestDispatcherTest, MissingRequiredArgumentThrowsBeforeRunning) {
    try {
        dispatcher.dispatch("gemini_analyze_files", {{"files", {"a.py"}}});
        FAIL() << "Expected MissingArgumentError";
    } catch (const MissingArgumentError& e) {
        EXPECT_EQ(e.argument(), "prompt");
    }
    EXPECT_TRUE(spy.calls.empty());
}

TEST_F(RequestDispatcherTest, NullRequiredArgumentCountsAsMissing) {
    EXPECT_THROW(dispatcher.dispatch("gemini_analyze_all_files", {{"prompt", nullptr}}),
                 MissingArgumentError);
    EXPECT_THROW(dispatcher.dispatch("gemini_analyze_all_files", json()), MissingArgumentError);
}

TEST_F(RequestDispatcherTest, WrongArgumentTypesThrow) {
    EXPECT_THROW(dispatcher.dispatch("gemini_analyze_files", {{"files", "a.py"}, {"prompt", "X"}}),
                 InvalidArgumentError);
    EXPECT_THROW(dispatcher.dispatch("gemini_analyze_files", {{"files", {"a.py", 3}}, {"prompt", "X"}}),
                 InvalidArgumentError);
    EXPECT_THROW(dispatcher.dispatch("gemini_analyze_all_files", {{"prompt", "X"}, {"working_directory", 5}}),
                 InvalidArgumentError);
    EXPECT_THROW(dispatcher.dispatch("gemini_analyze_all_files", json::array({"X"})),
                 InvalidArgumentError);
    EXPECT_TRUE(spy.calls.empty());
}

TEST_F(RequestDispatcherTest, NonZeroExitReturnsStderr) {
    spy.next_result = {"partial output", "quota exceeded\n", 2, false};

    auto result = dispatcher.dispatch("gemini_analyze_all_files", {{"prompt", "X"}});

    EXPECT_EQ(result.text, "Error: quota exceeded\n");
    EXPECT_TRUE(result.is_error);
}

TEST_F(RequestDispatcherTest, StdoutPassedThroughVerbatim) {
    spy.next_result = {"  line one\n\nline three\t\n", "warning: ignored", 0, false};

    auto result = dispatcher.dispatch("gemini_analyze_all_files", {{"prompt", "X"}});

    EXPECT_EQ(result.text, "  line one\n\nline three\t\n");
}

TEST_F(RequestDispatcherTest, EmptyWorkingDirectoryMeansDefault) {
    dispatcher.dispatch("gemini_analyze_all_files", {{"prompt", "X"}, {"working_directory", ""}});

    EXPECT_FALSE(spy.last_call().cwd.has_value());
}

TEST_F(RequestDispatcherTest, ConfiguredProgramAndModel) {
    DispatcherOptions options;
    options.program = "/opt/gemini/bin/gemini";
    options.model = "gemini-2.5-pro";
    RequestDispatcher custom(registry, spy, options);

    auto invocation = custom.build_invocation("gemini_analyze_all_files", {{"prompt", "X"}});

    ASSERT_TRUE(invocation.has_value());
    EXPECT_EQ(invocation->command,
              (CommandVector{"/opt/gemini/bin/gemini", "-m", "gemini-2.5-pro", "--all_files", "-p", "X"}));
    EXPECT_TRUE(spy.calls.empty());
}

TEST_F(RequestDispatcherTest, BuildInvocationForUnknownToolIsEmpty) {
    EXPECT_FALSE(dispatcher.build_invocation("nope", json::object()).has_value());
}

TEST_F(RequestDispatcherTest, ListToolsExposesRegistry) {
    auto tools = dispatcher.list_tools();

    ASSERT_EQ(tools.size(), 6u);
    EXPECT_EQ(tools[0].name, "gemini_analyze_files");
    EXPECT_TRUE(tools[0].input_schema.contains("properties"));
}

TEST(RequestDispatcherMissingBinary, EveryToolReportsNotFound) {
    ToolRegistry registry;
    int main_spawns = 0;
    ProcessExecutor executor({}, [&main_spawns](const CommandVector& command,
                                                const fs::path&,
                                                std::chrono::seconds) -> ExecutionResult {
        if (command.front() == "which") {
            return {"", "", 1, false};
        }
        main_spawns++;
        return {"", "", 0, false};
    });
    RequestDispatcher dispatcher(registry, executor);

    const std::vector<std::pair<std::string, json>> calls = {
        {"gemini_analyze_files", {{"files", {"a.py"}}, {"prompt", "X"}}},
        {"gemini_analyze_directories", {{"directories", {"src"}}, {"prompt", "X"}}},
        {"gemini_analyze_all_files", {{"prompt", "X"}}},
        {"gemini_verify_implementation", {{"feature_name", "F"}, {"search_paths", {"src"}}}},
        {"gemini_security_audit", {{"audit_type", "xss"}, {"paths", {"src"}}}},
        {"gemini_architecture_analysis", {{"analysis_type", "overview"}, {"paths", {"src"}}}}
    };

    for (const auto& [name, args] : calls) {
        auto result = dispatcher.dispatch(name, args);
        EXPECT_EQ(result.text, std::string("Error: ") + ProcessExecutor::kNotFoundMessage) << name;
        EXPECT_TRUE(result.is_error);
    }
    EXPECT_EQ(main_spawns, 0);
}
