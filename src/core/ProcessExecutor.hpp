#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gemini_mcp {

/**
 * @brief Program name followed by its arguments
 */
using CommandVector = std::vector<std::string>;

/**
 * @brief Captured outcome of a child process
 */
struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool timed_out = false;

    bool success() const { return exit_code == 0; }
};

/**
 * @brief Settings for ProcessExecutor
 */
struct ExecutorOptions {
    std::string program = "gemini";        // binary probed before every run
    std::chrono::seconds timeout{600};     // 0 = wait forever
};

/**
 * @brief Abstract interface for running an external command
 *
 * The dispatcher depends on this seam so tests can observe the command
 * vector without spawning anything.
 */
class IProcessExecutor {
public:
    virtual ~IProcessExecutor() = default;

    /**
     * @brief Run command to completion
     * @param command Program and arguments
     * @param cwd Working directory (current directory when empty)
     * @return Captured output and exit status; never throws for spawn failures
     */
    virtual ExecutionResult run(const CommandVector& command,
                                const std::optional<std::string>& cwd) = 0;
};

/**
 * @brief Low-level spawn signature used by ProcessExecutor
 *
 * Implementations throw SpawnError when the child cannot be started.
 */
using SpawnFunction = std::function<ExecutionResult(
    const CommandVector& command,
    const std::filesystem::path& cwd,
    std::chrono::seconds timeout)>;

/**
 * @brief fork/execvp the command and capture its output
 *
 * stdin is /dev/null; stdout and stderr are drained through non-blocking
 * pipes. When timeout is nonzero and elapses, the child is killed with
 * SIGKILL and the result reports exit code 124.
 *
 * @throws SpawnError if pipes, fork, chdir or exec fail
 */
ExecutionResult spawn_process(const CommandVector& command,
                              const std::filesystem::path& cwd,
                              std::chrono::seconds timeout);

/**
 * @brief Two-phase executor: probe for the program, then run the command
 */
class ProcessExecutor : public IProcessExecutor {
public:
    static constexpr int kTimeoutExitCode = 124;
    static constexpr const char* kNotFoundMessage =
        "Gemini CLI not found. Please install gemini CLI first.";

    explicit ProcessExecutor(ExecutorOptions options = {},
                             SpawnFunction spawn = spawn_process);

    ExecutionResult run(const CommandVector& command,
                        const std::optional<std::string>& cwd) override;

    const ExecutorOptions& options() const { return options_; }

private:
    /**
     * @brief Check that the configured program resolves on PATH
     */
    bool probe_available();

    ExecutorOptions options_;
    SpawnFunction spawn_;
};

} // namespace gemini_mcp
