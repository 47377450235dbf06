#pragma once

#include "core/ProcessExecutor.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gemini_mcp {

/**
 * @brief Records every command instead of spawning it
 */
class SpyExecutor : public IProcessExecutor {
public:
    struct Call {
        CommandVector command;
        std::optional<std::string> cwd;
    };

    ExecutionResult run(const CommandVector& command,
                        const std::optional<std::string>& cwd) override {
        calls.push_back({command, cwd});
        return next_result;
    }

    const Call& last_call() const { return calls.back(); }

    std::vector<Call> calls;
    ExecutionResult next_result{"analysis output\n", "", 0, false};
};

} // namespace gemini_mcp
