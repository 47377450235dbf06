#pragma once

#include <stdexcept>
#include <string>

namespace gemini_mcp {

/**
 * @brief A required tool or prompt argument was not supplied
 */
class MissingArgumentError : public std::invalid_argument {
public:
    explicit MissingArgumentError(const std::string& argument)
        : std::invalid_argument("Missing required parameter: " + argument),
          argument_(argument) {}

    const std::string& argument() const noexcept { return argument_; }

private:
    std::string argument_;
};

/**
 * @brief An argument was supplied with the wrong JSON type
 */
class InvalidArgumentError : public std::invalid_argument {
public:
    InvalidArgumentError(const std::string& argument, const std::string& expected)
        : std::invalid_argument("Parameter '" + argument + "' must be " + expected),
          argument_(argument) {}

    const std::string& argument() const noexcept { return argument_; }

private:
    std::string argument_;
};

/**
 * @brief Requested prompt name is not in the prompt catalog
 */
class UnknownPromptError : public std::out_of_range {
public:
    explicit UnknownPromptError(const std::string& name)
        : std::out_of_range("Unknown prompt: " + name), name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/**
 * @brief Failure to create or start a child process
 *
 * Thrown inside the process layer only; ProcessExecutor converts it
 * into a failed ExecutionResult.
 */
class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace gemini_mcp
