#pragma once

#include <nlohmann/json.hpp>

namespace gemini_mcp {

using json = nlohmann::json;

/**
 * @brief Abstract interface for MCP message transports
 *
 * Implementations move whole JSON-RPC messages in and out; framing is
 * their concern, routing is MCPServer's.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next JSON-RPC message
     * @return Parsed message, or null JSON at end of input
     * @throws json::parse_error if a message cannot be parsed; the
     *         transport stays usable afterwards
     */
    virtual json read_message() = 0;

    /**
     * @brief Write one JSON-RPC message
     */
    virtual void write_message(const json& message) = 0;

    virtual bool is_open() const = 0;
};

} // namespace gemini_mcp
