#pragma once

#include "ITransport.hpp"
#include "IPromptProvider.hpp"
#include "IToolProvider.hpp"
#include "core/ThreadPool.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace gemini_mcp {

using json = nlohmann::json;

/**
 * @brief Runtime settings for MCPServer
 */
struct ServerOptions {
    std::string name = "gemini-mcp";
    std::string version = "0.1.0";
    std::size_t max_concurrent_calls = 0;  // 0 runs tools/call on the reader thread
};

/**
 * @brief MCP Server implementing JSON-RPC 2.0 over a transport
 *
 * Supports methods: initialize, ping, tools/list, tools/call,
 * prompts/list, prompts/get. Tool calls may run on a worker pool;
 * every other method is answered in arrival order.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server
     * @param transport Transport implementation (owned)
     * @param tools Tool provider, must outlive the server
     * @param prompts Prompt provider, must outlive the server
     * @param options Server identity and concurrency
     */
    MCPServer(std::unique_ptr<ITransport> transport,
              IToolProvider& tools,
              IPromptProvider& prompts,
              ServerOptions options = {});

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the transport reaches end of input.
     * In-flight tool calls finish and are answered before it returns.
     */
    void run();

    /**
     * @brief Signal server to stop after the current message
     *
     * Only clears an atomic flag, so it may be called from a signal handler.
     */
    void stop();

private:
    /**
     * @brief Handle one incoming message
     * @return Response, or null JSON when nothing should be sent now
     */
    json handle_request(const json& request);

    /**
     * @brief Run body() and wrap its result or exception in a response
     */
    json make_response(const json& id, const std::string& method,
                       const std::function<json()>& body);

    json handle_initialize(const json& params);
    json handle_tools_list();
    json handle_tools_call(const json& params);
    json handle_prompts_list();
    json handle_prompts_get(const json& params);

    json create_error_response(const json& id, int code, const std::string& message);

    void send(const json& message);

    std::unique_ptr<ITransport> transport_;
    IToolProvider& tools_;
    IPromptProvider& prompts_;
    ServerOptions options_;

    std::unique_ptr<ThreadPool> pool_;
    std::mutex write_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> initialized_{false};
};

} // namespace gemini_mcp
