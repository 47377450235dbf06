#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace gemini_mcp {

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr const char* kProtocolVersion = "2024-11-05";

} // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport,
                     IToolProvider& tools,
                     IPromptProvider& prompts,
                     ServerOptions options)
    : transport_(std::move(transport)),
      tools_(tools),
      prompts_(prompts),
      options_(std::move(options)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized ({} {})", options_.name, options_.version);
}

void MCPServer::run() {
    running_ = true;
    if (options_.max_concurrent_calls > 0) {
        pool_ = std::make_unique<ThreadPool>(options_.max_concurrent_calls);
    }
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport_->is_open()) {
        try {
            json request = transport_->read_message();

            // Null message indicates EOF or closed transport
            if (request.is_null()) {
                if (running_) {
                    spdlog::info("End of input, stopping server");
                }
                break;
            }

            json response = handle_request(request);
            if (!response.is_null()) {
                send(response);
            }

        } catch (const json::parse_error& e) {
            spdlog::warn("Discarding unparsable message: {}", e.what());
            send(create_error_response(json(), kParseError,
                std::string("Parse error: ") + e.what()));
        } catch (const std::exception& e) {
            spdlog::error("Error in main loop: {}", e.what());
            send(create_error_response(json(), kInternalError,
                std::string("Internal error: ") + e.what()));
        }
    }

    if (!running_) {
        spdlog::info("MCPServer stop requested");
    }
    if (pool_) {
        spdlog::debug("Waiting for {} queued tool calls", pool_->pending());
        pool_->shutdown();
        pool_.reset();
    }

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    running_ = false;
}

void MCPServer::send(const json& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    json fallback;
    try {
        transport_->write_message(message);
        return;
    } catch (const std::exception& e) {
        spdlog::error("Failed to write message: {}", e.what());
        // A request with an id must still get an answer
        if (!message.contains("id") || message["id"].is_null() || message.contains("error")) {
            return;
        }
        fallback = create_error_response(message["id"], kInternalError,
            std::string("Internal error: ") + e.what());
    }

    try {
        transport_->write_message(fallback);
    } catch (const std::exception& e) {
        spdlog::error("Failed to write error response: {}", e.what());
    }
}

json MCPServer::handle_request(const json& request) {
    if (!request.is_object() || !request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return create_error_response(json(), kInvalidRequest,
            "Invalid Request: missing or invalid jsonrpc field");
    }

    const bool is_notification = !request.contains("id");
    json id = request.value("id", json());

    if (!request.contains("method") || !request["method"].is_string()) {
        return is_notification ? json()
            : create_error_response(id, kInvalidRequest, "Invalid Request: missing method field");
    }

    const std::string method = request["method"];
    json params = request.value("params", json::object());

    spdlog::debug("Handling {}: method={}, id={}",
                  is_notification ? "notification" : "request", method, id.dump());

    if (is_notification) {
        if (method == "notifications/initialized") {
            spdlog::info("Client sent initialized notification, server is ready");
        } else {
            spdlog::debug("Ignoring notification {}", method);
        }
        return json();
    }

    if (method == "tools/call" && pool_) {
        bool queued = pool_->enqueue([this, id, method, params] {
            send(make_response(id, method, [&] { return handle_tools_call(params); }));
        });
        return queued ? json()
            : create_error_response(id, kInternalError, "Server is shutting down");
    }

    if (method == "initialize") {
        return make_response(id, method, [&] {
            json result = handle_initialize(params);
            initialized_ = true;
            return result;
        });
    } else if (method == "ping") {
        return make_response(id, method, [] { return json::object(); });
    } else if (method == "tools/list") {
        return make_response(id, method, [&] { return handle_tools_list(); });
    } else if (method == "tools/call") {
        return make_response(id, method, [&] { return handle_tools_call(params); });
    } else if (method == "prompts/list") {
        return make_response(id, method, [&] { return handle_prompts_list(); });
    } else if (method == "prompts/get") {
        return make_response(id, method, [&] { return handle_prompts_get(params); });
    }

    return create_error_response(id, kMethodNotFound, "Method not found: " + method);
}

json MCPServer::make_response(const json& id, const std::string& method,
                              const std::function<json()>& body) {
    try {
        return {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"result", body()}
        };
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Invalid params for {}: {}", method, e.what());
        return create_error_response(id, kInvalidParams, e.what());
    } catch (const std::out_of_range& e) {
        spdlog::warn("Unknown entry requested by {}: {}", method, e.what());
        return create_error_response(id, kInvalidParams, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        return create_error_response(id, kInternalError, std::string("Internal error: ") + e.what());
    }
}

json MCPServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        std::string client_name = params["clientInfo"].value("name", "unknown");
        std::string client_version = params["clientInfo"].value("version", "unknown");
        spdlog::info("Client: {} version {}", client_name, client_version);
    }

    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {
            {"tools", json::object()},
            {"prompts", json::object()}
        }},
        {"serverInfo", {
            {"name", options_.name},
            {"version", options_.version}
        }}
    };
}

json MCPServer::handle_tools_list() {
    json tools_array = json::array();

    for (const auto& info : tools_.list_tools()) {
        tools_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"inputSchema", info.input_schema}
        });
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw std::invalid_argument("Missing required parameter: name");
    }

    std::string tool_name = params["name"];
    json arguments = params.value("arguments", json::object());

    if (!initialized_) {
        spdlog::debug("tools/call for {} before initialize", tool_name);
    }
    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    ToolCallResult result = tools_.call_tool(tool_name, arguments);

    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", result.text}
            }
        })},
        {"isError", result.is_error}
    };
}

json MCPServer::handle_prompts_list() {
    json prompts_array = json::array();

    for (const auto& info : prompts_.list_prompts()) {
        json arguments = json::array();
        for (const auto& arg : info.arguments) {
            arguments.push_back({
                {"name", arg.name},
                {"description", arg.description},
                {"required", arg.required}
            });
        }
        prompts_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"arguments", arguments}
        });
    }

    return {{"prompts", prompts_array}};
}

json MCPServer::handle_prompts_get(const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw std::invalid_argument("Missing required parameter: name");
    }

    std::string prompt_name = params["name"];
    json arguments = params.value("arguments", json::object());

    spdlog::debug("Rendering prompt: {}", prompt_name);
    return prompts_.get_prompt(prompt_name, arguments);
}

json MCPServer::create_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace gemini_mcp
