#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace upnote_mcp {

MCPServer::MCPServer(std::unique_ptr<ITransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized");
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    tools_[info.name] = info;
    handlers_[info.name] = std::move(handler);
    spdlog::info("Registered tool: {}", info.name);
}

void MCPServer::run() {
    running_ = true;
    stop_after_reply_ = false;
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport_->is_open()) {
        std::optional<json> message;
        try {
            message = transport_->read_message();
        } catch (const RpcError& e) {
            // The id of an unparseable frame is unknown, so the reply carries null
            spdlog::warn("Undecodable message: {}", e.what());
            try {
                transport_->write_message(create_error_response(nullptr, e.code(), e.what()));
            } catch (const std::exception& write_error) {
                spdlog::error("Transport write failed: {}", write_error.what());
                break;
            }
            continue;
        } catch (const std::exception& e) {
            spdlog::error("Transport read failed: {}", e.what());
            break;
        }

        if (!message) {
            spdlog::info("End of input, stopping server");
            break;
        }

        std::optional<json> response = handle_message(*message);

        if (response) {
            try {
                transport_->write_message(*response);
            } catch (const std::exception& e) {
                spdlog::error("Transport write failed: {}", e.what());
                break;
            }
        }

        if (stop_after_reply_) {
            spdlog::info("Shutdown requested by client");
            break;
        }
    }

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    running_ = false;
}

Method MCPServer::parse_method(std::string_view name) {
    static const std::map<std::string_view, Method> kMethods = {
        {"initialize", Method::Initialize},
        {"tools/list", Method::ToolsList},
        {"tools/call", Method::ToolsCall},
        {"ping", Method::Ping},
        {"shutdown", Method::Shutdown},
        {"notifications/initialized", Method::InitializedNotification},
        {"notifications/cancelled", Method::CancelledNotification},
        {"exit", Method::Exit},
    };

    auto it = kMethods.find(name);
    return it == kMethods.end() ? Method::Unknown : it->second;
}

std::optional<json> MCPServer::handle_message(const json& message) {
    if (!message.is_object()) {
        spdlog::warn("Ignoring non-object message ({} bytes)", message.dump().size());
        return std::nullopt;
    }

    bool is_request = message.contains("id") && !message["id"].is_null();
    json id = is_request ? message["id"] : json();

    if (!message.contains("method") || !message["method"].is_string()) {
        if (message.contains("result") || message.contains("error")) {
            spdlog::debug("Ignoring reply from client, id={}", id.dump());
            return std::nullopt;
        }
        if (!is_request) {
            spdlog::warn("Ignoring notification without method");
            return std::nullopt;
        }
        return create_error_response(id, error_code::kInvalidRequest,
            "Invalid Request: missing method field");
    }

    std::string name = message["method"].get<std::string>();
    json params = message.value("params", json::object());
    if (params.is_null()) {
        params = json::object();
    }
    Method method = parse_method(name);

    if (!is_request) {
        try {
            handle_notification(method, name, params);
        } catch (const std::exception& e) {
            spdlog::error("Error handling notification {}: {}", name, e.what());
        }
        return std::nullopt;
    }

    spdlog::debug("Handling request: method={}, id={}", name, id.dump());

    try {
        return create_result_response(id, dispatch_request(method, name, params));
    } catch (const RpcError& e) {
        spdlog::warn("Request {} failed: {}", name, e.what());
        return create_error_response(id, e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", name, e.what());
        return create_error_response(id, error_code::kInternalError,
            std::string("Internal error: ") + e.what());
    }
}

json MCPServer::dispatch_request(Method method, const std::string& name, const json& params) {
    switch (method) {
        case Method::Initialize: {
            json result = handle_initialize(params);
            initialized_ = true;
            return result;
        }
        case Method::ToolsList:
            return handle_tools_list();
        case Method::ToolsCall:
            return handle_tools_call(params);
        case Method::Ping:
            return json::object();
        case Method::Shutdown:
            stop_after_reply_ = true;
            return json::object();
        case Method::InitializedNotification:
        case Method::CancelledNotification:
        case Method::Exit:
        case Method::Unknown:
            break;
    }
    throw RpcError(error_code::kMethodNotFound, "Method not found: " + name);
}

void MCPServer::handle_notification(Method method, const std::string& name, const json& params) {
    switch (method) {
        case Method::InitializedNotification:
            initialized_ = true;
            spdlog::info("Client sent initialized notification, server is ready");
            break;
        case Method::CancelledNotification:
            spdlog::info("Client cancelled request {}", params.value("requestId", json()).dump());
            break;
        case Method::Exit:
            spdlog::info("Client sent exit notification");
            stop_after_reply_ = true;
            break;
        default:
            spdlog::debug("Ignoring notification: {}", name);
            break;
    }
}

json MCPServer::handle_tools_list() {
    json tools_array = json::array();

    for (const auto& [name, info] : tools_) {
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
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw RpcError(error_code::kInvalidParams, "Invalid params: missing tool name");
    }

    std::string tool_name = params["name"].get<std::string>();
    json arguments = params.value("arguments", json::object());
    if (arguments.is_null()) {
        arguments = json::object();
    }

    spdlog::info("tools/call: {}", tool_name);

    auto handler_it = handlers_.find(tool_name);
    if (handler_it == handlers_.end()) {
        return create_tool_content({{"success", false}, {"error", "Unknown tool: " + tool_name}}, true);
    }

    try {
        json result = handler_it->second(arguments);
        return create_tool_content({{"success", true}, {"result", result}}, false);
    } catch (const std::exception& e) {
        spdlog::warn("Tool {} failed: {}", tool_name, e.what());
        return create_tool_content({{"success", false}, {"error", e.what()}}, true);
    }
}

json MCPServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        std::string client_name = params["clientInfo"].value("name", "unknown");
        std::string client_version = params["clientInfo"].value("version", "unknown");
        spdlog::info("Client: {} version {}", client_name, client_version);
    }

    std::string protocol_version = kDefaultProtocolVersion;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        std::string requested = params["protocolVersion"].get<std::string>();
        if (requested.rfind("202", 0) == 0) {
            protocol_version = requested;
        }
    }

    return {
        {"protocolVersion", protocol_version},
        {"capabilities", {
            {"experimental", json::object()},
            {"prompts", {{"listChanged", false}}},
            {"resources", {{"subscribe", false}, {"listChanged", false}}},
            {"tools", {{"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", kServerName},
            {"version", kServerVersion}
        }}
    };
}

json MCPServer::create_result_response(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
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

json MCPServer::create_tool_content(const json& payload, bool is_error) {
    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", payload.dump(-1, ' ', false, json::error_handler_t::replace)}
            }
        })},
        {"isError", is_error}
    };
}

} // namespace upnote_mcp
