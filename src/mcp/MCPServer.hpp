#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace upnote_mcp {

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @return Tool payload; throws on failure
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief Methods the server understands
 */
enum class Method {
    Initialize,
    ToolsList,
    ToolsCall,
    Ping,
    Shutdown,
    InitializedNotification,
    CancelledNotification,
    Exit,
    Unknown
};

/**
 * @brief MCP Server implementing JSON-RPC 2.0 protocol
 *
 * Reads messages from the transport, answers every request exactly once and
 * never answers notifications.
 * Supports methods: initialize, tools/list, tools/call, ping, shutdown
 */
class MCPServer {
public:
    static constexpr const char* kServerName = "upnote-mcp";
    static constexpr const char* kServerVersion = "1.0.0";
    static constexpr const char* kDefaultProtocolVersion = "2024-11-05";

    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport);

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Start server main loop
     *
     * Blocks until shutdown, end of input, a transport fault or stop().
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     */
    void stop();

    /**
     * @brief Handle one decoded message
     * @param message Request or notification
     * @return Reply for requests, std::nullopt for notifications
     */
    std::optional<json> handle_message(const json& message);

    /**
     * @brief Map a method name to the Method table (Unknown if absent)
     */
    static Method parse_method(std::string_view name);

    bool is_initialized() const { return initialized_; }

private:
    json dispatch_request(Method method, const std::string& name, const json& params);
    void handle_notification(Method method, const std::string& name, const json& params);

    /**
     * @brief Handle tools/list method
     * @return JSON array of available tools with schemas
     */
    json handle_tools_list();

    /**
     * @brief Handle tools/call method
     * @param params Request parameters with tool name and arguments
     * @return Content payload with isError flag
     */
    json handle_tools_call(const json& params);

    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info
     * @return Server capabilities and info
     */
    json handle_initialize(const json& params);

    static json create_result_response(const json& id, const json& result);
    static json create_error_response(const json& id, int code, const std::string& message);
    static json create_tool_content(const json& payload, bool is_error);

    std::unique_ptr<ITransport> transport_;
    std::map<std::string, ToolInfo> tools_;
    std::map<std::string, ToolHandler> handlers_;
    std::atomic<bool> running_{false};
    bool stop_after_reply_{false};
    bool initialized_{false};
};

} // namespace upnote_mcp
