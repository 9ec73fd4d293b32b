#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace upnote_mcp {

// Insertion-ordered so replies keep "jsonrpc", "id", "result" in wire order
using json = nlohmann::ordered_json;

/**
 * @brief Reserved JSON-RPC 2.0 error codes
 */
namespace error_code {
    constexpr int kParseError = -32700;
    constexpr int kInvalidRequest = -32600;
    constexpr int kMethodNotFound = -32601;
    constexpr int kInvalidParams = -32602;
    constexpr int kInternalError = -32603;
}

/**
 * @brief Dispatch failure carrying a JSON-RPC error code
 */
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

} // namespace upnote_mcp
