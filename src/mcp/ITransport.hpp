#pragma once

#include "JsonRpc.hpp"
#include <optional>

namespace upnote_mcp {

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations handle reading/writing JSON-RPC messages over a concrete
 * byte stream and its framing.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport
     *
     * A complete frame whose body is not valid JSON is dropped and reported
     * as RpcError with error_code::kParseError; the next call continues with
     * the following frame. Other exceptions are stream faults.
     *
     * @return Decoded message, or std::nullopt on end of input
     */
    virtual std::optional<json> read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport
     *
     * Throws std::runtime_error if the underlying stream fails.
     *
     * @param message JSON message to write
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace upnote_mcp
