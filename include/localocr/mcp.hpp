#pragma once

#include "json.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace localocr {

// JSON-RPC 2.0 framing for the MCP stdio transport: one message per line.
class MCPBridge {
public:
    enum ErrorCode : int {
        ParseError = -32700,
        InvalidRequest = -32600,
        MethodNotFound = -32601,
        InvalidParams = -32602,
        InternalError = -32603
    };

    struct Request {
        Json id;
        bool has_id = false; // false for notifications
        std::string method;
        Json params;
    };

    class ProtocolError : public std::runtime_error {
    public:
        ProtocolError(int code, const std::string& message, Json id = Json())
            : std::runtime_error(message), m_code(code), m_id(std::move(id)) {}

        int code() const noexcept { return m_code; }
        const Json& id() const noexcept { return m_id; }

    private:
        int m_code;
        Json m_id;
    };

    // Skips blank lines; nullopt at end of input or after a stream failure
    // (check in.bad()). Malformed frames throw
    // ProtocolError so the caller can answer and keep reading.
    std::optional<Request> read_request(std::istream& in) const;
    Request parse_request(const std::string& line) const;

    void send_response(std::ostream& out, const Json& id, const Json& result) const;
    void send_error(std::ostream& out, const Json& id, int code, const std::string& message) const;
};

} // namespace localocr
