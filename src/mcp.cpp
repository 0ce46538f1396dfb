#include "../include/localocr/mcp.hpp"

#include <algorithm>
#include <cctype>

namespace localocr {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_valid_id(const Json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

} // namespace

std::optional<MCPBridge::Request> MCPBridge::read_request(std::istream& in) const {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line)) {
            continue;
        }
        return parse_request(line);
    }
    return std::nullopt;
}

MCPBridge::Request MCPBridge::parse_request(const std::string& line) const {
    Json parsed;
    try {
        parsed = Json::parse(line);
    } catch (const std::exception& ex) {
        throw ProtocolError(ParseError, std::string("Parse error: ") + ex.what());
    }
    if (!parsed.is_object()) {
        throw ProtocolError(InvalidRequest, "Invalid Request: expected a JSON object");
    }

    Request request;
    const auto& obj = parsed.as_object();
    if (auto it = obj.find("id"); it != obj.end()) {
        if (!is_valid_id(it->second)) {
            throw ProtocolError(InvalidRequest, "Invalid Request: id must be a string or number");
        }
        request.id = it->second;
        request.has_id = true;
    }
    if (auto it = obj.find("method"); it != obj.end() && it->second.is_string()) {
        request.method = it->second.as_string();
    } else {
        throw ProtocolError(InvalidRequest, "Invalid Request: missing method", request.id);
    }
    if (auto it = obj.find("params"); it != obj.end()) {
        request.params = it->second;
    }
    return request;
}

void MCPBridge::send_response(std::ostream& out, const Json& id, const Json& result) const {
    JsonObject obj;
    obj["jsonrpc"] = Json("2.0");
    obj["id"] = id;
    obj["result"] = result;
    out << Json(obj).dump() << '\n';
    out.flush();
}

void MCPBridge::send_error(std::ostream& out, const Json& id, int code, const std::string& message) const {
    JsonObject err;
    err["code"] = Json(code);
    err["message"] = Json(message);
    JsonObject obj;
    obj["jsonrpc"] = Json("2.0");
    obj["id"] = id;
    obj["error"] = Json(err);
    out << Json(obj).dump() << '\n';
    out.flush();
}

} // namespace localocr
