#include "../include/localocr/serve.hpp"
#include "../include/localocr/config.hpp"
#include "../include/localocr/log.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace localocr {

namespace {

constexpr const char* kDefaultProtocolVersion = "2024-11-05";

std::string extract_string(const JsonObject& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->second.is_string()) {
        return it->second.as_string();
    }
    return std::string{};
}

} // namespace

Service::Service(const ToolDispatcher& dispatcher, MCPBridge bridge, std::size_t max_in_flight)
    : m_dispatcher(&dispatcher), m_bridge(std::move(bridge)), m_max_in_flight(std::max<std::size_t>(max_in_flight, 1)) {}

Service::~Service() {
    wait_in_flight();
}

void Service::run(std::istream& in, std::ostream& out) {
    for (;;) {
        std::optional<MCPBridge::Request> request;
        try {
            request = m_bridge.read_request(in);
        } catch (const MCPBridge::ProtocolError& ex) {
            log_warning("Server", ex.what());
            write_error(out, ex.id(), ex.code(), ex.what());
            continue;
        }
        if (!request) {
            break;
        }

        reap_finished();
        if (!request->has_id) {
            handle_notification(*request);
            continue;
        }

        try {
            if (request->method == "tools/call") {
                start_tool_call(*request, out);
            } else {
                JsonObject payload = handle_request(*request);
                write_response(out, request->id, Json(payload));
            }
        } catch (const MCPBridge::ProtocolError& ex) {
            write_error(out, request->id, ex.code(), ex.what());
        } catch (const std::exception& ex) {
            log_error("Server", std::string("request failed: ") + ex.what());
            write_error(out, request->id, MCPBridge::InternalError, ex.what());
        }
    }
    const bool read_failed = in.bad();
    if (read_failed) {
        log_error("Server", "read error on input; waiting for in-flight tool calls");
    } else {
        log_info("Server", "input closed; waiting for in-flight tool calls");
    }
    wait_in_flight();
    {
        std::scoped_lock lock(m_write_mutex);
        out.flush();
    }
    if (read_failed) {
        throw std::runtime_error("failed to read from input stream");
    }
}

JsonObject Service::handle_request(const MCPBridge::Request& request) {
    if (request.method == "initialize") {
        std::string version;
        std::string client;
        if (request.params.is_object()) {
            const auto& params = request.params.as_object();
            version = extract_string(params, "protocolVersion");
            if (auto it = params.find("clientInfo"); it != params.end() && it->second.is_object()) {
                client = extract_string(it->second.as_object(), "name");
            }
        }
        log_info("Server", "initialize from " + (client.empty() ? std::string("unknown client") : client));

        JsonObject tools;
        tools["listChanged"] = Json(true);
        JsonObject capabilities;
        capabilities["tools"] = Json(tools);
        JsonObject server_info;
        server_info["name"] = Json(kServerName);
        server_info["version"] = Json(kServerVersion);

        JsonObject payload;
        payload["protocolVersion"] = Json(version.empty() ? std::string(kDefaultProtocolVersion) : version);
        payload["capabilities"] = Json(capabilities);
        payload["serverInfo"] = Json(server_info);
        return payload;
    }

    if (request.method == "ping") {
        return JsonObject{};
    }

    if (request.method == "tools/list") {
        log_info("Server", "listing tools");
        JsonObject payload;
        payload["tools"] = Json(JsonArray{ToolDispatcher::tool_descriptor()});
        return payload;
    }

    throw MCPBridge::ProtocolError(MCPBridge::MethodNotFound, "Method not found: " + request.method);
}

void Service::handle_notification(const MCPBridge::Request& request) {
    if (request.method == "notifications/initialized") {
        log_debug("Server", "client initialized");
    } else if (request.method == "notifications/cancelled") {
        // In-flight OCR is not interruptible; the late result is still sent.
        log_debug("Server", "client cancelled a request");
    } else {
        log_debug("Server", "ignoring notification " + request.method);
    }
}

void Service::start_tool_call(const MCPBridge::Request& request, std::ostream& out) {
    if (!request.params.is_object()) {
        throw MCPBridge::ProtocolError(MCPBridge::InvalidParams, "Invalid params: expected an object");
    }
    const auto& params = request.params.as_object();
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->second.is_string()) {
        throw MCPBridge::ProtocolError(MCPBridge::InvalidParams, "Invalid params: missing tool name");
    }
    std::string name = name_it->second.as_string();
    Json arguments = JsonObject{};
    if (auto it = params.find("arguments"); it != params.end() && !it->second.is_null()) {
        arguments = it->second;
    }

    reap_finished();
    if (m_in_flight.size() >= m_max_in_flight) {
        log_warning("Server", "rejecting tool call: " + std::to_string(m_in_flight.size()) + " already in flight");
        write_response(out, request.id,
                       make_text_result("Server busy: too many concurrent tool calls, retry later", true));
        return;
    }

    Json id = request.id;
    m_in_flight.push_back(std::async(std::launch::async,
                                     [this, &out, id = std::move(id), name = std::move(name),
                                      arguments = std::move(arguments)]() {
        try {
            Json result = m_dispatcher->handle(name, arguments);
            write_response(out, id, result);
        } catch (const std::exception& ex) {
            log_error("Server", std::string("tool call crashed: ") + ex.what());
            write_error(out, id, MCPBridge::InternalError, ex.what());
        }
    }));
}

void Service::write_response(std::ostream& out, const Json& id, const Json& result) {
    std::scoped_lock lock(m_write_mutex);
    m_bridge.send_response(out, id, result);
}

void Service::write_error(std::ostream& out, const Json& id, int code, const std::string& message) {
    std::scoped_lock lock(m_write_mutex);
    m_bridge.send_error(out, id, code, message);
}

void Service::reap_finished() {
    m_in_flight.erase(std::remove_if(m_in_flight.begin(), m_in_flight.end(), [](std::future<void>& task) {
        if (task.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }
        task.get();
        return true;
    }), m_in_flight.end());
}

void Service::wait_in_flight() {
    for (auto& task : m_in_flight) {
        if (task.valid()) {
            task.get();
        }
    }
    m_in_flight.clear();
}

} // namespace localocr
