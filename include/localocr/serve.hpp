#pragma once

#include "mcp.hpp"
#include "tool_dispatcher.hpp"

#include <cstddef>
#include <future>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace localocr {

class Service {
public:
    static constexpr std::size_t kDefaultMaxInFlight = 8;

    // Tool calls beyond `max_in_flight` are answered at once with a busy result.
    explicit Service(const ToolDispatcher& dispatcher, MCPBridge bridge = MCPBridge(),
                     std::size_t max_in_flight = kDefaultMaxInFlight);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Returns at end of input, after every in-flight tool call has answered.
    // A read error on `in` is reported by throwing std::runtime_error once the
    // in-flight calls have answered.
    void run(std::istream& in, std::ostream& out);

private:
    const ToolDispatcher* m_dispatcher;
    MCPBridge m_bridge;
    std::size_t m_max_in_flight;
    std::mutex m_write_mutex;
    std::vector<std::future<void>> m_in_flight;

    JsonObject handle_request(const MCPBridge::Request& request);
    void handle_notification(const MCPBridge::Request& request);
    void start_tool_call(const MCPBridge::Request& request, std::ostream& out);
    void write_response(std::ostream& out, const Json& id, const Json& result);
    void write_error(std::ostream& out, const Json& id, int code, const std::string& message);
    void reap_finished();
    void wait_in_flight();
};

} // namespace localocr
