#include "localocr/json.hpp"
#include "localocr/serve.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <functional>
#include <future>
#include <istream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

using namespace localocr;
namespace fs = std::filesystem;

namespace {

class EchoRecognizer : public ocr::TextRecognizer {
public:
    std::vector<std::string> recognize(const ocr::OcrRequest&) override { return {"recognized"}; }
};

// Serves `data`, then at end of input either reports EOF after notifying
// `on_drained` or fails the read the way a broken pipe would.
class ScriptedInput : public std::streambuf {
public:
    ScriptedInput(std::string data, bool fail_at_end, std::function<void()> on_drained = {})
        : m_data(std::move(data)), m_fail_at_end(fail_at_end), m_on_drained(std::move(on_drained)) {}

protected:
    int_type underflow() override {
        if (!m_served) {
            m_served = true;
            if (!m_data.empty()) {
                setg(m_data.data(), m_data.data(), m_data.data() + m_data.size());
                return traits_type::to_int_type(*gptr());
            }
        }
        if (m_fail_at_end) {
            throw std::runtime_error("input device failed");
        }
        if (m_on_drained) {
            m_on_drained();
            m_on_drained = nullptr;
        }
        return traits_type::eof();
    }

private:
    std::string m_data;
    bool m_fail_at_end;
    std::function<void()> m_on_drained;
    bool m_served = false;
};

// Holds every recognition until the test opens the gate.
class GatedRecognizer : public ocr::TextRecognizer {
public:
    GatedRecognizer() : m_gate(m_open.get_future().share()) {}

    std::vector<std::string> recognize(const ocr::OcrRequest&) override {
        m_gate.wait();
        return {"late"};
    }

    void open() { m_open.set_value(); }

private:
    std::promise<void> m_open;
    std::shared_future<void> m_gate;
};

std::vector<Json> parse_frames(const std::string& output) {
    std::vector<Json> frames;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        frames.push_back(Json::parse(line));
    }
    return frames;
}

std::string call_line(int id) {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) +
           R"(,"method":"tools/call","params":{"name":"ocr_extract_text","arguments":{"image":"data:image/png;base64,UE5HREFUQQ=="}}})"
           "\n";
}

class ServiceTest : public ::testing::Test {
protected:
    ServiceTest()
        : m_scratch(fs::temp_directory_path() / ("localocr-test-serve-" + std::to_string(std::random_device{}()))),
          m_resolver(options_for(m_scratch), [](const std::string&) {
              return net::HttpResponse{200, "image/png", "bytes"};
          }),
          m_bridge(m_recognizer),
          m_dispatcher(m_resolver, m_bridge) {}

    ~ServiceTest() override {
        std::error_code ec;
        fs::remove_all(m_scratch, ec);
    }

    static InputResolver::Options options_for(const fs::path& scratch) {
        InputResolver::Options options;
        options.temp_dir = scratch / "temp";
        return options;
    }

    // Runs the service over `input` and returns every output frame parsed.
    std::vector<Json> exchange(const std::string& input) {
        std::istringstream in(input);
        std::ostringstream out;
        Service service(m_dispatcher);
        service.run(in, out);

        return parse_frames(out.str());
    }

    static const Json* find_by_id(const std::vector<Json>& frames, double id) {
        for (const auto& frame : frames) {
            const auto& obj = frame.as_object();
            auto it = obj.find("id");
            if (it != obj.end() && it->second.is_number() && it->second.as_number() == id) {
                return &frame;
            }
        }
        return nullptr;
    }

    static int error_code(const Json& frame) {
        return static_cast<int>(frame.as_object().at("error").as_object().at("code").as_number());
    }

    fs::path m_scratch;
    EchoRecognizer m_recognizer;
    InputResolver m_resolver;
    OcrEngineBridge m_bridge;
    ToolDispatcher m_dispatcher;
};

} // namespace

TEST_F(ServiceTest, InitializeReportsServerInfo) {
    const auto frames = exchange(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26","clientInfo":{"name":"test"}}})"
        "\n");
    ASSERT_EQ(frames.size(), 1u);
    const auto& result = frames[0].as_object().at("result").as_object();
    EXPECT_EQ(result.at("protocolVersion").as_string(), "2025-03-26");
    EXPECT_EQ(result.at("serverInfo").as_object().at("name").as_string(), "local-ocr");
    EXPECT_EQ(result.at("capabilities").as_object().count("tools"), 1u);
}

TEST_F(ServiceTest, NotificationsGetNoResponse) {
    const auto frames = exchange(
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].as_object().at("id").as_number(), 2.0);
    EXPECT_TRUE(frames[0].as_object().at("result").is_object());
}

TEST_F(ServiceTest, ToolsListAdvertisesOneTool) {
    const auto frames = exchange("{\"jsonrpc\":\"2.0\",\"id\":\"list\",\"method\":\"tools/list\"}\n");
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].as_object().at("id").as_string(), "list");
    const auto& tools = frames[0].as_object().at("result").as_object().at("tools").as_array();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].as_object().at("name").as_string(), "ocr_extract_text");
}

TEST_F(ServiceTest, ToolCallReturnsTextResult) {
    const auto frames = exchange(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"ocr_extract_text","arguments":{"image":"data:image/png;base64,UE5HREFUQQ=="}}})"
        "\n");
    ASSERT_EQ(frames.size(), 1u);
    const auto& result = frames[0].as_object().at("result").as_object();
    EXPECT_FALSE(result.at("isError").as_bool());
    EXPECT_EQ(result.at("content").as_array().at(0).as_object().at("text").as_string(), "recognized");
}

TEST_F(ServiceTest, ToolFailureIsAResultNotAProtocolError) {
    const auto frames = exchange(
        R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"ocr_extract_text","arguments":{"image":"/nonexistent/x.png"}}})"
        "\n");
    ASSERT_EQ(frames.size(), 1u);
    const auto& obj = frames[0].as_object();
    EXPECT_EQ(obj.count("error"), 0u);
    EXPECT_TRUE(obj.at("result").as_object().at("isError").as_bool());
}

TEST_F(ServiceTest, ProtocolErrorsKeepTheLoopRunning) {
    const auto frames = exchange(
        "this is not json\n"
        "[1,2,3]\n"
        "{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"resources/list\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":6,\"method\":\"tools/call\",\"params\":{}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"ping\"}\n");
    ASSERT_EQ(frames.size(), 5u);

    EXPECT_TRUE(frames[0].as_object().at("id").is_null());
    EXPECT_EQ(error_code(frames[0]), MCPBridge::ParseError);
    EXPECT_EQ(error_code(frames[1]), MCPBridge::InvalidRequest);

    const Json* unknown = find_by_id(frames, 5);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(error_code(*unknown), MCPBridge::MethodNotFound);

    const Json* missing_name = find_by_id(frames, 6);
    ASSERT_NE(missing_name, nullptr);
    EXPECT_EQ(error_code(*missing_name), MCPBridge::InvalidParams);

    ASSERT_NE(find_by_id(frames, 7), nullptr);
}

TEST_F(ServiceTest, ConcurrentToolCallsAllAnswerBeforeExit) {
    std::string input;
    for (int id = 10; id < 16; ++id) {
        input += R"({"jsonrpc":"2.0","id":)" + std::to_string(id) +
                 R"(,"method":"tools/call","params":{"name":"ocr_extract_text","arguments":{"image":"https://example.com/a.png"}}})"
                 "\n";
    }
    const auto frames = exchange(input);
    ASSERT_EQ(frames.size(), 6u);
    for (int id = 10; id < 16; ++id) {
        const Json* frame = find_by_id(frames, id);
        ASSERT_NE(frame, nullptr) << "no response for id " << id;
        EXPECT_FALSE(frame->as_object().at("result").as_object().at("isError").as_bool());
    }
}

TEST_F(ServiceTest, DeeplyNestedFrameIsAParseErrorAndLoopContinues) {
    const std::string pad = std::string(200000, '[') + std::string(200000, ']');
    const auto frames = exchange(
        R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"ocr_extract_text","arguments":{"image":"/x.png","pad":)" +
        pad + "}}}\n" + "{\"jsonrpc\":\"2.0\",\"id\":9,\"method\":\"ping\"}\n");
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_TRUE(frames[0].as_object().at("id").is_null());
    EXPECT_EQ(error_code(frames[0]), MCPBridge::ParseError);
    ASSERT_NE(find_by_id(frames, 9), nullptr);
}

TEST_F(ServiceTest, ReadFailureIsReportedAfterPendingCallsAnswer) {
    ScriptedInput input(call_line(20) + "{\"jsonrpc\":\"2.0\",\"id\":21,\"method\":\"ping\"}\n", true);
    std::istream in(&input);
    std::ostringstream out;
    Service service(m_dispatcher);

    EXPECT_THROW(service.run(in, out), std::runtime_error);
    EXPECT_TRUE(in.bad());

    const auto frames = parse_frames(out.str());
    ASSERT_EQ(frames.size(), 2u);
    ASSERT_NE(find_by_id(frames, 20), nullptr);
    ASSERT_NE(find_by_id(frames, 21), nullptr);
}

TEST_F(ServiceTest, CleanEndOfInputDoesNotThrow) {
    ScriptedInput input("{\"jsonrpc\":\"2.0\",\"id\":22,\"method\":\"ping\"}\n", false);
    std::istream in(&input);
    std::ostringstream out;
    Service service(m_dispatcher);

    EXPECT_NO_THROW(service.run(in, out));
    EXPECT_FALSE(in.bad());
    EXPECT_EQ(parse_frames(out.str()).size(), 1u);
}

TEST(ServiceBackpressureTest, CallsBeyondTheLimitGetABusyResult) {
    const fs::path scratch =
        fs::temp_directory_path() / ("localocr-test-busy-" + std::to_string(std::random_device{}()));
    InputResolver::Options options;
    options.temp_dir = scratch / "temp";
    InputResolver resolver(options);
    GatedRecognizer recognizer;
    OcrEngineBridge bridge(recognizer);
    ToolDispatcher dispatcher(resolver, bridge);

    // The gate opens only once every line has been read, so the first call is
    // still running while the other two arrive.
    std::promise<void> drained;
    std::thread opener([&recognizer, drained_future = drained.get_future()]() mutable {
        drained_future.wait();
        recognizer.open();
    });
    ScriptedInput input(call_line(30) + call_line(31) + call_line(32), false, [&drained] { drained.set_value(); });
    std::istream in(&input);
    std::ostringstream out;
    {
        Service service(dispatcher, MCPBridge(), 1);
        service.run(in, out);
    }
    opener.join();

    const auto frames = parse_frames(out.str());
    ASSERT_EQ(frames.size(), 3u);
    for (const auto& frame : frames) {
        const auto& obj = frame.as_object();
        const int id = static_cast<int>(obj.at("id").as_number());
        const auto& result = obj.at("result").as_object();
        const std::string text = result.at("content").as_array().at(0).as_object().at("text").as_string();
        if (id == 30) {
            EXPECT_FALSE(result.at("isError").as_bool());
            EXPECT_EQ(text, "late");
        } else {
            EXPECT_TRUE(result.at("isError").as_bool()) << "id " << id;
            EXPECT_NE(text.find("busy"), std::string::npos);
        }
    }

    std::error_code ec;
    fs::remove_all(scratch, ec);
}
