#include <exception>
#include <iostream>
#include <string>

#include "../include/localocr/config.hpp"
#include "../include/localocr/input_resolver.hpp"
#include "../include/localocr/log.hpp"
#include "../include/localocr/ocr/tesseract_recognizer.hpp"
#include "../include/localocr/ocr_bridge.hpp"
#include "../include/localocr/serve.hpp"
#include "../include/localocr/tool_dispatcher.hpp"

int main() {
    using namespace localocr;

    try {
        const ServerConfig config = ServerConfig::from_environment();
        set_log_threshold(config.log_level);
        log_info("Server", std::string(kServerName) + " " + kServerVersion + " starting" +
                               (config.supervised ? " (supervised)" : ""));
        log_debug("Server", "temp directory: " + config.temp_dir.string());

        ocr::TesseractRecognizer recognizer(config.tessdata_dir);
        OcrEngineBridge bridge(recognizer);

        InputResolver::Options options;
        options.temp_dir = config.temp_dir;
        options.download_timeout_ms = config.download_timeout_ms;
        options.max_download_bytes = config.max_download_bytes;
        InputResolver resolver(options);

        ToolDispatcher dispatcher(resolver, bridge);
        Service service(dispatcher);
        service.run(std::cin, std::cout);

        log_info("Server", "stdin closed; exiting");
        return 0;
    } catch (const std::exception& ex) {
        log_error("Server", std::string("fatal: ") + ex.what());
        return 1;
    }
}
