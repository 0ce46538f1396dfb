#pragma once

#include "input_resolver.hpp"
#include "json.hpp"
#include "ocr/engine.hpp"
#include "ocr_bridge.hpp"

#include <string>
#include <vector>

namespace localocr {

inline constexpr const char* kOcrToolName = "ocr_extract_text";

struct OcrParameters {
    std::string image;
    std::vector<std::string> languages{"en-US"};
    ocr::QualityLevel quality = ocr::QualityLevel::Accurate;
    bool use_language_correction = true;

    // Throws ToolError (MissingParameter, InvalidParameter).
    static OcrParameters from_arguments(const Json& arguments);
};

class ToolDispatcher {
public:
    ToolDispatcher(const InputResolver& resolver, OcrEngineBridge& bridge);

    // call-tool result object; failures come back with isError set, never thrown.
    Json handle(const std::string& tool_name, const Json& arguments) const;

    // Throws ToolError.
    std::string extract_text(const std::string& tool_name, const Json& arguments) const;

    static Json tool_descriptor();

private:
    const InputResolver& m_resolver;
    OcrEngineBridge& m_bridge;
};

Json make_text_result(const std::string& text, bool is_error);

} // namespace localocr
