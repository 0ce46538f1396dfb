#include "../include/localocr/tool_dispatcher.hpp"
#include "../include/localocr/errors.hpp"
#include "../include/localocr/log.hpp"

#include <utility>

namespace localocr {

namespace {

const char* const kToolDescription =
    "OCR - Extract text from images, screenshots, and photos with a local OCR engine. "
    "Runs fully offline; local files and pasted images never leave the machine.\n\n"
    "Use this tool to:\n"
    "- Extract or transcribe text from an image, screenshot, or photo\n"
    "- Read text from a picture or a scanned document\n"
    "- Convert text in an image to plain text\n\n"
    "Supported inputs: base64 data URLs (pasted images), local file paths, remote http/https URLs";

JsonObject string_property(const std::string& description) {
    JsonObject property;
    property["type"] = Json("string");
    property["description"] = Json(description);
    return property;
}

std::vector<std::string> parse_languages(const Json& value) {
    if (!value.is_array()) {
        throw ToolError::invalid_parameter("languages", "expected an array of strings");
    }
    std::vector<std::string> languages;
    for (const auto& entry : value.as_array()) {
        if (!entry.is_string()) {
            throw ToolError::invalid_parameter("languages", "expected an array of strings");
        }
        languages.push_back(entry.as_string());
    }
    return languages;
}

} // namespace

OcrParameters OcrParameters::from_arguments(const Json& arguments) {
    static const JsonObject empty;
    const JsonObject& args = arguments.is_object() ? arguments.as_object() : empty;

    OcrParameters params;
    if (auto it = args.find("image"); it != args.end() && it->second.is_string()) {
        params.image = it->second.as_string();
    } else {
        throw ToolError::missing_parameter("image");
    }

    if (auto it = args.find("languages"); it != args.end() && !it->second.is_null()) {
        std::vector<std::string> languages = parse_languages(it->second);
        if (!languages.empty()) {
            params.languages = std::move(languages);
        }
    }

    if (auto it = args.find("recognitionLevel"); it != args.end() && it->second.is_string()) {
        params.quality = ocr::parse_quality_level(it->second.as_string());
    }

    if (auto it = args.find("usesLanguageCorrection"); it != args.end() && !it->second.is_null()) {
        if (!it->second.is_bool()) {
            throw ToolError::invalid_parameter("usesLanguageCorrection", "expected a boolean");
        }
        params.use_language_correction = it->second.as_bool();
    }
    return params;
}

ToolDispatcher::ToolDispatcher(const InputResolver& resolver, OcrEngineBridge& bridge)
    : m_resolver(resolver), m_bridge(bridge) {}

std::string ToolDispatcher::extract_text(const std::string& tool_name, const Json& arguments) const {
    if (tool_name != kOcrToolName) {
        throw ToolError(ErrorKind::UnknownTool, "Unknown tool: " + tool_name);
    }
    OcrParameters params = OcrParameters::from_arguments(arguments);

    log_debug("Dispatcher", "resolving image input");
    ResolvedImageGuard guard(m_resolver, m_resolver.resolve(params.image));

    ocr::OcrRequest request;
    request.path = guard.image().path.string();
    request.languages = std::move(params.languages);
    request.quality = params.quality;
    request.use_language_correction = params.use_language_correction;

    log_debug("Dispatcher", "starting OCR extraction (" + ocr::quality_level_to_string(request.quality) + ")");
    std::string text = m_bridge.run(std::move(request));
    log_info("Dispatcher", "OCR extraction complete: " + std::to_string(text.size()) + " characters");
    return text;
}

Json ToolDispatcher::handle(const std::string& tool_name, const Json& arguments) const {
    log_info("Dispatcher", "tool call: " + tool_name);
    try {
        return make_text_result(extract_text(tool_name, arguments), false);
    } catch (const ToolError& ex) {
        log_warning("Dispatcher", "tool call failed (" + error_kind_to_string(ex.kind()) + "): " + ex.what());
        return make_text_result(ex.what(), true);
    } catch (const std::exception& ex) {
        log_error("Dispatcher", std::string("unexpected failure: ") + ex.what());
        return make_text_result(std::string("Internal error: ") + ex.what(), true);
    }
}

Json ToolDispatcher::tool_descriptor() {
    JsonObject properties;
    properties["image"] = Json(string_property(
        "Image input in one of three formats: (1) base64 data URL: data:image/xxx;base64,... for pasted images, "
        "(2) local file path: /path/to/image.jpg, (3) remote URL: https://example.com/image.jpg"));

    JsonObject items;
    items["type"] = Json("string");
    JsonObject languages;
    languages["type"] = Json("array");
    languages["description"] = Json("Recognition languages as BCP-47 tags (e.g. [\"en-US\", \"zh-Hans\"]). Default: [\"en-US\"]");
    languages["items"] = Json(items);
    properties["languages"] = Json(languages);

    JsonObject level = string_property("Recognition speed/accuracy tradeoff: fast or accurate. Default: accurate");
    level["enum"] = Json(JsonArray{Json("fast"), Json("accurate")});
    properties["recognitionLevel"] = Json(level);

    JsonObject correction;
    correction["type"] = Json("boolean");
    correction["description"] = Json("Enable language-model correction for better accuracy. Default: true");
    properties["usesLanguageCorrection"] = Json(correction);

    JsonObject schema;
    schema["type"] = Json("object");
    schema["properties"] = Json(properties);
    schema["required"] = Json(JsonArray{Json("image")});

    JsonObject tool;
    tool["name"] = Json(kOcrToolName);
    tool["description"] = Json(kToolDescription);
    tool["inputSchema"] = Json(schema);
    return Json(tool);
}

Json make_text_result(const std::string& text, bool is_error) {
    JsonObject block;
    block["type"] = Json("text");
    block["text"] = Json(text);
    JsonObject result;
    result["content"] = Json(JsonArray{Json(block)});
    result["isError"] = Json(is_error);
    return Json(result);
}

} // namespace localocr
