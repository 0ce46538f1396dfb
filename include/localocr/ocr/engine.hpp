#pragma once

#include <memory>
#include <string>
#include <vector>

namespace localocr::ocr {

enum class QualityLevel {
    Fast,
    Accurate
};

struct OcrRequest {
    std::string path;
    std::vector<std::string> languages{"en-US"};
    QualityLevel quality = QualityLevel::Accurate;
    bool use_language_correction = true;
};

// Blocking, CPU-bound, and not assumed thread-safe. Returns detected lines in
// reading order (empty when nothing was found) and throws on engine failure.
struct TextRecognizer {
    virtual ~TextRecognizer() = default;
    virtual std::vector<std::string> recognize(const OcrRequest& request) = 0;
};

using TextRecognizerPtr = std::unique_ptr<TextRecognizer>;

QualityLevel parse_quality_level(const std::string& name);
std::string quality_level_to_string(QualityLevel level);

} // namespace localocr::ocr
