#include "../../include/localocr/ocr/engine.hpp"

#include <algorithm>
#include <cctype>

namespace localocr::ocr {

QualityLevel parse_quality_level(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "fast") {
        return QualityLevel::Fast;
    }
    // Anything unrecognized is treated as the default.
    return QualityLevel::Accurate;
}

std::string quality_level_to_string(QualityLevel level) {
    return level == QualityLevel::Fast ? "fast" : "accurate";
}

} // namespace localocr::ocr
