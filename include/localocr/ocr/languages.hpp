#pragma once

#include <string>
#include <vector>

namespace localocr::ocr {

// BCP-47 tags ("en-US", "zh-Hans") to a Tesseract language string
// ("eng+chi_sim"). Three-letter Tesseract codes pass through unchanged,
// duplicates are dropped, and an empty result falls back to "eng".
std::string tesseract_languages(const std::vector<std::string>& tags);

} // namespace localocr::ocr
