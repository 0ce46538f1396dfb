#pragma once

#include "engine.hpp"

#include <string>
#include <vector>

namespace localocr::ocr {

class TesseractRecognizer final : public TextRecognizer {
public:
    // An empty data path lets Tesseract fall back to TESSDATA_PREFIX.
    explicit TesseractRecognizer(std::string tessdata_dir = std::string());

    std::vector<std::string> recognize(const OcrRequest& request) override;

private:
    std::string m_tessdata_dir;
};

} // namespace localocr::ocr
