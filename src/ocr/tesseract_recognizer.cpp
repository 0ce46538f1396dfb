#include "../../include/localocr/ocr/tesseract_recognizer.hpp"
#include "../../include/localocr/ocr/languages.hpp"
#include "../../include/localocr/log.hpp"

#include <leptonica/allheaders.h>
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace localocr::ocr {

namespace {

struct PixDeleter {
    void operator()(Pix* pix) const {
        pixDestroy(&pix);
    }
};

using PixPtr = std::unique_ptr<Pix, PixDeleter>;

struct ApiDeleter {
    void operator()(tesseract::TessBaseAPI* api) const {
        api->End();
        delete api;
    }
};

using ApiPtr = std::unique_ptr<tesseract::TessBaseAPI, ApiDeleter>;

// Used only when the file carries no resolution of its own.
constexpr int kAssumedDpi = 300;
constexpr l_int32 kUpscaleBelowWidth = 1500;

std::string strip_line_terminator(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace

TesseractRecognizer::TesseractRecognizer(std::string tessdata_dir)
    : m_tessdata_dir(std::move(tessdata_dir)) {}

std::vector<std::string> TesseractRecognizer::recognize(const OcrRequest& request) {
    const std::string languages = tesseract_languages(request.languages);

    // Dictionary correction is an init-only setting in Tesseract.
    std::vector<std::string> names;
    std::vector<std::string> values;
    if (!request.use_language_correction) {
        names = {"load_system_dawg", "load_freq_dawg"};
        values = {"0", "0"};
    }

    ApiPtr api(new tesseract::TessBaseAPI());
    const char* datapath = m_tessdata_dir.empty() ? nullptr : m_tessdata_dir.c_str();
    if (api->Init(datapath, languages.c_str(), tesseract::OEM_LSTM_ONLY, nullptr, 0, &names, &values, false) != 0) {
        throw std::runtime_error("could not initialize tesseract with languages '" + languages + "'");
    }

    // Fast: one pass over the image as given, no second pass for inverted text.
    // Accurate: keeps the inverted-text pass and upscales small images (most
    // screenshots) so glyphs reach the x-height the LSTM models expect.
    api->SetPageSegMode(tesseract::PSM_AUTO);
    if (request.quality == QualityLevel::Fast) {
        api->SetVariable("tessedit_do_invert", "0");
    }

    PixPtr image(pixRead(request.path.c_str()));
    if (!image) {
        throw std::runtime_error("unable to read image: " + request.path);
    }
    if (request.quality == QualityLevel::Accurate && pixGetWidth(image.get()) < kUpscaleBelowWidth) {
        // pixScale carries the stored resolution along, scaled by the same factor.
        PixPtr scaled(pixScale(image.get(), 2.0f, 2.0f));
        if (scaled) {
            image = std::move(scaled);
        }
    }
    api->SetImage(image.get());
    if (pixGetXRes(image.get()) <= 0) {
        api->SetSourceResolution(kAssumedDpi);
    }

    if (api->Recognize(nullptr) != 0) {
        throw std::runtime_error("tesseract recognition failed");
    }

    std::vector<std::string> lines;
    std::unique_ptr<tesseract::ResultIterator> iter(api->GetIterator());
    if (!iter) {
        return lines;
    }
    const tesseract::PageIteratorLevel level = tesseract::RIL_TEXTLINE;
    do {
        std::unique_ptr<char[]> text(iter->GetUTF8Text(level));
        if (!text) {
            continue;
        }
        std::string line = strip_line_terminator(text.get());
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    } while (iter->Next(level));

    log_debug("OCR", "tesseract (" + languages + ", " + quality_level_to_string(request.quality) + ") found " +
                         std::to_string(lines.size()) + " lines");
    return lines;
}

} // namespace localocr::ocr
