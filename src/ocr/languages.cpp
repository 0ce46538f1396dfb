#include "../../include/localocr/ocr/languages.hpp"
#include "../../include/localocr/log.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace localocr::ocr {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

const std::unordered_map<std::string, std::string>& script_table() {
    static const std::unordered_map<std::string, std::string> table = {
        {"zh-hans", "chi_sim"}, {"zh-cn", "chi_sim"}, {"zh-sg", "chi_sim"},
        {"zh-hant", "chi_tra"}, {"zh-tw", "chi_tra"}, {"zh-hk", "chi_tra"}, {"zh-mo", "chi_tra"},
    };
    return table;
}

const std::unordered_map<std::string, std::string>& language_table() {
    static const std::unordered_map<std::string, std::string> table = {
        {"en", "eng"}, {"fr", "fra"}, {"de", "deu"}, {"es", "spa"}, {"it", "ita"},
        {"pt", "por"}, {"nl", "nld"}, {"ru", "rus"}, {"uk", "ukr"}, {"ja", "jpn"},
        {"ko", "kor"}, {"zh", "chi_sim"}, {"ar", "ara"}, {"he", "heb"}, {"hi", "hin"},
        {"th", "tha"}, {"vi", "vie"}, {"tr", "tur"}, {"pl", "pol"}, {"sv", "swe"},
        {"da", "dan"}, {"no", "nor"}, {"nb", "nor"}, {"fi", "fin"}, {"cs", "ces"},
        {"el", "ell"}, {"id", "ind"}, {"ro", "ron"}, {"hu", "hun"}, {"bg", "bul"},
    };
    return table;
}

bool looks_like_tesseract_code(const std::string& tag) {
    if (tag.size() < 3) {
        return false;
    }
    return std::all_of(tag.begin(), tag.end(), [](unsigned char c) {
        return std::islower(c) != 0 || c == '_';
    });
}

std::string map_tag(const std::string& raw) {
    std::string tag = to_lower(raw);
    std::replace(tag.begin(), tag.end(), '_', '-');

    const auto& scripts = script_table();
    for (const auto& [prefix, code] : scripts) {
        if (tag == prefix || tag.rfind(prefix + "-", 0) == 0) {
            return code;
        }
    }
    const std::string primary = tag.substr(0, tag.find('-'));
    const auto& languages = language_table();
    if (auto it = languages.find(primary); it != languages.end()) {
        return it->second;
    }
    const std::string lowered = to_lower(raw);
    if (looks_like_tesseract_code(lowered)) {
        return lowered;
    }
    return {};
}

} // namespace

std::string tesseract_languages(const std::vector<std::string>& tags) {
    std::vector<std::string> codes;
    for (const auto& tag : tags) {
        std::string code = map_tag(tag);
        if (code.empty()) {
            log_warning("OCR", "ignoring unsupported language tag: " + tag);
            continue;
        }
        if (std::find(codes.begin(), codes.end(), code) == codes.end()) {
            codes.push_back(std::move(code));
        }
    }
    if (codes.empty()) {
        return "eng";
    }
    std::string joined;
    for (const auto& code : codes) {
        if (!joined.empty()) {
            joined += '+';
        }
        joined += code;
    }
    return joined;
}

} // namespace localocr::ocr
