#include "../include/localocr/json.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace localocr {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53

// Bounds recursion so a hostile frame cannot exhaust the stack.
constexpr std::size_t kMaxNestingDepth = 256;

unsigned parse_hex4(std::string_view text, std::size_t& pos) {
    if (pos + 4 > text.size()) {
        throw std::runtime_error("invalid unicode escape");
    }
    unsigned code = 0;
    for (int i = 0; i < 4; ++i) {
        const char h = text[pos++];
        code <<= 4;
        if (h >= '0' && h <= '9') {
            code |= static_cast<unsigned>(h - '0');
        } else if (h >= 'a' && h <= 'f') {
            code |= static_cast<unsigned>(h - 'a' + 10);
        } else if (h >= 'A' && h <= 'F') {
            code |= static_cast<unsigned>(h - 'A' + 10);
        } else {
            throw std::runtime_error("invalid unicode escape");
        }
    }
    return code;
}

void append_utf8(std::string& out, std::uint32_t code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

} // namespace

void Json::dump_string(std::ostringstream& oss, const std::string& value) {
    oss << '"';
    for (char c : value) {
        switch (c) {
        case '"': oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        case '\b': oss << "\\b"; break;
        case '\f': oss << "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec
                    << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

void Json::dump_internal(std::ostringstream& oss) const {
    std::visit([
                   &oss](const auto& value) {
                       using T = std::decay_t<decltype(value)>;
                       if constexpr (std::is_same_v<T, std::nullptr_t>) {
                           oss << "null";
                       } else if constexpr (std::is_same_v<T, bool>) {
                           oss << (value ? "true" : "false");
                       } else if constexpr (std::is_same_v<T, double>) {
                           if (!std::isfinite(value)) {
                               oss << "null";
                           } else if (std::trunc(value) == value && std::fabs(value) <= kMaxExactInteger) {
                               // Request ids and counts must round-trip as integers.
                               oss << static_cast<std::int64_t>(value);
                           } else {
                               oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value
                                   << std::setprecision(6);
                           }
                       } else if constexpr (std::is_same_v<T, std::string>) {
                           dump_string(oss, value);
                       } else if constexpr (std::is_same_v<T, JsonArray>) {
                           oss << '[';
                           bool first = true;
                           for (const auto& item : value) {
                               if (!first) {
                                   oss << ',';
                               }
                               first = false;
                               item.dump_internal(oss);
                           }
                           oss << ']';
                       } else if constexpr (std::is_same_v<T, JsonObject>) {
                           oss << '{';
                           bool first = true;
                           for (const auto& [key, val] : value) {
                               if (!first) {
                                   oss << ',';
                               }
                               first = false;
                               dump_string(oss, key);
                               oss << ':';
                               val.dump_internal(oss);
                           }
                           oss << '}';
                       }
                   },
               m_value);
}

void Json::skip_ws(std::string_view text, std::size_t& pos) {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r')) {
        ++pos;
    }
}

Json Json::parse(std::string_view text) {
    std::size_t pos = 0;
    skip_ws(text, pos);
    Json value = parse_value(text, pos, 0);
    skip_ws(text, pos);
    if (pos != text.size()) {
        throw std::runtime_error("unexpected trailing characters in JSON");
    }
    return value;
}

Json Json::parse_value(std::string_view text, std::size_t& pos, std::size_t depth) {
    skip_ws(text, pos);
    if (pos >= text.size()) {
        throw std::runtime_error("unexpected end of JSON");
    }
    const char c = text[pos];
    if (c == '"') {
        return parse_string(text, pos);
    }
    if (c == '[') {
        return parse_array(text, pos, depth + 1);
    }
    if (c == '{') {
        return parse_object(text, pos, depth + 1);
    }
    if ((c >= '0' && c <= '9') || c == '-') {
        return parse_number(text, pos);
    }
    if (text.substr(pos, 4) == "true") {
        pos += 4;
        return Json(true);
    }
    if (text.substr(pos, 5) == "false") {
        pos += 5;
        return Json(false);
    }
    if (text.substr(pos, 4) == "null") {
        pos += 4;
        return Json(nullptr);
    }
    throw std::runtime_error("invalid JSON token");
}

Json Json::parse_number(std::string_view text, std::size_t& pos) {
    const std::size_t start = pos;
    ++pos;
    while (pos < text.size() && ((text[pos] >= '0' && text[pos] <= '9') || text[pos] == '.' || text[pos] == 'e' ||
                                 text[pos] == 'E' || text[pos] == '+' || text[pos] == '-')) {
        ++pos;
    }
    const std::string token(text.substr(start, pos - start));
    std::size_t consumed = 0;
    double number = 0.0;
    try {
        number = std::stod(token, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid JSON number: " + token);
    }
    if (consumed != token.size()) {
        throw std::runtime_error("invalid JSON number: " + token);
    }
    return Json(number);
}

Json Json::parse_string(std::string_view text, std::size_t& pos) {
    if (pos >= text.size() || text[pos] != '"') {
        throw std::runtime_error("expected string");
    }
    ++pos;
    std::string result;
    bool terminated = false;
    while (pos < text.size()) {
        char c = text[pos++];
        if (c == '"') {
            terminated = true;
            break;
        }
        if (c == '\\') {
            if (pos >= text.size()) {
                throw std::runtime_error("invalid escape");
            }
            char esc = text[pos++];
            switch (esc) {
            case '"': result.push_back('"'); break;
            case '\\': result.push_back('\\'); break;
            case '/': result.push_back('/'); break;
            case 'b': result.push_back('\b'); break;
            case 'f': result.push_back('\f'); break;
            case 'n': result.push_back('\n'); break;
            case 'r': result.push_back('\r'); break;
            case 't': result.push_back('\t'); break;
            case 'u': {
                std::uint32_t code = parse_hex4(text, pos);
                if (code >= 0xD800 && code <= 0xDBFF) {
                    if (pos + 2 > text.size() || text[pos] != '\\' || text[pos + 1] != 'u') {
                        throw std::runtime_error("unpaired surrogate in unicode escape");
                    }
                    pos += 2;
                    const std::uint32_t low = parse_hex4(text, pos);
                    if (low < 0xDC00 || low > 0xDFFF) {
                        throw std::runtime_error("invalid low surrogate in unicode escape");
                    }
                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                } else if (code >= 0xDC00 && code <= 0xDFFF) {
                    throw std::runtime_error("unpaired surrogate in unicode escape");
                }
                append_utf8(result, code);
                break;
            }
            default:
                throw std::runtime_error("invalid escape");
            }
        } else {
            result.push_back(c);
        }
    }
    if (!terminated) {
        throw std::runtime_error("unterminated string");
    }
    return Json(result);
}

Json Json::parse_array(std::string_view text, std::size_t& pos, std::size_t depth) {
    if (text[pos] != '[') {
        throw std::runtime_error("expected array");
    }
    if (depth > kMaxNestingDepth) {
        throw std::runtime_error("JSON nesting too deep");
    }
    ++pos;
    JsonArray arr;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == ']') {
        ++pos;
        return Json(arr);
    }
    while (pos < text.size()) {
        arr.emplace_back(parse_value(text, pos, depth));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == ']') {
            ++pos;
            return Json(arr);
        }
        throw std::runtime_error("expected comma or closing bracket");
    }
    throw std::runtime_error("unterminated array");
}

Json Json::parse_object(std::string_view text, std::size_t& pos, std::size_t depth) {
    if (text[pos] != '{') {
        throw std::runtime_error("expected object");
    }
    if (depth > kMaxNestingDepth) {
        throw std::runtime_error("JSON nesting too deep");
    }
    ++pos;
    JsonObject obj;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == '}') {
        ++pos;
        return Json(obj);
    }
    while (pos < text.size()) {
        skip_ws(text, pos);
        Json key = parse_string(text, pos);
        skip_ws(text, pos);
        if (pos >= text.size() || text[pos] != ':') {
            throw std::runtime_error("expected colon");
        }
        ++pos;
        obj.insert_or_assign(key.as_string(), parse_value(text, pos, depth));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == '}') {
            ++pos;
            return Json(obj);
        }
        throw std::runtime_error("expected comma or closing brace");
    }
    throw std::runtime_error("unterminated object");
}

} // namespace localocr
