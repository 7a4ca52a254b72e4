#include "../../include/utils/json_parser.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace tickler {

namespace {

bool hexToInt(char c, uint32_t& value) {
    if (c >= '0' && c <= '9') {
        value = static_cast<uint32_t>(c - '0');
        return true;
    }
    if (c >= 'a' && c <= 'f') {
        value = static_cast<uint32_t>(10 + (c - 'a'));
        return true;
    }
    if (c >= 'A' && c <= 'F') {
        value = static_cast<uint32_t>(10 + (c - 'A'));
        return true;
    }
    return false;
}

bool parseHex4(const std::string& input, size_t start, uint32_t& codepoint) {
    if (start + 4 > input.size()) {
        return false;
    }
    codepoint = 0;
    for (size_t i = 0; i < 4; i++) {
        uint32_t nibble = 0;
        if (!hexToInt(input[start + i], nibble)) {
            return false;
        }
        codepoint = (codepoint << 4) | nibble;
    }
    return true;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
        out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0xFFFF) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += '?';
    }
}

void appendEscapedChar(const std::string& input, size_t& pos, std::string& out) {
    if (pos + 1 >= input.size()) {
        out += '\\';
        pos++;
        return;
    }

    const char esc = input[pos + 1];
    switch (esc) {
        case '"': out += '"'; pos += 2; return;
        case '\\': out += '\\'; pos += 2; return;
        case '/': out += '/'; pos += 2; return;
        case 'n': out += '\n'; pos += 2; return;
        case 'r': out += '\r'; pos += 2; return;
        case 't': out += '\t'; pos += 2; return;
        case 'b': out += '\b'; pos += 2; return;
        case 'f': out += '\f'; pos += 2; return;
        case 'u': {
            uint32_t codepoint = 0;
            if (!parseHex4(input, pos + 2, codepoint)) {
                out += 'u';
                pos += 2;
                return;
            }
            pos += 6;
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                if (pos + 1 < input.size() && input[pos] == '\\' && input[pos + 1] == 'u') {
                    uint32_t low = 0;
                    if (parseHex4(input, pos + 2, low) && low >= 0xDC00 && low <= 0xDFFF) {
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
            }
            appendUtf8(out, codepoint);
            return;
        }
        default:
            out += esc;
            pos += 2;
            return;
    }
}

// Cursor helpers for the strict readers.

void skipWhitespace(const std::string& input, size_t& pos) {
    while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) {
        pos++;
    }
}

bool readString(const std::string& input, size_t& pos, std::string& out) {
    if (pos >= input.size() || input[pos] != '"') return false;
    pos++;
    out.clear();
    while (pos < input.size() && input[pos] != '"') {
        if (input[pos] == '\\') {
            if (pos + 1 >= input.size()) return false;
            appendEscapedChar(input, pos, out);
            continue;
        }
        out += input[pos];
        pos++;
    }
    if (pos >= input.size()) return false;
    pos++; // closing quote
    return true;
}

bool isScalarChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.';
}

bool readFlatObject(const std::string& input, size_t& pos, JsonParser::Object& out) {
    skipWhitespace(input, pos);
    if (pos >= input.size() || input[pos] != '{') return false;
    pos++;
    out.clear();

    skipWhitespace(input, pos);
    if (pos < input.size() && input[pos] == '}') {
        pos++;
        return true;
    }

    while (true) {
        skipWhitespace(input, pos);
        std::string key;
        if (!readString(input, pos, key)) return false;

        skipWhitespace(input, pos);
        if (pos >= input.size() || input[pos] != ':') return false;
        pos++;
        skipWhitespace(input, pos);
        if (pos >= input.size()) return false;

        std::string value;
        if (input[pos] == '"') {
            if (!readString(input, pos, value)) return false;
        } else {
            while (pos < input.size() && isScalarChar(input[pos])) {
                value += input[pos];
                pos++;
            }
            if (value.empty()) return false;
        }
        out[key] = value;

        skipWhitespace(input, pos);
        if (pos >= input.size()) return false;
        if (input[pos] == ',') {
            pos++;
            continue;
        }
        if (input[pos] == '}') {
            pos++;
            return true;
        }
        return false;
    }
}

} // namespace

bool JsonParser::parseObject(const std::string& json, Object& out) {
    size_t pos = 0;
    if (!readFlatObject(json, pos, out)) return false;
    skipWhitespace(json, pos);
    return pos == json.size();
}

bool JsonParser::parseObjectArray(const std::string& json, std::vector<Object>& out) {
    out.clear();
    size_t pos = 0;
    skipWhitespace(json, pos);
    if (pos >= json.size() || json[pos] != '[') return false;
    pos++;

    skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == ']') {
        pos++;
    } else {
        while (true) {
            Object item;
            if (!readFlatObject(json, pos, item)) return false;
            out.push_back(std::move(item));

            skipWhitespace(json, pos);
            if (pos >= json.size()) return false;
            if (json[pos] == ',') {
                pos++;
                continue;
            }
            if (json[pos] == ']') {
                pos++;
                break;
            }
            return false;
        }
    }

    skipWhitespace(json, pos);
    return pos == json.size();
}

std::string JsonParser::stringify(const Object& data) {
    std::ostringstream oss;
    oss << "{";
    
    bool first = true;
    for (const auto& pair : data) {
        if (!first) oss << ",";
        first = false;
        oss << "\"" << escapeJson(pair.first) << "\":\"" << escapeJson(pair.second) << "\"";
    }
    
    oss << "}";
    return oss.str();
}

std::string JsonParser::stringifyArray(const std::vector<Object>& items) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) oss << ",\n";
        oss << stringify(items[i]);
    }
    oss << "]";
    return oss.str();
}

std::string JsonParser::createResponse(bool success, const std::string& message, const Object& data) {
    std::ostringstream oss;
    oss << "{\"success\":" << (success ? "true" : "false") 
        << ",\"message\":\"" << escapeJson(message) << "\"";
    
    if (!data.empty()) {
        oss << ",\"data\":" << stringify(data);
    }
    
    oss << "}";
    return oss.str();
}

std::string JsonParser::createErrorResponse(const std::string& message) {
    return createResponse(false, message);
}

std::string JsonParser::createSuccessResponse(const std::string& message, const Object& data) {
    return createResponse(true, message, data);
}

std::string JsonParser::escapeJson(const std::string& str) {
    std::string result;
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += hex.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

std::string JsonParser::unescapeJson(const std::string& str) {
    std::string result;
    for (size_t i = 0; i < str.length();) {
        if (str[i] == '\\') {
            appendEscapedChar(str, i, result);
            continue;
        }
        result += str[i];
        i++;
    }
    return result;
}

} // namespace tickler
