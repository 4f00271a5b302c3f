#pragma once
#include <cctype>
#include <climits>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>
#include "Logger.hpp"

// Minimal JSON helpers for the monitor's small flat request bodies
// ({"action":"start","module":"AnalogIn1"}, {"panel":2}). Not a JSON parser.
namespace JSON {

inline bool extract_json_string(const std::string& body, const char* key, std::string& out) {
    const std::string quotedKey = std::string("\"") + key + "\"";
    auto p = body.find(quotedKey);
    if (p == std::string::npos) return false;
    p = body.find(':', p + quotedKey.size());
    if (p == std::string::npos) return false;
    p = body.find('"', p);
    if (p == std::string::npos) return false;
    auto q = body.find('"', p + 1);
    if (q == std::string::npos) return false;
    out = body.substr(p + 1, q - (p + 1));
    return true;
}

inline bool extract_json_int(const std::string& body, const char* key, int& out) {
    const std::string quotedKey = std::string("\"") + key + "\"";
    auto p = body.find(quotedKey);
    if (p == std::string::npos) return false;
    p = body.find(':', p + quotedKey.size());
    if (p == std::string::npos) return false;
    ++p;
    while (p < body.size() && (body[p] == ' ')) ++p;

    bool neg = false;
    if (p < body.size() && body[p] == '-') { neg = true; ++p; }
    long long val = 0;
    bool any = false;
    while (p < body.size() && std::isdigit((unsigned char)body[p])) {
        val = val * 10 + (body[p] - '0');
        if (val > INT_MAX) return false; // out of range, stop before val can overflow
        any = true;
        ++p;
    }
    if (!any) return false;
    out = static_cast<int>(neg ? -val : val);
    return true;
}

inline void json_extract_fail(const char* context, const char* field) {
    LOG_WARN("[JSON] extract failed | context=" << context << " field=" << field);
}

// quoted + escaped JSON string literal
inline std::string quote(const std::string& s) {
    std::ostringstream oss;
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    oss << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

inline std::string string_array(const std::vector<std::string>& items) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < items.size(); i++) {
        if (i) oss << ",";
        oss << quote(items[i]);
    }
    oss << "]";
    return oss.str();
}

inline std::string byte_array(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < bytes.size(); i++) {
        if (i) oss << ",";
        oss << static_cast<int>(bytes[i]);
    }
    oss << "]";
    return oss.str();
}

} // namespace JSON
