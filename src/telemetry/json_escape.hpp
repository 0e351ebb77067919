/**
 * @file json_escape.hpp
 * @brief Minimal JSON string escaping for hand-built NDJSON lines.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdio>
#include <string>
#include <string_view>

namespace code_sandbox {

/**
 * @brief Escape text for embedding inside a JSON string literal.
 *
 * Control bytes become \\u00XX; bytes >= 0x80 pass through unchanged.
 */
inline std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (unsigned char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    return out;
}

/// Quote and escape in one step.
inline std::string json_quote(std::string_view text) {
    return '"' + json_escape(text) + '"';
}

}  // namespace code_sandbox
