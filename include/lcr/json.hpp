#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {

// Appends `s` as a JSON string literal (with surrounding quotes).
// Escapes quotes, backslashes and control characters.
inline void append_quoted(std::string& out, std::string_view s) {
    static constexpr char HEX[] = "0123456789abcdef";
    out.reserve(out.size() + s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(HEX[(c >> 4) & 0x0F]);
                    out.push_back(HEX[c & 0x0F]);
                }
                else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

} // namespace json
} // namespace lcr
