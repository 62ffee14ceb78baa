#include "tether/assuan.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace tether {
namespace assuan {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Strict UTF-8 check: rejects overlong forms, surrogates and code points
/// above U+10FFFF.
bool is_valid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<uint8_t>(s[i]);
        if (c < 0x80) { ++i; continue; }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0)      { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<uint8_t>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        i += len;
    }
    return true;
}

} // anonymous namespace

std::optional<std::string> decode_data(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());

    size_t i = 0;
    while (i < encoded.size()) {
        if (encoded[i] != '%') {
            decoded += encoded[i];
            ++i;
            continue;
        }
        ++i;
        if (i + 2 > encoded.size()) return std::nullopt;
        int hi = hex_value(encoded[i]);
        int lo = hex_value(encoded[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        decoded += static_cast<char>((hi << 4) | lo);
        i += 2;
    }

    if (!is_valid_utf8(decoded)) return std::nullopt;
    return decoded;
}

std::string encode_data(std::string_view raw) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        if (c == '%' || c < 0x20) {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

} // namespace assuan
} // namespace tether
