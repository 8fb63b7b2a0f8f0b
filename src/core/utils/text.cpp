#include <canary/core/utils/text.hpp>
#include <cstdint>

namespace Canary {

bool isValidUtf8(std::string_view bytes) {
    size_t i = 0;
    const size_t len = bytes.size();

    while (i < len) {
        const auto lead = static_cast<uint8_t>(bytes[i]);

        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t codePoint = 0;
        uint32_t minValue = 0;

        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = lead & 0x1F;
            minValue = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = lead & 0x0F;
            minValue = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = lead & 0x07;
            minValue = 0x10000;
        } else {
            return false;  // stray continuation byte or invalid lead
        }

        if (len - i <= extra) {
            return false;  // truncated sequence
        }

        for (size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<uint8_t>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (cont & 0x3F);
        }

        if (codePoint < minValue) return false;                         // overlong
        if (codePoint >= 0xD800 && codePoint <= 0xDFFF) return false;   // surrogate
        if (codePoint > 0x10FFFF) return false;

        i += extra + 1;
    }

    return true;
}

std::string escapeHtml(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;";  break;
            default:   out += c;        break;
        }
    }
    return out;
}

bool constantTimeEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    volatile uint8_t diff = 0;
    for (size_t i = 0; i < lhs.size(); ++i) {
        diff = diff | (static_cast<uint8_t>(lhs[i]) ^ static_cast<uint8_t>(rhs[i]));
    }
    return diff == 0;
}

} // namespace Canary
