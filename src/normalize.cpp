#include "normalize.hpp"

namespace stock_sync {

namespace {

/// Decode one UTF-8 sequence starting at @p i.
/// On success stores the code point, advances @p i and returns true.
/// On an ill-formed sequence skips one byte and returns false.
bool decodeUtf8(const std::string& s, std::size_t& i, char32_t& out) {
    const auto b0 = static_cast<unsigned char>(s[i]);

    int      length;
    char32_t cp;
    char32_t minValue;
    if (b0 < 0x80) {
        out = b0;
        ++i;
        return true;
    } else if ((b0 & 0xE0) == 0xC0) {
        length = 2; cp = b0 & 0x1F; minValue = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        length = 3; cp = b0 & 0x0F; minValue = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        length = 4; cp = b0 & 0x07; minValue = 0x10000;
    } else {
        ++i;
        return false;
    }

    if (i + length > s.size()) {
        ++i;
        return false;
    }
    for (int k = 1; k < length; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) {
            ++i;
            return false;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range values are ill-formed.
    if (cp < minValue || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++i;
        return false;
    }

    out = cp;
    i += length;
    return true;
}

} // namespace

bool isPrintableCodePoint(char32_t cp) {
    // C0 controls, DEL, C1 controls.
    if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F)) return false;

    switch (cp) {
        case 0x00A0:  // no-break space
        case 0x00AD:  // soft hyphen
        case 0x061C:  // arabic letter mark
        case 0x1680:
        case 0x180E:
        case 0x2028:  // line separator
        case 0x2029:  // paragraph separator
        case 0x202F:
        case 0x205F:
        case 0x3000:
        case 0xFEFF:  // byte order mark
            return false;
        default:
            break;
    }

    if (cp >= 0x2000 && cp <= 0x200F) return false;  // spaces, ZW*, LRM/RLM
    if (cp >= 0x202A && cp <= 0x202E) return false;  // bidi embedding
    if (cp >= 0x2060 && cp <= 0x206F) return false;  // word joiner, invisible ops
    if (cp >= 0xFFF9 && cp <= 0xFFFB) return false;  // interlinear annotation
    if (cp >= 0xE000 && cp <= 0xF8FF) return false;  // private use
    if (cp >= 0xFFF0 && cp <= 0xFFF8) return false;  // unassigned specials
    if ((cp & 0xFFFE) == 0xFFFE)      return false;  // noncharacters
    if (cp >= 0xFDD0 && cp <= 0xFDEF) return false;  // noncharacters

    // Prepended concatenation marks and other format controls.
    if (cp >= 0x0600 && cp <= 0x0605) return false;
    if (cp >= 0x0890 && cp <= 0x0891) return false;
    if (cp >= 0x13430 && cp <= 0x1343F) return false;  // egyptian format controls
    if (cp >= 0x1BCA0 && cp <= 0x1BCA3) return false;  // shorthand format controls
    if (cp >= 0x1D173 && cp <= 0x1D17A) return false;  // musical format controls
    switch (cp) {
        case 0x06DD:
        case 0x070F:
        case 0x08E2:
        case 0x110BD:
        case 0x110CD:
            return false;
        default:
            break;
    }

    // Unassigned gaps in the Greek block.
    if (cp == 0x0378 || cp == 0x0379 || (cp >= 0x0380 && cp <= 0x0383) ||
        cp == 0x038B || cp == 0x038D || cp == 0x03A2) {
        return false;
    }

    if (cp >= 0x40000 && cp <= 0xDFFFF) return false;  // unassigned planes 4-13
    if (cp >= 0xE0000 && cp <= 0xE00FF) return false;  // tags
    if (cp >= 0xE01F0 && cp <= 0xEFFFF) return false;  // unassigned
    if (cp >= 0xF0000)                 return false;  // supplementary private use

    return true;
}

std::string normalizeSku(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    std::size_t i = 0;
    while (i < raw.size()) {
        const std::size_t start = i;
        char32_t cp = 0;
        if (!decodeUtf8(raw, i, cp)) {
            continue;
        }
        if (isPrintableCodePoint(cp)) {
            out.append(raw, start, i - start);
        }
    }
    return out;
}

std::string normalizeSkuValue(const nlohmann::json& raw) {
    if (!raw.is_string()) {
        return "";
    }
    return normalizeSku(raw.get_ref<const std::string&>());
}

} // namespace stock_sync
