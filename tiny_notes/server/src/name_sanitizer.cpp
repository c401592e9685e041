#include "name_sanitizer.hpp"

#include <cctype>
#include <vector>

namespace tinynotes::server {

namespace {

constexpr char32_t kInvalid = 0xFFFFFFFF;

// Decodes one code point starting at |pos| and advances |pos| past it. Malformed
// sequences, overlongs and surrogates decode to kInvalid and consume one byte.
char32_t decode_utf8(std::string_view text, std::size_t& pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        ++pos;
        return lead;
    }
    std::size_t length = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        ++pos;
        return kInvalid;
    }
    if (pos + length > text.size()) {
        ++pos;
        return kInvalid;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return kInvalid;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    static constexpr char32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[length] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++pos;
        return kInvalid;
    }
    pos += length;
    return cp;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool is_space(char32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0xA0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000 || cp == 0xFEFF;
}

bool is_separator(char32_t cp) {
    return cp == U'/' || cp == U'\\';
}

// ASCII word characters, hyphen, and everything from U+00A0 up so non-Latin
// scripts survive intact.
bool is_kept(char32_t cp) {
    if (cp < 0x80) {
        return std::isalnum(static_cast<int>(cp)) != 0 || cp == U'_' || cp == U'-';
    }
    return cp >= 0xA0;
}

std::size_t utf16_units(char32_t cp) {
    return cp > 0xFFFF ? 2 : 1;
}

}  // namespace

std::string NameSanitizer::sanitize(std::string_view raw) {
    std::vector<char32_t> points;
    points.reserve(raw.size());
    for (std::size_t pos = 0; pos < raw.size();) {
        const char32_t cp = decode_utf8(raw, pos);
        if (cp != kInvalid) {
            points.push_back(cp);
        }
    }

    std::size_t first = 0;
    std::size_t last = points.size();
    while (first < last && is_space(points[first])) {
        ++first;
    }
    while (last > first && is_space(points[last - 1])) {
        --last;
    }

    std::string out;
    std::size_t units = 0;
    bool last_was_hyphen = false;
    for (std::size_t i = first; i < last; ++i) {
        char32_t cp = points[i];
        if (is_separator(cp) || is_space(cp)) {
            cp = U'-';
        } else if (!is_kept(cp)) {
            continue;
        }
        if (cp == U'-') {
            if (last_was_hyphen) {
                continue;
            }
            last_was_hyphen = true;
        } else {
            last_was_hyphen = false;
        }
        if (units + utf16_units(cp) > kMaxNameUnits) {
            break;
        }
        units += utf16_units(cp);
        append_utf8(out, cp);
    }

    if (out.empty()) {
        return std::string(kFallbackName);
    }
    return out;
}

bool NameSanitizer::has_md_extension(std::string_view name) {
    if (name.size() < kNoteExtension.size()) {
        return false;
    }
    const auto tail = name.substr(name.size() - kNoteExtension.size());
    for (std::size_t i = 0; i < tail.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(tail[i])) != kNoteExtension[i]) {
            return false;
        }
    }
    return true;
}

std::string NameSanitizer::ensure_md_extension(std::string name) {
    if (has_md_extension(name)) {
        return name;
    }
    name.append(kNoteExtension);
    return name;
}

std::string NameSanitizer::strip_md_extension(std::string_view name) {
    if (!has_md_extension(name)) {
        return std::string(name);
    }
    return std::string(name.substr(0, name.size() - kNoteExtension.size()));
}

}  // namespace tinynotes::server
