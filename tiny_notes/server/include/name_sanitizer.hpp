#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tinynotes::server {

class NameSanitizer {
public:
    static constexpr std::size_t kMaxNameUnits = 200;
    static constexpr std::string_view kFallbackName = "untitled";
    static constexpr std::string_view kNoteExtension = ".md";

    // Coerces an untrusted UTF-8 string into a non-empty base name that holds no
    // separators, dots or whitespace. Never throws.
    static std::string sanitize(std::string_view raw);

    static std::string ensure_md_extension(std::string name);
    static bool has_md_extension(std::string_view name);
    static std::string strip_md_extension(std::string_view name);
};

}  // namespace tinynotes::server
