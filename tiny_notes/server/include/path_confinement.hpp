#pragma once

#include <filesystem>
#include <string_view>

namespace tinynotes::server {

// True when |candidate| is |root| or lies below it once both are resolved with
// weakly_canonical. Containment is decided per path component, so a sibling such
// as "/data/alice2" is never inside "/data/alice".
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

// Joins an untrusted relative path onto the canonical form of |root|. The result
// is lexical below the root: a symlinked final entry is returned as the link
// itself, but only after its target has been checked against |root|.
// Throws StoreError(kInvalidPath) for empty input, NUL bytes, absolute paths, ".."
// components, dangling symbolic links, or a result that escapes |root|.
std::filesystem::path confine(const std::filesystem::path& root, std::string_view relative);

// A name usable as exactly one directory entry: non-empty, no separators or NUL,
// and not "." or "..".
bool is_single_component(std::string_view name);

}  // namespace tinynotes::server
