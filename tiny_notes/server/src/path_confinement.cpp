#include "path_confinement.hpp"

#include "store_error.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace tinynotes::server {

namespace {

// weakly_canonical stops at the first entry that does not resolve, so a dangling
// link would pass through lexically and a later open would follow it. Every link
// along the requested path must resolve, and resolve inside the root.
void check_links(const std::filesystem::path& canonical_root,
                 const std::filesystem::path& requested,
                 std::string_view relative) {
    auto current = canonical_root;
    for (const auto& part : requested) {
        if (part.empty() || part == ".") {
            continue;
        }
        current /= part;
        const auto link_status = std::filesystem::symlink_status(current);
        if (!std::filesystem::exists(link_status)) {
            return;
        }
        if (!std::filesystem::is_symlink(link_status)) {
            continue;
        }
        if (!std::filesystem::exists(std::filesystem::status(current))) {
            throw StoreError(StoreErrc::kInvalidPath, "dangling symbolic link rejected: " + std::string(relative));
        }
        if (!is_within(canonical_root, std::filesystem::canonical(current))) {
            throw StoreError(StoreErrc::kInvalidPath, "path escapes storage root: " + std::string(relative));
        }
    }
}

}  // namespace

bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    const auto canonical_root = std::filesystem::weakly_canonical(root);
    const auto canonical_candidate = std::filesystem::weakly_canonical(candidate);

    auto root_it = canonical_root.begin();
    auto candidate_it = canonical_candidate.begin();
    for (; root_it != canonical_root.end(); ++root_it, ++candidate_it) {
        // weakly_canonical keeps a trailing separator as an empty final element.
        if (root_it->empty() && std::next(root_it) == canonical_root.end()) {
            break;
        }
        if (candidate_it == canonical_candidate.end() || *root_it != *candidate_it) {
            return false;
        }
    }
    return true;
}

std::filesystem::path confine(const std::filesystem::path& root, std::string_view relative) {
    if (relative.empty()) {
        throw StoreError(StoreErrc::kInvalidPath, "path required");
    }
    if (relative.find('\0') != std::string_view::npos) {
        throw StoreError(StoreErrc::kInvalidPath, "path contains NUL byte");
    }
    const std::filesystem::path requested{std::string(relative)};
    if (requested.is_absolute() || requested.has_root_name() || requested.has_root_directory()) {
        throw StoreError(StoreErrc::kInvalidPath, "absolute path rejected: " + std::string(relative));
    }
    const bool has_parent_ref = std::any_of(requested.begin(), requested.end(),
                                            [](const std::filesystem::path& part) { return part == ".."; });
    if (has_parent_ref) {
        throw StoreError(StoreErrc::kInvalidPath, "parent directory reference rejected: " + std::string(relative));
    }

    const auto canonical_root = std::filesystem::weakly_canonical(root);
    check_links(canonical_root, requested, relative);
    auto target = (canonical_root / requested).lexically_normal();
    if (!is_within(canonical_root, target)) {
        throw StoreError(StoreErrc::kInvalidPath, "path escapes storage root: " + std::string(relative));
    }
    return target;
}

bool is_single_component(std::string_view name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

}  // namespace tinynotes::server
