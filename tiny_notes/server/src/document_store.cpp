#include "document_store.hpp"

#include "name_sanitizer.hpp"
#include "path_confinement.hpp"
#include "store_error.hpp"
#include "time_format.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace tinynotes::server {

namespace {

bool has_group(const std::optional<std::string>& group) {
    return group.has_value() && !group->empty();
}

// Counts dangling symlinks as occupied so a write can never follow one.
bool entry_exists(const std::filesystem::path& path) {
    return std::filesystem::exists(std::filesystem::symlink_status(path));
}

void require_component(const std::string& name, const char* what) {
    if (!is_single_component(name)) {
        throw StoreError(StoreErrc::kInvalidPath, std::string("invalid ") + what + ": " + name);
    }
}

void write_file(const std::filesystem::path& file, const std::string& content) {
    std::ofstream stream(file, std::ios::binary | std::ios::trunc);
    if (!stream) {
        throw StoreError(StoreErrc::kIoFailure, "Unable to open for writing: " + file.string());
    }
    stream.write(content.data(), static_cast<std::streamsize>(content.size()));
    stream.flush();
    if (!stream) {
        throw StoreError(StoreErrc::kIoFailure, "Short write: " + file.string());
    }
}

std::string read_file(const std::filesystem::path& file) {
    std::ifstream stream(file, std::ios::binary);
    if (!stream) {
        throw StoreError(StoreErrc::kIoFailure, "Unable to open for reading: " + file.string());
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

std::string timestamp_filename() {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    return "note-" + std::to_string(millis) + std::string(NameSanitizer::kNoteExtension);
}

}  // namespace

DocumentStore::DocumentStore(std::filesystem::path storage_root, Logger& logger)
    : root_(std::move(storage_root)), logger_(logger) {
    std::filesystem::create_directories(root_);
}

template <typename Fn>
auto DocumentStore::guarded(const char* operation, const std::string& user_id, Fn&& fn) {
    require_component(user_id, "user id");
    std::lock_guard<std::mutex> lock(user_mutex(user_id));
    try {
        return fn();
    } catch (const StoreError& ex) {
        if (ex.code() == StoreErrc::kIoFailure) {
            logger_.error(std::string(operation) + " for " + user_id + " failed: " + ex.what());
        }
        throw;
    } catch (const std::filesystem::filesystem_error& ex) {
        logger_.error(std::string(operation) + " for " + user_id + " failed: " + ex.what());
        throw StoreError(StoreErrc::kIoFailure, std::string(operation) + " failed: " + ex.what());
    }
}

std::mutex& DocumentStore::user_mutex(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = user_locks_[user_id];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::size_t DocumentStore::tracked_user_count() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return user_locks_.size();
}

std::filesystem::path DocumentStore::user_root(const std::string& user_id) const {
    require_component(user_id, "user id");
    auto path = root_ / user_id;
    std::filesystem::create_directories(path);
    return std::filesystem::weakly_canonical(path);
}

void DocumentStore::provision_user(const std::string& user_id) {
    guarded("provision_user", user_id, [&] {
        const auto root = user_root(user_id);
        GroupRegistry(root).ensure_exists();
        logger_.info("Provisioned storage for " + user_id + " at " + root.string());
    });
}

std::filesystem::path DocumentStore::group_dir(const std::filesystem::path& root, const std::string& group) const {
    require_component(group, "group name");
    return confine(root, group);
}

std::filesystem::path DocumentStore::document_file(const std::filesystem::path& root,
                                                   const std::string& logical_path) const {
    auto target = confine(root, logical_path);

    std::size_t components = 0;
    std::size_t start = 0;
    while (start <= logical_path.size()) {
        const auto end = std::min(logical_path.find('/', start), logical_path.size());
        require_component(logical_path.substr(start, end - start), "document path");
        ++components;
        start = end + 1;
    }
    if (components > 2) {
        throw StoreError(StoreErrc::kInvalidPath, "documents nest at most one group deep: " + logical_path);
    }
    if (!NameSanitizer::has_md_extension(logical_path)) {
        throw StoreError(StoreErrc::kInvalidPath, "document paths must end in .md: " + logical_path);
    }
    return target;
}

std::vector<DocumentEntry> DocumentStore::scan_directory(const std::filesystem::path& dir,
                                                         const std::optional<std::string>& group) const {
    std::vector<DocumentEntry> entries;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_symlink() || !entry.is_regular_file()) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (!NameSanitizer::has_md_extension(name)) {
            continue;
        }
        DocumentEntry item;
        item.path = group ? *group + "/" + name : name;
        item.name = std::move(name);
        item.group = group;
        item.modified = to_system_time(entry.last_write_time());
        entries.push_back(std::move(item));
    }
    std::sort(entries.begin(), entries.end(),
              [](const DocumentEntry& lhs, const DocumentEntry& rhs) { return lhs.name < rhs.name; });
    return entries;
}

std::filesystem::path DocumentStore::next_free_name(const std::filesystem::path& dir, const std::string& filename) {
    auto candidate = dir / filename;
    const auto base = NameSanitizer::strip_md_extension(filename);
    for (std::size_t i = 1; entry_exists(candidate); ++i) {
        candidate = dir / (base + "-" + std::to_string(i) + std::string(NameSanitizer::kNoteExtension));
    }
    return candidate;
}

std::string DocumentStore::logical_path_of(const std::filesystem::path& root, const std::filesystem::path& file) {
    return file.lexically_relative(root).generic_string();
}

GroupMap DocumentStore::list_groups(const std::string& user_id) {
    return guarded("list_groups", user_id, [&] {
        const GroupRegistry registry(user_root(user_id));
        registry.ensure_exists();
        return registry.load();
    });
}

std::string DocumentStore::create_group(const std::string& user_id, const std::string& name) {
    return guarded("create_group", user_id, [&] {
        const auto root = user_root(user_id);
        const auto canonical = NameSanitizer::sanitize(name);
        const auto dir = confine(root, canonical);

        const GroupRegistry registry(root);
        auto groups = registry.load();
        if (groups.count(canonical) != 0) {
            throw StoreError(StoreErrc::kAlreadyExists, "group already exists: " + canonical);
        }
        groups.emplace(canonical, GroupInfo{});
        registry.save(groups);
        std::filesystem::create_directories(dir);

        logger_.info("User " + user_id + " created group " + canonical);
        return canonical;
    });
}

std::string DocumentStore::rename_group(const std::string& user_id,
                                        const std::string& old_name,
                                        const std::string& new_name) {
    return guarded("rename_group", user_id, [&] {
        const auto root = user_root(user_id);
        const auto old_dir = group_dir(root, old_name);
        const auto canonical = NameSanitizer::sanitize(new_name);
        const auto new_dir = confine(root, canonical);

        const GroupRegistry registry(root);
        auto groups = registry.load();
        const auto it = groups.find(old_name);
        if (it == groups.end()) {
            throw StoreError(StoreErrc::kNotFound, "group not found: " + old_name);
        }
        if (groups.count(canonical) != 0) {
            throw StoreError(StoreErrc::kAlreadyExists, "group already exists: " + canonical);
        }

        // An unregistered directory under the new name belongs to nobody we know
        // of; refuse rather than merge into it.
        if (entry_exists(new_dir)) {
            throw StoreError(StoreErrc::kAlreadyExists, "directory already exists: " + canonical);
        }
        // Directory before registry, so a failed rename leaves the registry untouched.
        if (std::filesystem::is_directory(old_dir)) {
            std::filesystem::rename(old_dir, new_dir);
        } else {
            std::filesystem::create_directories(new_dir);
        }

        auto info = std::move(it->second);
        groups.erase(it);
        groups.emplace(canonical, std::move(info));
        registry.save(groups);

        logger_.info("User " + user_id + " renamed group " + old_name + " to " + canonical);
        return canonical;
    });
}

void DocumentStore::delete_group(const std::string& user_id, const std::string& name, bool delete_files) {
    guarded("delete_group", user_id, [&] {
        const auto root = user_root(user_id);
        const auto dir = group_dir(root, name);

        const GroupRegistry registry(root);
        auto groups = registry.load();
        if (groups.erase(name) == 0) {
            throw StoreError(StoreErrc::kNotFound, "group not found: " + name);
        }
        registry.save(groups);
        logger_.info("User " + user_id + " deleted group " + name + (delete_files ? " with its documents" : ""));

        if (!delete_files) {
            return;
        }
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            return;
        }
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            logger_.warn("Leaving " + dir.string() + " behind after deleting group " + name + ": " + ec.message());
        }
    });
}

std::vector<DocumentEntry> DocumentStore::list_documents(const std::string& user_id,
                                                         const std::optional<std::string>& group) {
    return guarded("list_documents", user_id, [&] {
        const auto root = user_root(user_id);
        if (has_group(group)) {
            const auto dir = group_dir(root, *group);
            if (!std::filesystem::is_directory(dir)) {
                return std::vector<DocumentEntry>{};
            }
            return scan_directory(dir, *group);
        }

        auto documents = scan_directory(root, std::nullopt);
        const auto groups = GroupRegistry(root).load();
        for (const auto& entry : groups) {
            const auto& name = entry.first;
            std::filesystem::path dir;
            try {
                dir = group_dir(root, name);
            } catch (const StoreError& ex) {
                logger_.warn("Skipping group entry for " + user_id + ": " + ex.what());
                continue;
            }
            if (!std::filesystem::is_directory(dir)) {
                continue;
            }
            auto grouped = scan_directory(dir, name);
            documents.insert(documents.end(), std::make_move_iterator(grouped.begin()),
                             std::make_move_iterator(grouped.end()));
        }
        return documents;
    });
}

DocumentContent DocumentStore::get_document(const std::string& user_id, const std::string& logical_path) {
    return guarded("get_document", user_id, [&] {
        const auto file = document_file(user_root(user_id), logical_path);
        if (!std::filesystem::is_regular_file(file)) {
            throw StoreError(StoreErrc::kNotFound, "document not found: " + logical_path);
        }
        return DocumentContent{logical_path, read_file(file)};
    });
}

std::chrono::system_clock::time_point DocumentStore::save_document(const std::string& user_id,
                                                                   const std::string& logical_path,
                                                                   const std::string& content) {
    return guarded("save_document", user_id, [&] {
        const auto file = document_file(user_root(user_id), logical_path);
        std::filesystem::create_directories(file.parent_path());
        write_file(file, content);
        logger_.debug("User " + user_id + " saved " + logical_path + " (" + std::to_string(content.size()) +
                      " bytes)");
        return std::chrono::system_clock::now();
    });
}

std::string DocumentStore::create_document(const std::string& user_id,
                                           const std::optional<std::string>& group,
                                           const std::optional<std::string>& title,
                                           const std::string& content) {
    return guarded("create_document", user_id, [&] {
        const auto root = user_root(user_id);
        const auto dir = has_group(group) ? group_dir(root, *group) : root;
        if (has_group(group) && GroupRegistry(root).load().count(*group) == 0) {
            logger_.warn("User " + user_id + " created a document in unregistered group " + *group);
        }
        std::filesystem::create_directories(dir);

        const auto filename = title && !title->empty()
                                  ? NameSanitizer::ensure_md_extension(NameSanitizer::sanitize(*title))
                                  : timestamp_filename();
        const auto file = next_free_name(dir, filename);
        write_file(file, content);

        const auto logical = logical_path_of(root, file);
        logger_.info("User " + user_id + " created document " + logical);
        return logical;
    });
}

void DocumentStore::delete_document(const std::string& user_id, const std::string& logical_path) {
    guarded("delete_document", user_id, [&] {
        const auto file = document_file(user_root(user_id), logical_path);
        if (!std::filesystem::is_regular_file(file)) {
            throw StoreError(StoreErrc::kNotFound, "document not found: " + logical_path);
        }
        std::filesystem::remove(file);
        logger_.info("User " + user_id + " deleted document " + logical_path);
    });
}

std::string DocumentStore::rename_document(const std::string& user_id,
                                           const std::string& old_logical_path,
                                           const std::string& new_title) {
    return guarded("rename_document", user_id, [&] {
        const auto root = user_root(user_id);
        const auto source = document_file(root, old_logical_path);
        if (!std::filesystem::is_regular_file(source)) {
            throw StoreError(StoreErrc::kNotFound, "document not found: " + old_logical_path);
        }

        const auto filename = NameSanitizer::ensure_md_extension(NameSanitizer::sanitize(new_title));
        const auto target = source.parent_path() / filename;
        if (!is_within(root, target)) {
            throw StoreError(StoreErrc::kInvalidPath, "invalid document name: " + new_title);
        }
        if (entry_exists(target)) {
            throw StoreError(StoreErrc::kAlreadyExists, "target filename already exists: " + filename);
        }
        std::filesystem::rename(source, target);

        const auto logical = logical_path_of(root, target);
        logger_.info("User " + user_id + " renamed " + old_logical_path + " to " + logical);
        return logical;
    });
}

std::string DocumentStore::move_document(const std::string& user_id,
                                         const std::string& old_logical_path,
                                         const std::optional<std::string>& target_group) {
    return guarded("move_document", user_id, [&] {
        const auto root = user_root(user_id);
        const auto source = document_file(root, old_logical_path);
        const auto dir = has_group(target_group) ? group_dir(root, *target_group) : root;
        if (!std::filesystem::is_regular_file(source)) {
            throw StoreError(StoreErrc::kNotFound, "document not found: " + old_logical_path);
        }
        if (source.parent_path() == dir) {
            return logical_path_of(root, source);
        }

        std::filesystem::create_directories(dir);
        const auto target = next_free_name(dir, source.filename().string());
        std::filesystem::rename(source, target);

        const auto logical = logical_path_of(root, target);
        logger_.info("User " + user_id + " moved " + old_logical_path + " to " + logical);
        return logical;
    });
}

}  // namespace tinynotes::server
