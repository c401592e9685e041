#pragma once

#include "group_registry.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tinynotes::server {

struct DocumentEntry {
    std::string name;
    std::optional<std::string> group;
    std::string path;
    std::chrono::system_clock::time_point modified;
};

struct DocumentContent {
    std::string path;
    std::string content;
};

// Owns <storage_root>/<user_id> for every user. Each user holds .md documents at
// the top level or inside exactly one level of groups, plus subjects.json listing
// the groups. All failures surface as StoreError.
class DocumentStore {
public:
    DocumentStore(std::filesystem::path storage_root, Logger& logger);

    // Canonical user root, created on demand.
    std::filesystem::path user_root(const std::string& user_id) const;
    void provision_user(const std::string& user_id);

    // Users that have been granted a lock slot. Only valid ids ever get one.
    std::size_t tracked_user_count() const;

    GroupMap list_groups(const std::string& user_id);
    std::string create_group(const std::string& user_id, const std::string& name);
    std::string rename_group(const std::string& user_id, const std::string& old_name, const std::string& new_name);
    void delete_group(const std::string& user_id, const std::string& name, bool delete_files);

    std::vector<DocumentEntry> list_documents(const std::string& user_id, const std::optional<std::string>& group);
    DocumentContent get_document(const std::string& user_id, const std::string& logical_path);
    std::chrono::system_clock::time_point save_document(const std::string& user_id,
                                                        const std::string& logical_path,
                                                        const std::string& content);
    std::string create_document(const std::string& user_id,
                                const std::optional<std::string>& group,
                                const std::optional<std::string>& title,
                                const std::string& content = {});
    void delete_document(const std::string& user_id, const std::string& logical_path);
    std::string rename_document(const std::string& user_id,
                                const std::string& old_logical_path,
                                const std::string& new_title);
    std::string move_document(const std::string& user_id,
                              const std::string& old_logical_path,
                              const std::optional<std::string>& target_group);

private:
    template <typename Fn>
    auto guarded(const char* operation, const std::string& user_id, Fn&& fn);

    std::mutex& user_mutex(const std::string& user_id);

    std::filesystem::path group_dir(const std::filesystem::path& root, const std::string& group) const;
    std::filesystem::path document_file(const std::filesystem::path& root, const std::string& logical_path) const;
    std::vector<DocumentEntry> scan_directory(const std::filesystem::path& dir,
                                              const std::optional<std::string>& group) const;

    static std::filesystem::path next_free_name(const std::filesystem::path& dir, const std::string& filename);
    static std::string logical_path_of(const std::filesystem::path& root, const std::filesystem::path& file);

    std::filesystem::path root_;
    Logger& logger_;

    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> user_locks_;
};

}  // namespace tinynotes::server
