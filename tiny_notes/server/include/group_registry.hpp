#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace tinynotes::server {

struct GroupInfo {
    // Opaque to the store; round-tripped as whatever JSON the client stored.
    nlohmann::json icon = nullptr;
};

using GroupMap = std::map<std::string, GroupInfo>;

// Per-user subjects.json. Every call goes to disk; nothing is cached between
// operations.
class GroupRegistry {
public:
    static constexpr std::string_view kFileName = "subjects.json";

    explicit GroupRegistry(std::filesystem::path user_root);

    const std::filesystem::path& file() const { return file_; }

    GroupMap load() const;
    void save(const GroupMap& subjects) const;
    void ensure_exists() const;

private:
    std::filesystem::path file_;
};

}  // namespace tinynotes::server
