#include "group_registry.hpp"

#include "store_error.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace tinynotes::server {

namespace {

nlohmann::json to_json(const GroupMap& subjects) {
    nlohmann::json document = nlohmann::json::object();
    for (const auto& [name, info] : subjects) {
        document[name] = {{"icon", info.icon}};
    }
    return document;
}

GroupMap from_json(const nlohmann::json& document, const std::filesystem::path& file) {
    if (!document.is_object()) {
        throw StoreError(StoreErrc::kIoFailure, "Group registry is not a JSON object: " + file.string());
    }
    GroupMap subjects;
    for (const auto& [name, value] : document.items()) {
        GroupInfo info;
        if (value.is_object() && value.contains("icon")) {
            info.icon = value.at("icon");
        }
        subjects.emplace(name, std::move(info));
    }
    return subjects;
}

}  // namespace

GroupRegistry::GroupRegistry(std::filesystem::path user_root)
    : file_(std::move(user_root) / std::string(kFileName)) {}

GroupMap GroupRegistry::load() const {
    if (!std::filesystem::exists(file_)) {
        return {};
    }
    std::ifstream stream(file_);
    if (!stream) {
        throw StoreError(StoreErrc::kIoFailure, "Unable to open group registry: " + file_.string());
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    try {
        return from_json(nlohmann::json::parse(buffer.str()), file_);
    } catch (const nlohmann::json::exception& ex) {
        throw StoreError(StoreErrc::kIoFailure,
                         "Group registry is corrupt (" + file_.string() + "): " + ex.what());
    }
}

void GroupRegistry::save(const GroupMap& subjects) const {
    std::string payload;
    try {
        payload = to_json(subjects).dump(2);
    } catch (const nlohmann::json::exception& ex) {
        throw StoreError(StoreErrc::kIoFailure, std::string("Unable to encode group registry: ") + ex.what());
    }

    auto temp = file_;
    temp += ".tmp";
    {
        std::ofstream stream(temp, std::ios::trunc);
        stream << payload;
        stream.flush();
        if (!stream) {
            throw StoreError(StoreErrc::kIoFailure, "Unable to write group registry: " + temp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, file_, ec);
    if (ec) {
        const auto reason = ec.message();
        std::filesystem::remove(temp, ec);
        throw StoreError(StoreErrc::kIoFailure,
                         "Unable to replace group registry " + file_.string() + ": " + reason);
    }
}

void GroupRegistry::ensure_exists() const {
    if (!std::filesystem::exists(file_)) {
        save({});
    }
}

}  // namespace tinynotes::server
