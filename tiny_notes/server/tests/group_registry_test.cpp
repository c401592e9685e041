#include "group_registry.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace tinynotes::server;
using tinynotes::test::expect_store_error;
using tinynotes::test::read_text;
using tinynotes::test::write_text;

class GroupRegistryTest : public tinynotes::test::TempDirTest {};

TEST_F(GroupRegistryTest, MissingFileLoadsEmpty) {
    const GroupRegistry registry(test_dir);
    EXPECT_TRUE(registry.load().empty());
    EXPECT_FALSE(std::filesystem::exists(registry.file()));
}

TEST_F(GroupRegistryTest, EnsureExistsWritesEmptyObject) {
    const GroupRegistry registry(test_dir);
    registry.ensure_exists();
    ASSERT_TRUE(std::filesystem::exists(test_dir / "subjects.json"));
    EXPECT_EQ(nlohmann::json::parse(read_text(registry.file())), nlohmann::json::object());
}

TEST_F(GroupRegistryTest, EnsureExistsKeepsExistingContent) {
    write_text(test_dir / "subjects.json", R"({"Math": {"icon": null}})");
    const GroupRegistry registry(test_dir);
    registry.ensure_exists();
    EXPECT_EQ(registry.load().count("Math"), 1u);
}

TEST_F(GroupRegistryTest, SavePersistsNamesAndIcons) {
    const GroupRegistry registry(test_dir);
    GroupMap groups;
    groups["Math"] = GroupInfo{};
    groups["Physics"] = GroupInfo{nlohmann::json("atom")};
    registry.save(groups);

    const auto reloaded = GroupRegistry(test_dir).load();
    ASSERT_EQ(reloaded.size(), 2u);
    EXPECT_TRUE(reloaded.at("Math").icon.is_null());
    EXPECT_EQ(reloaded.at("Physics").icon.get<std::string>(), "atom");
    EXPECT_FALSE(std::filesystem::exists(test_dir / "subjects.json.tmp"));

    const auto on_disk = nlohmann::json::parse(read_text(registry.file()));
    EXPECT_TRUE(on_disk.at("Math").contains("icon"));
}

TEST_F(GroupRegistryTest, ToleratesEntriesWithoutIcon) {
    write_text(test_dir / "subjects.json", R"({"Math": {}, "Old": true})");
    const auto groups = GroupRegistry(test_dir).load();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_TRUE(groups.at("Math").icon.is_null());
    EXPECT_TRUE(groups.at("Old").icon.is_null());
}

TEST_F(GroupRegistryTest, CorruptFileIsIoFailure) {
    write_text(test_dir / "subjects.json", "{not json");
    expect_store_error([&] { GroupRegistry(test_dir).load(); }, StoreErrc::kIoFailure);

    write_text(test_dir / "subjects.json", "[1, 2]");
    expect_store_error([&] { GroupRegistry(test_dir).load(); }, StoreErrc::kIoFailure);
}
