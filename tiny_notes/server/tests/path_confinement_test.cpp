#include "path_confinement.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace tinynotes::server;
using tinynotes::test::expect_store_error;

class PathConfinementTest : public tinynotes::test::TempDirTest {
protected:
    std::filesystem::path root;

    void SetUp() override {
        TempDirTest::SetUp();
        root = test_dir / "alice";
        std::filesystem::create_directories(root);
    }
};

TEST_F(PathConfinementTest, AcceptsPathsBelowRoot) {
    EXPECT_EQ(confine(root, "note.md"), root / "note.md");
    EXPECT_EQ(confine(root, "Math/note.md"), root / "Math" / "note.md");
    EXPECT_EQ(confine(root, "Missing/Deeper/file.md"), root / "Missing" / "Deeper" / "file.md");
}

TEST_F(PathConfinementTest, RejectsMalformedInput) {
    expect_store_error([&] { confine(root, ""); }, StoreErrc::kInvalidPath);
    expect_store_error([&] { confine(root, std::string("a\0b.md", 6)); }, StoreErrc::kInvalidPath);
}

TEST_F(PathConfinementTest, RejectsParentReferencesEvenWhenTheyStayInside) {
    expect_store_error([&] { confine(root, "../bob/note.md"); }, StoreErrc::kInvalidPath);
    expect_store_error([&] { confine(root, "Math/../../bob/note.md"); }, StoreErrc::kInvalidPath);
    expect_store_error([&] { confine(root, "Math/../note.md"); }, StoreErrc::kInvalidPath);
    expect_store_error([&] { confine(root, ".."); }, StoreErrc::kInvalidPath);
}

TEST_F(PathConfinementTest, RejectsAbsolutePaths) {
    expect_store_error([&] { confine(root, "/etc/passwd"); }, StoreErrc::kInvalidPath);
    expect_store_error([&] { confine(root, (root / "note.md").string()); }, StoreErrc::kInvalidPath);
}

TEST_F(PathConfinementTest, RejectsSymlinkEscape) {
    const auto outside = test_dir / "outside";
    std::filesystem::create_directories(outside);
    tinynotes::test::write_text(outside / "secret.md", "secret");
    std::filesystem::create_directory_symlink(outside, root / "Leak");

    expect_store_error([&] { confine(root, "Leak/secret.md"); }, StoreErrc::kInvalidPath);
    expect_store_error([&] { confine(root, "Leak"); }, StoreErrc::kInvalidPath);
}

TEST_F(PathConfinementTest, RejectsDanglingSymlinks) {
    const auto outside = test_dir / "outside";
    std::filesystem::create_directories(outside);
    std::filesystem::create_symlink(outside / "pwned.md", root / "evil.md");
    std::filesystem::create_directory_symlink(outside / "missing", root / "Gone");
    std::filesystem::create_symlink(root / "nothing.md", root / "inside.md");

    expect_store_error([&] { confine(root, "evil.md"); }, StoreErrc::kInvalidPath);
    expect_store_error([&] { confine(root, "Gone/note.md"); }, StoreErrc::kInvalidPath);
    expect_store_error([&] { confine(root, "inside.md"); }, StoreErrc::kInvalidPath);
    EXPECT_FALSE(std::filesystem::exists(outside / "pwned.md"));
}

TEST_F(PathConfinementTest, AllowsSymlinksThatStayInside) {
    std::filesystem::create_directories(root / "Real");
    std::filesystem::create_directory_symlink(root / "Real", root / "Alias");
    EXPECT_EQ(confine(root, "Alias/note.md"), root / "Alias" / "note.md");
}

TEST_F(PathConfinementTest, ContainmentIsPerComponent) {
    std::filesystem::create_directories(test_dir / "alice2");
    EXPECT_TRUE(is_within(root, root));
    EXPECT_TRUE(is_within(root, root / "a" / "b.md"));
    EXPECT_FALSE(is_within(root, test_dir / "alice2" / "note.md"));
    EXPECT_FALSE(is_within(root, test_dir / "aliceXYZ"));
    EXPECT_FALSE(is_within(root, test_dir));
    EXPECT_TRUE(is_within(root.string() + "/", root / "note.md"));
}

TEST(SingleComponentTest, ClassifiesNames) {
    EXPECT_TRUE(is_single_component("Math"));
    EXPECT_TRUE(is_single_component("note.md"));
    EXPECT_TRUE(is_single_component("日本語"));
    EXPECT_FALSE(is_single_component(""));
    EXPECT_FALSE(is_single_component("."));
    EXPECT_FALSE(is_single_component(".."));
    EXPECT_FALSE(is_single_component("a/b"));
    EXPECT_FALSE(is_single_component("a\\b"));
    EXPECT_FALSE(is_single_component(std::string("a\0b", 3)));
}
