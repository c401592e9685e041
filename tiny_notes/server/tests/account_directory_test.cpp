#include "account_directory.hpp"
#include "document_store.hpp"
#include "logger.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <regex>
#include <set>
#include <stdexcept>

using namespace tinynotes::server;

class AccountDirectoryTest : public tinynotes::test::TempDirTest {
protected:
    std::unique_ptr<Logger> logger;
    std::unique_ptr<DocumentStore> store;
    std::unique_ptr<AccountDirectory> accounts;

    void SetUp() override {
        TempDirTest::SetUp();
        logger = std::make_unique<Logger>("", LogLevel::kError, false);
        store = std::make_unique<DocumentStore>(test_dir / "users", *logger);
        accounts = std::make_unique<AccountDirectory>((test_dir / "db" / "accounts.db").string(), *store, *logger);
        accounts->initialize_schema();
    }

    void TearDown() override {
        accounts.reset();
        store.reset();
        logger.reset();
        TempDirTest::TearDown();
    }
};

TEST(AccountIdTest, GeneratesVersionFourUuids) {
    const std::regex uuid_v4("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        const auto id = AccountDirectory::generate_user_id();
        EXPECT_TRUE(std::regex_match(id, uuid_v4)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 64u);
}

TEST_F(AccountDirectoryTest, RegisterProvisionsStorage) {
    const auto record = accounts->register_account("Alice");
    EXPECT_EQ(record.name, "Alice");
    EXPECT_FALSE(record.created_at.empty());
    EXPECT_TRUE(std::filesystem::is_directory(test_dir / "users" / record.id));
    EXPECT_TRUE(std::filesystem::exists(test_dir / "users" / record.id / "subjects.json"));
    EXPECT_TRUE(store->list_groups(record.id).empty());
}

TEST_F(AccountDirectoryTest, FindAccount) {
    const auto record = accounts->register_account("Alice");
    const auto found = accounts->find_account(record.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "Alice");
    EXPECT_EQ(found->created_at, record.created_at);
    EXPECT_FALSE(accounts->find_account("no-such-id").has_value());
}

TEST_F(AccountDirectoryTest, ListsInRegistrationOrder) {
    const auto first = accounts->register_account("Alice");
    const auto second = accounts->register_account("Alice");
    const auto third = accounts->register_account("Bob");
    EXPECT_NE(first.id, second.id);

    const auto all = accounts->list_accounts();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, first.id);
    EXPECT_EQ(all[1].id, second.id);
    EXPECT_EQ(all[2].id, third.id);
}

TEST_F(AccountDirectoryTest, RejectsEmptyName) {
    EXPECT_THROW(accounts->register_account(""), std::invalid_argument);
    EXPECT_TRUE(accounts->list_accounts().empty());
}

TEST_F(AccountDirectoryTest, SurvivesReopen) {
    const auto record = accounts->register_account("Alice");
    accounts.reset();

    AccountDirectory reopened((test_dir / "db" / "accounts.db").string(), *store, *logger);
    reopened.initialize_schema();
    ASSERT_TRUE(reopened.find_account(record.id).has_value());
    EXPECT_EQ(reopened.list_accounts().size(), 1u);
}
