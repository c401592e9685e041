#include "config_loader.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace tinynotes::server;
using tinynotes::test::write_text;

class ConfigLoaderTest : public tinynotes::test::TempDirTest {};

TEST_F(ConfigLoaderTest, MissingFileFallsBackToDefaults) {
    const auto config = load_config((test_dir / "absent.conf").string());
    EXPECT_EQ(config.storage_root, "./data/users");
    EXPECT_EQ(config.account_database, "./data/accounts.db");
    EXPECT_EQ(config.log_file, "./data/tinynotes.log");
    EXPECT_EQ(config.log_level, LogLevel::kInfo);
    EXPECT_TRUE(config.log_to_console);
}

TEST_F(ConfigLoaderTest, ParsesKeysCommentsAndWhitespace) {
    const auto file = test_dir / "server.conf";
    write_text(file,
               "# storage\n"
               "storage_root = /srv/notes/users\n"
               "\n"
               "  account_database=/srv/notes/accounts.db  \n"
               "log_file =\n"
               "log_level = DEBUG\n"
               "log_to_console = off\n"
               "unknown_key = ignored\n"
               "not a pair\n");

    const auto config = load_config(file.string());
    EXPECT_EQ(config.storage_root, "/srv/notes/users");
    EXPECT_EQ(config.account_database, "/srv/notes/accounts.db");
    EXPECT_EQ(config.log_file, "");
    EXPECT_EQ(config.log_level, LogLevel::kDebug);
    EXPECT_FALSE(config.log_to_console);
}

TEST_F(ConfigLoaderTest, RejectsBadValues) {
    const auto file = test_dir / "bad.conf";
    write_text(file, "log_level = chatty\n");
    EXPECT_THROW(load_config(file.string()), std::runtime_error);

    write_text(file, "log_to_console = maybe\n");
    EXPECT_THROW(load_config(file.string()), std::runtime_error);
}
