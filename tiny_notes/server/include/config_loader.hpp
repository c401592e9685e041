#pragma once

#include "logger.hpp"

#include <string>

namespace tinynotes::server {

struct NotesConfig {
    std::string storage_root = "./data/users";
    std::string account_database = "./data/accounts.db";
    std::string log_file = "./data/tinynotes.log";
    LogLevel log_level = LogLevel::kInfo;
    bool log_to_console = true;
};

NotesConfig load_config(const std::string& path);

}  // namespace tinynotes::server
