#pragma once

#include <sqlite3.h>

#include <optional>
#include <string>
#include <vector>

namespace tinynotes::server {

class DocumentStore;
class Logger;

struct AccountRecord {
    std::string id;
    std::string name;
    std::string created_at;
};

// Account bookkeeping for signup. Credentials live with the external auth layer;
// this only maps the stable user id to a display name and provisions storage.
class AccountDirectory {
public:
    AccountDirectory(const std::string& database_path, DocumentStore& store, Logger& logger);
    ~AccountDirectory();

    AccountDirectory(const AccountDirectory&) = delete;
    AccountDirectory& operator=(const AccountDirectory&) = delete;

    void initialize_schema();

    AccountRecord register_account(const std::string& name);
    std::optional<AccountRecord> find_account(const std::string& id);
    std::vector<AccountRecord> list_accounts();

    static std::string generate_user_id();

private:
    sqlite3* db_{};
    DocumentStore& store_;
    Logger& logger_;
};

}  // namespace tinynotes::server
