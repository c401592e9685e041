#include "account_directory.hpp"

#include "document_store.hpp"
#include "logger.hpp"
#include "time_format.hpp"

#include <openssl/rand.h>

#include <array>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tinynotes::server {

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const auto* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

AccountRecord read_record(sqlite3_stmt* stmt) {
    return AccountRecord{column_text(stmt, 0), column_text(stmt, 1), column_text(stmt, 2)};
}

}  // namespace

AccountDirectory::AccountDirectory(const std::string& database_path, DocumentStore& store, Logger& logger)
    : store_(store), logger_(logger) {
    const auto parent = std::filesystem::path(database_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    if (sqlite3_open(database_path.c_str(), &db_) != SQLITE_OK) {
        const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open account database: " + reason);
    }
}

AccountDirectory::~AccountDirectory() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void AccountDirectory::initialize_schema() {
    const char* ddl = R"SQL(
        CREATE TABLE IF NOT EXISTS accounts (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            id TEXT UNIQUE NOT NULL,
            name TEXT NOT NULL,
            created_at TEXT NOT NULL
        );
    )SQL";

    char* err_msg = nullptr;
    if (sqlite3_exec(db_, ddl, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string error(err_msg ? err_msg : "unknown error");
        sqlite3_free(err_msg);
        throw std::runtime_error("Failed to initialize account schema: " + error);
    }
}

std::string AccountDirectory::generate_user_id() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    // RFC 4122 version 4, variant 1.
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

AccountRecord AccountDirectory::register_account(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("account name required");
    }
    AccountRecord record{generate_user_id(), name, to_iso8601(std::chrono::system_clock::now())};

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "INSERT INTO accounts(id, name, created_at) VALUES(?,?,?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare account insert: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, record.created_at.c_str(), -1, SQLITE_TRANSIENT);

    const bool success = sqlite3_step(stmt) == SQLITE_DONE;
    const std::string reason = success ? std::string{} : sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    if (!success) {
        throw std::runtime_error("Failed to store account: " + reason);
    }

    store_.provision_user(record.id);
    logger_.info("Registered account " + record.id + " (" + record.name + ")");
    return record;
}

std::optional<AccountRecord> AccountDirectory::find_account(const std::string& id) {
    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT id,name,created_at FROM accounts WHERE id=?";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare account lookup: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<AccountRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        record = read_record(stmt);
    }
    sqlite3_finalize(stmt);
    return record;
}

std::vector<AccountRecord> AccountDirectory::list_accounts() {
    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT id,name,created_at FROM accounts ORDER BY seq";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare account listing: " + std::string(sqlite3_errmsg(db_)));
    }
    std::vector<AccountRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(read_record(stmt));
    }
    const std::string reason = rc == SQLITE_DONE ? std::string{} : sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to list accounts: " + reason);
    }
    return records;
}

}  // namespace tinynotes::server
