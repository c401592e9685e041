#include "admin_commands.hpp"

#include "account_directory.hpp"
#include "document_store.hpp"
#include "store_error.hpp"
#include "time_format.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>

namespace tinynotes::server {

namespace {

using nlohmann::json;

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Positional arguments plus "--flag" and "--key value" options.
struct ParsedArgs {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;
    std::vector<std::string> flags;

    std::optional<std::string> option(const std::string& key) const {
        for (const auto& entry : options) {
            if (entry.first == key) {
                return entry.second;
            }
        }
        return std::nullopt;
    }

    bool flag(const std::string& key) const {
        for (const auto& entry : flags) {
            if (entry == key) {
                return true;
            }
        }
        return false;
    }
};

ParsedArgs parse(const std::vector<std::string>& args, const std::vector<std::string>& valued_options) {
    ParsedArgs parsed;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            parsed.positional.push_back(arg);
            continue;
        }
        bool takes_value = false;
        for (const auto& name : valued_options) {
            takes_value = takes_value || name == arg;
        }
        if (!takes_value) {
            parsed.flags.push_back(arg);
            continue;
        }
        if (i + 1 >= args.size()) {
            throw UsageError(arg + " requires a value");
        }
        parsed.options.emplace_back(arg, args[++i]);
    }
    return parsed;
}

void expect_positional(const ParsedArgs& parsed, std::size_t min, std::size_t max, const std::string& usage) {
    if (parsed.positional.size() < min || parsed.positional.size() > max) {
        throw UsageError("usage: " + usage);
    }
}

std::optional<std::string> optional_arg(const ParsedArgs& parsed, std::size_t index) {
    if (index < parsed.positional.size()) {
        return parsed.positional[index];
    }
    return std::nullopt;
}

std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

json group_json(const std::optional<std::string>& group) {
    return group ? json(*group) : json(nullptr);
}

json account_json(const AccountRecord& record) {
    return {{"id", record.id}, {"name", record.name}, {"createdAt", record.created_at}};
}

json dispatch(const std::vector<std::string>& args, AdminContext context, std::istream& in) {
    const auto& command = args.front();
    auto& store = context.store;

    if (command == "signup") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 1, 1, "signup <name>");
        const auto record = context.accounts.register_account(parsed.positional[0]);
        return {{"ok", true}, {"user", {{"id", record.id}, {"name", record.name}}}};
    }
    if (command == "whoami") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 1, 1, "whoami <user>");
        const auto record = context.accounts.find_account(parsed.positional[0]);
        if (!record) {
            throw StoreError(StoreErrc::kNotFound, "user not found: " + parsed.positional[0]);
        }
        return account_json(*record);
    }
    if (command == "accounts") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 0, 0, "accounts");
        json result = json::array();
        for (const auto& record : context.accounts.list_accounts()) {
            result.push_back(account_json(record));
        }
        return result;
    }
    if (command == "subjects") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 1, 1, "subjects <user>");
        json result = json::object();
        for (const auto& [name, info] : store.list_groups(parsed.positional[0])) {
            result[name] = {{"icon", info.icon}};
        }
        return result;
    }
    if (command == "subject-create") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 2, 2, "subject-create <user> <name>");
        const auto name = store.create_group(parsed.positional[0], parsed.positional[1]);
        return {{"ok", true}, {"subject", {{"name", name}}}};
    }
    if (command == "subject-rename") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 3, 3, "subject-rename <user> <old> <new>");
        const auto name = store.rename_group(parsed.positional[0], parsed.positional[1], parsed.positional[2]);
        return {{"ok", true}, {"subject", {{"name", name}}}};
    }
    if (command == "subject-delete") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 2, 2, "subject-delete <user> <name> [--delete-files]");
        store.delete_group(parsed.positional[0], parsed.positional[1], parsed.flag("--delete-files"));
        return {{"ok", true}};
    }
    if (command == "notes") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 1, 2, "notes <user> [subject]");
        json result = json::array();
        for (const auto& entry : store.list_documents(parsed.positional[0], optional_arg(parsed, 1))) {
            result.push_back({{"name", entry.name},
                              {"subject", group_json(entry.group)},
                              {"path", entry.path},
                              {"mtime", to_iso8601(entry.modified)}});
        }
        return result;
    }
    if (command == "note-get") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 2, 2, "note-get <user> <path>");
        const auto document = store.get_document(parsed.positional[0], parsed.positional[1]);
        return {{"path", document.path}, {"content", document.content}};
    }
    if (command == "note-save") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 2, 2, "note-save <user> <path> < content");
        const auto saved_at = store.save_document(parsed.positional[0], parsed.positional[1], read_all(in));
        return {{"ok", true}, {"savedAt", to_iso8601(saved_at)}};
    }
    if (command == "note-create") {
        const auto parsed = parse(args, {"--subject", "--title"});
        expect_positional(parsed, 1, 1, "note-create <user> [--subject S] [--title T] < content");
        const auto path =
            store.create_document(parsed.positional[0], parsed.option("--subject"), parsed.option("--title"), read_all(in));
        return {{"ok", true}, {"path", path}};
    }
    if (command == "note-delete") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 2, 2, "note-delete <user> <path>");
        store.delete_document(parsed.positional[0], parsed.positional[1]);
        return {{"ok", true}};
    }
    if (command == "note-rename") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 3, 3, "note-rename <user> <path> <new-title>");
        const auto path = store.rename_document(parsed.positional[0], parsed.positional[1], parsed.positional[2]);
        return {{"ok", true}, {"path", path}};
    }
    if (command == "note-move") {
        const auto parsed = parse(args, {});
        expect_positional(parsed, 2, 3, "note-move <user> <path> [subject]");
        const auto path = store.move_document(parsed.positional[0], parsed.positional[1], optional_arg(parsed, 2));
        return {{"ok", true}, {"path", path}};
    }
    throw UsageError("unknown command: " + command);
}

}  // namespace

void print_usage(std::ostream& err) {
    err << "usage: tinynotes_admin <config> <command> [args...]\n"
           "commands:\n"
           "  signup <name>                       register an account and provision its storage\n"
           "  whoami <user>                       show an account record\n"
           "  accounts                            list all accounts\n"
           "  subjects <user>                     list subjects\n"
           "  subject-create <user> <name>\n"
           "  subject-rename <user> <old> <new>\n"
           "  subject-delete <user> <name> [--delete-files]\n"
           "  notes <user> [subject]              list notes, all of them when no subject is given\n"
           "  note-get <user> <path>\n"
           "  note-save <user> <path>             content is read from stdin\n"
           "  note-create <user> [--subject S] [--title T]   content is read from stdin\n"
           "  note-delete <user> <path>\n"
           "  note-rename <user> <path> <new-title>\n"
           "  note-move <user> <path> [subject]   omit the subject to move to the top level\n";
}

int run_admin_command(const std::vector<std::string>& args,
                      AdminContext context,
                      std::istream& in,
                      std::ostream& out,
                      std::ostream& err) {
    if (args.empty()) {
        print_usage(err);
        return kExitUsage;
    }
    try {
        out << dispatch(args, context, in).dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        return kExitOk;
    } catch (const UsageError& ex) {
        err << ex.what() << std::endl;
        return kExitUsage;
    } catch (const StoreError& ex) {
        out << json{{"error", ex.what()}, {"code", to_string(ex.code())}}.dump(2, ' ', false, json::error_handler_t::replace)
            << std::endl;
        return ex.code() == StoreErrc::kIoFailure ? kExitFailure : kExitRejected;
    } catch (const std::invalid_argument& ex) {
        out << json{{"error", ex.what()}}.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        return kExitRejected;
    }
}

}  // namespace tinynotes::server
