#include "account_directory.hpp"
#include "admin_commands.hpp"
#include "config_loader.hpp"
#include "document_store.hpp"
#include "logger.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        tinynotes::server::print_usage(std::cerr);
        return tinynotes::server::kExitUsage;
    }
    const std::string config_path = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        const auto config = tinynotes::server::load_config(config_path);
        tinynotes::server::Logger logger(config.log_file, config.log_level, config.log_to_console);
        tinynotes::server::DocumentStore store(config.storage_root, logger);
        tinynotes::server::AccountDirectory accounts(config.account_database, store, logger);
        accounts.initialize_schema();

        return tinynotes::server::run_admin_command(args, {store, accounts}, std::cin, std::cout, std::cerr);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return tinynotes::server::kExitFailure;
    }
}
