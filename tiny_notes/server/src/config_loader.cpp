#include "config_loader.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tinynotes::server {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

}  // namespace

NotesConfig load_config(const std::string& path) {
    NotesConfig config;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults" << std::endl;
        return config;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, equals_pos));
        const std::string value = trim(line.substr(equals_pos + 1));

        if (key == "storage_root") {
            config.storage_root = value;
        } else if (key == "account_database") {
            config.account_database = value;
        } else if (key == "log_file") {
            config.log_file = value;
        } else if (key == "log_level") {
            const auto level = parse_log_level(value);
            if (!level) {
                throw std::runtime_error("Invalid log_level: " + value);
            }
            config.log_level = *level;
        } else if (key == "log_to_console") {
            config.log_to_console = parse_bool(key, value);
        }
    }

    return config;
}

}  // namespace tinynotes::server
