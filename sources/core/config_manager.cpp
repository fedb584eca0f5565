#include "config_manager.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(const std::string& config_path) : config_path_(config_path)
{
    std::error_code ec;
    if (!fs::exists(config_path_, ec)) {
        std::cout << "[INFO] Config " << config_path_ << " not found, using defaults" << std::endl;
    }
}

fs::path ConfigManager::get_tasks_path() const {
    auto configured = read_key("Storage", "Path");
    if (!configured || configured->empty()) {
        return default_tasks_path();
    }

    const std::string& value = *configured;
    if (value == "~") {
        return home_directory();
    }
    if (value.rfind("~/", 0) == 0) {
        return home_directory() / value.substr(2);
    }
    return fs::path(value);
}

const std::string& ConfigManager::get_config_path() const noexcept {
    return config_path_;
}

fs::path ConfigManager::home_directory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    const char* profile = std::getenv("USERPROFILE");
    if (profile && *profile) {
        return fs::path(profile);
    }
    return fs::current_path();
}

fs::path ConfigManager::default_tasks_path() {
    return home_directory() / ".todo_simple" / "tasks.txt";
}

std::optional<std::string> ConfigManager::read_key(const std::string& section, const std::string& key) const {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string current_section;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == ';' || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        if (current_section == section) {
            size_t delimiter = line.find('=');
            if (delimiter != std::string::npos) {
                std::string k = trim(line.substr(0, delimiter));
                if (k == key) {
                    return trim(line.substr(delimiter + 1));
                }
            }
        }
    }

    return std::nullopt;
}

std::string ConfigManager::trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}
