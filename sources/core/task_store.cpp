#include "task_store.hpp"
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

TaskStore::TaskStore(const fs::path& file_path) : file_path_(file_path) {}

const fs::path& TaskStore::get_file_path() const noexcept {
    return file_path_;
}

LoadResult TaskStore::load() const noexcept {
    LoadResult result;
    try {
        std::error_code ec;
        if (!fs::exists(file_path_, ec)) {
            return result;
        }
        result.file_found = true;

        std::ifstream file(file_path_);
        if (fs::is_directory(file_path_, ec) || !file.is_open()) {
            std::cerr << "[WARN] TaskStore::load: cannot open " << file_path_ << std::endl;
            result.read_failed = true;
            return result;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t\v\f") == std::string::npos) {
                continue;
            }
            if (!parse_line(line, result.tasks)) {
                ++result.skipped_lines;
            }
        }

        if (file.bad()) {
            std::cerr << "[WARN] TaskStore::load: read error in " << file_path_ << std::endl;
            result.tasks.clear();
            result.read_failed = true;
        }
    } catch (const std::exception& e) {
        std::cerr << "[WARN] TaskStore::load: " << e.what() << std::endl;
        result.tasks.clear();
        result.read_failed = true;
    }
    return result;
}

SaveResult TaskStore::save(const std::vector<Task>& tasks) const noexcept {
    SaveResult result;
    try {
        const fs::path parent = file_path_.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("cannot create directory " + parent.string() + ": " + ec.message());
            }
        }

        std::ofstream file(file_path_, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open " + file_path_.string() + " for writing");
        }

        for (const auto& task : tasks) {
            file << task.get_id() << '\t'
                 << (task.is_completed() ? "1" : "0") << '\t'
                 << sanitize(task.get_title()) << '\t'
                 << sanitize(task.get_description()) << '\n';
        }

        file.flush();
        if (!file) {
            throw std::runtime_error("write to " + file_path_.string() + " failed");
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] TaskStore::save: " << e.what() << std::endl;
        result.ok = false;
        result.message = e.what();
    }
    return result;
}

std::string TaskStore::sanitize(const std::string& field) {
    std::string out = field;
    for (char& c : out) {
        if (c == '\t' || c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return out;
}

bool TaskStore::parse_line(const std::string& line, std::vector<Task>& out) {
    const auto parts = split(line, '\t');
    if (parts.size() < 4) {
        return false;
    }

    const std::string& id_field = parts[0];
    if (id_field.empty() || std::isspace(static_cast<unsigned char>(id_field.front()))) {
        return false;
    }

    int id = 0;
    try {
        size_t pos = 0;
        id = std::stoi(id_field, &pos);
        if (pos != id_field.size()) {
            return false;
        }
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range
        return false;
    }
    // INT_MAX is reserved: no id could follow it
    if (id == std::numeric_limits<int>::max()) {
        return false;
    }

    out.emplace_back(id, parts[2], parts[3], parts[1] == "1");
    return true;
}

std::vector<std::string> TaskStore::split(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    size_t start = 0;
    size_t end = s.find(delimiter);
    while (end != std::string::npos) {
        tokens.push_back(s.substr(start, end - start));
        start = end + 1;
        end = s.find(delimiter, start);
    }
    tokens.push_back(s.substr(start));
    return tokens;
}
