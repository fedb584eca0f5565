#ifndef TASK_STORE_HPP
#define TASK_STORE_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "task.hpp"

/**
 * @brief Outcome of TaskStore::load()
 */
struct LoadResult {
    std::vector<Task> tasks;        ///< Tasks in file order
    bool file_found = false;        ///< False on first run
    bool read_failed = false;       ///< File exists but could not be read
    std::size_t skipped_lines = 0;  ///< Corrupt records that were ignored
};

/**
 * @brief Outcome of TaskStore::save()
 */
struct SaveResult {
    bool ok = true;
    std::string message;            ///< Error description when ok is false
};

/**
 * @class TaskStore
 * @brief Reads and writes the whole task collection as a tab-delimited text file, one task per line.
 */
class TaskStore {
public:
    /**
     * @brief Construct a store bound to one file
     * @param file_path Location of the task file (parent directory is created on save)
     */
    explicit TaskStore(const std::filesystem::path& file_path);

    /**
     * @brief Read every well-formed record from the file
     * @return Loaded tasks and diagnostics; missing or unreadable files give an empty result
     */
    LoadResult load() const noexcept;

    /**
     * @brief Overwrite the file with the given tasks in the given order
     * @param tasks Tasks to persist
     * @return ok=false with a message when the file could not be written
     */
    SaveResult save(const std::vector<Task>& tasks) const noexcept;

    const std::filesystem::path& get_file_path() const noexcept;

    /**
     * @brief Replace tabs, line feeds and carriage returns with spaces
     */
    static std::string sanitize(const std::string& field);

private:
    std::filesystem::path file_path_;

    static bool parse_line(const std::string& line, std::vector<Task>& out);
    static std::vector<std::string> split(const std::string& s, char delimiter);
};

#endif
