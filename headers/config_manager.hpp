#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include <filesystem>
#include <optional>
#include <string>

/**
 * @class ConfigManager
 * @brief Reads application settings from an optional INI file.
 *
 * Recognised keys:
 *   [Storage] Path = location of the task file ("~/" expands to the home directory)
 */
class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path = "config/config.ini");

    /**
     * @brief Location of the task file
     * @return Configured path, or ~/.todo_simple/tasks.txt when the file or key is absent
     */
    std::filesystem::path get_tasks_path() const;

    const std::string& get_config_path() const noexcept;

    static std::filesystem::path home_directory();
    static std::filesystem::path default_tasks_path();

private:
    std::string config_path_;
    std::optional<std::string> read_key(const std::string& section, const std::string& key) const;
    static std::string trim(const std::string& s);
};

#endif
