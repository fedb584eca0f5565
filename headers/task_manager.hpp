#ifndef TASK_MANAGER_HPP
#define TASK_MANAGER_HPP

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include "task.hpp"
#include "task_service.hpp"
#include "task_store.hpp"

/**
 * @class TaskManager
 * @brief Entry point for the UI: loads tasks on construction and rewrites the task file after every change.
 */
class TaskManager {
public:
    using WarningHandler = std::function<void(const std::string&)>;

    /**
     * @brief Load persisted tasks from the store
     * @param store Backing file; must outlive the manager
     */
    explicit TaskManager(TaskStore& store);

    /**
     * @brief Current tasks in display order
     */
    const std::vector<Task>& list() const noexcept;

    /**
     * @brief Create a task and save the collection
     * @param title Task title (required)
     * @param description Task description
     * @return The created task
     * @throws std::invalid_argument if the title is empty or whitespace only
     */
    Task create(const std::string& title, const std::string& description);

    /**
     * @brief Change the completion status of a task and save the collection
     * @return False if no task has this id (nothing is saved)
     */
    bool set_completed(int id, bool value);

    /**
     * @brief Delete a task and save the collection
     * @return False if no task has this id (nothing is saved)
     */
    bool remove(int id);

    /**
     * @brief Set the callback receiving save failure messages
     */
    void set_warning_handler(WarningHandler handler);

    std::size_t skipped_on_load() const noexcept;
    const TaskService& get_service() const noexcept;

private:
    TaskStore& store_;
    TaskService service_;
    std::size_t skipped_on_load_;
    WarningHandler warning_handler_;

    void flush();
};

#endif
