#ifndef TASK_SERVICE_HPP
#define TASK_SERVICE_HPP

#include <optional>
#include <string>
#include <vector>
#include "task.hpp"

/**
 * @class TaskService
 * @brief Owns the live task collection, assigns ids and keeps the collection ordered.
 *
 * Order: incomplete tasks first, then completed ones; newest (highest id) first inside each group.
 */
class TaskService {
public:
    /**
     * @brief Build the collection from previously persisted tasks
     * @param initial Tasks in any order; later duplicates of an id and the id INT_MAX are dropped
     */
    explicit TaskService(std::vector<Task> initial = {});

    /**
     * @brief Current collection in display order
     */
    const std::vector<Task>& all() const noexcept;

    /**
     * @brief Create a new incomplete task
     * @param title Task title (trimmed, not validated)
     * @param description Task description (trimmed)
     * @return Copy of the created task
     * @throws std::overflow_error if no id below INT_MAX is left
     */
    Task add(const std::string& title, const std::string& description);

    /**
     * @brief Set the completion flag of a task
     * @return False if no task has this id
     */
    bool toggle(int id, bool value);

    /**
     * @brief Remove a task
     * @return True if a task was removed
     */
    bool remove(int id);

    std::optional<Task> find(int id) const;
    int next_id() const noexcept;

    static std::string trim(const std::string& s);

private:
    std::vector<Task> tasks_;
    int next_id_;

    void sort();
    static int compute_next_id(const std::vector<Task>& tasks) noexcept;
};

#endif
