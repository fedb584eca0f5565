#ifndef TASK_HPP
#define TASK_HPP

#include <string>

/**
 * @class Task
 * @brief Stores information about the task: id, title, description, completion status
 */
class Task {
public:
    /**
     * @brief Construct a new Task object
     * @param id Unique task ID inside one collection
     * @param title Task title
     * @param description Task description (empty by default)
     * @param completed Completion status (false by default)
     */
    Task(int id,
         const std::string& title,
         const std::string& description = "",
         bool completed = false
    );

    ~Task() = default;

    /**
     * @brief Get the id object
     * @return Numeric task ID, never reused after deletion
     */
    int get_id() const noexcept;

    /**
     * @brief Get the title object
     * @return Task title as a string
     */
    std::string get_title() const;

    /**
     * @brief Get the description object
     * @return Task description as a string
     */
    std::string get_description() const;

    /**
     * @brief Check task completion status
     * @return True if the task is completed, otherwise false
     */
    bool is_completed() const noexcept;

    bool operator==(const Task& other) const;
    bool operator!=(const Task& other) const;

private:
    friend class TaskService;

    /**
     * @brief Update task completion status
     * @param status Status true for completed, false for incomplete
     */
    void mark_completed(bool status) noexcept;

    int id_;                        ///< Unique ID
    std::string title_;             ///< Task title
    std::string description_;       ///< Task description
    bool is_completed_;             ///< Completion status
};

#endif
