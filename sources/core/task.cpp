#include "task.hpp"

Task::Task(int id, const std::string& title, const std::string& description, bool completed)
    : id_(id),
      title_(title),
      description_(description),
      is_completed_(completed)
{
}

int Task::get_id() const noexcept {
    return id_;
}

std::string Task::get_title() const {
    return title_;
}

std::string Task::get_description() const {
    return description_;
}

bool Task::is_completed() const noexcept {
    return is_completed_;
}

void Task::mark_completed(bool status) noexcept {
    this->is_completed_ = status;
}

bool Task::operator==(const Task& other) const {
    return id_ == other.id_
        && is_completed_ == other.is_completed_
        && title_ == other.title_
        && description_ == other.description_;
}

bool Task::operator!=(const Task& other) const {
    return !(*this == other);
}
