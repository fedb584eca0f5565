#include "task_service.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <unordered_set>
#include <utility>

TaskService::TaskService(std::vector<Task> initial) : next_id_(1) {
    std::unordered_set<int> seen;
    tasks_.reserve(initial.size());
    for (auto& task : initial) {
        if (task.get_id() == std::numeric_limits<int>::max()) {
            std::cerr << "[WARN] TaskService: task id " << task.get_id() << " is out of range, dropped" << std::endl;
            continue;
        }
        if (!seen.insert(task.get_id()).second) {
            std::cerr << "[WARN] TaskService: duplicate task id " << task.get_id() << " dropped" << std::endl;
            continue;
        }
        tasks_.push_back(std::move(task));
    }

    next_id_ = compute_next_id(tasks_);
    sort();
}

const std::vector<Task>& TaskService::all() const noexcept {
    return tasks_;
}

Task TaskService::add(const std::string& title, const std::string& description) {
    if (next_id_ == std::numeric_limits<int>::max()) {
        throw std::overflow_error("Task id space is exhausted");
    }
    tasks_.emplace_back(next_id_++, trim(title), trim(description), false);
    Task created = tasks_.back();
    sort();
    return created;
}

bool TaskService::toggle(int id, bool value) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [id](const Task& t) {
        return t.get_id() == id;
    });
    if (it == tasks_.end()) {
        return false;
    }

    it->mark_completed(value);
    sort();
    return true;
}

bool TaskService::remove(int id) {
    auto it = std::remove_if(tasks_.begin(), tasks_.end(), [id](const Task& t) {
        return t.get_id() == id;
    });
    if (it == tasks_.end()) {
        return false;
    }

    tasks_.erase(it, tasks_.end());
    sort();
    return true;
}

std::optional<Task> TaskService::find(int id) const {
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [id](const Task& t) {
        return t.get_id() == id;
    });
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return *it;
}

int TaskService::next_id() const noexcept {
    return next_id_;
}

std::string TaskService::trim(const std::string& s) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

void TaskService::sort() {
    std::sort(tasks_.begin(), tasks_.end(), [](const Task& a, const Task& b) {
        if (a.is_completed() != b.is_completed()) {
            return !a.is_completed();
        }
        return a.get_id() > b.get_id();
    });
}

int TaskService::compute_next_id(const std::vector<Task>& tasks) noexcept {
    int max_id = 0;
    for (const auto& task : tasks) {
        max_id = std::max(max_id, task.get_id());
    }
    return max_id + 1;
}
