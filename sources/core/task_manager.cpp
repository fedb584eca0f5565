#include "task_manager.hpp"
#include <iostream>
#include <utility>

TaskManager::TaskManager(TaskStore& store) : store_(store), skipped_on_load_(0) {
    LoadResult loaded = store_.load();
    skipped_on_load_ = loaded.skipped_lines;

    if (!loaded.file_found) {
        std::cout << "[INFO] No task file at " << store_.get_file_path() << ", starting empty" << std::endl;
    } else if (loaded.read_failed) {
        std::cerr << "[WARN] Task file " << store_.get_file_path() << " is unreadable, starting empty" << std::endl;
    } else {
        std::cout << "[INFO] Loaded " << loaded.tasks.size() << " tasks from " << store_.get_file_path() << std::endl;
    }
    if (skipped_on_load_ > 0) {
        std::cerr << "[WARN] Skipped " << skipped_on_load_ << " corrupt lines" << std::endl;
    }

    service_ = TaskService(std::move(loaded.tasks));
}

const std::vector<Task>& TaskManager::list() const noexcept {
    return service_.all();
}

Task TaskManager::create(const std::string& title, const std::string& description) {
    if (TaskService::trim(title).empty()) {
        throw std::invalid_argument("Task title cannot be empty");
    }

    Task task = service_.add(title, description);
    flush();
    return task;
}

bool TaskManager::set_completed(int id, bool value) {
    if (!service_.toggle(id, value)) {
        return false;
    }
    flush();
    return true;
}

bool TaskManager::remove(int id) {
    if (!service_.remove(id)) {
        return false;
    }
    flush();
    return true;
}

void TaskManager::set_warning_handler(WarningHandler handler) {
    warning_handler_ = std::move(handler);
}

std::size_t TaskManager::skipped_on_load() const noexcept {
    return skipped_on_load_;
}

const TaskService& TaskManager::get_service() const noexcept {
    return service_;
}

void TaskManager::flush() {
    SaveResult result = store_.save(service_.all());
    if (result.ok) {
        return;
    }

    const std::string message = "Failed to save: " + result.message;
    std::cerr << "[WARN] " << message << std::endl;
    if (warning_handler_) {
        warning_handler_(message);
    }
}
