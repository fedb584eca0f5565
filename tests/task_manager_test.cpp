#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "task_manager.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<unsigned> dist;
    fs::path dir = fs::temp_directory_path() / ("todo_simple_manager_" + std::to_string(dist(gen)));
    fs::create_directories(dir);
    return dir;
}

static std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST_CASE("First run starts empty and create writes the file") {
    fs::path dir = make_temp_dir();
    fs::path file = dir / ".todo_simple" / "tasks.txt";
    TaskStore store(file);
    TaskManager manager(store);

    CHECK(manager.list().empty());
    CHECK(manager.skipped_on_load() == 0);

    Task task = manager.create("Buy milk", "");
    CHECK(task.get_id() == 1);
    CHECK(read_file(file) == "1\t0\tBuy milk\t\n");

    fs::remove_all(dir);
}

TEST_CASE("Every effective mutation rewrites the whole file in display order") {
    fs::path dir = make_temp_dir();
    fs::path file = dir / "tasks.txt";
    TaskStore store(file);
    TaskManager manager(store);

    manager.create("Buy milk", "");
    manager.create("Call mom", "reminder");
    CHECK(read_file(file) == "2\t0\tCall mom\treminder\n1\t0\tBuy milk\t\n");

    CHECK(manager.set_completed(2, true));
    CHECK(read_file(file) == "1\t0\tBuy milk\t\n2\t1\tCall mom\treminder\n");

    CHECK(manager.remove(1));
    CHECK(read_file(file) == "2\t1\tCall mom\treminder\n");

    fs::remove_all(dir);
}

TEST_CASE("Unknown ids leave the file untouched") {
    fs::path dir = make_temp_dir();
    fs::path file = dir / "tasks.txt";
    TaskStore store(file);
    TaskManager manager(store);

    manager.create("Keep", "");
    fs::remove(file);

    CHECK_FALSE(manager.set_completed(42, true));
    CHECK_FALSE(manager.remove(42));
    CHECK_FALSE(fs::exists(file));
    CHECK(manager.list().size() == 1);

    fs::remove_all(dir);
}

TEST_CASE("Empty titles are rejected before reaching the collection") {
    fs::path dir = make_temp_dir();
    fs::path file = dir / "tasks.txt";
    TaskStore store(file);
    TaskManager manager(store);

    CHECK_THROWS_AS(manager.create("", "desc"), std::invalid_argument);
    CHECK_THROWS_AS(manager.create(" \t\n", "desc"), std::invalid_argument);
    CHECK(manager.list().empty());
    CHECK(manager.get_service().next_id() == 1);
    CHECK_FALSE(fs::exists(file));

    fs::remove_all(dir);
}

TEST_CASE("State survives a restart") {
    fs::path dir = make_temp_dir();
    TaskStore store(dir / "tasks.txt");

    {
        TaskManager manager(store);
        manager.create("one", "");
        manager.create("two", "second\tline");
        manager.create("three", "");
        manager.set_completed(2, true);
        manager.remove(3);
    }

    TaskManager reloaded(store);
    REQUIRE(reloaded.list().size() == 2);
    CHECK(reloaded.list()[0] == Task(1, "one", "", false));
    CHECK(reloaded.list()[1] == Task(2, "two", "second line", true));

    SUBCASE("Next id after restart follows the persisted maximum") {
        CHECK(reloaded.create("four", "").get_id() == 3);
    }

    fs::remove_all(dir);
}

TEST_CASE("Corrupt lines are counted on load") {
    fs::path dir = make_temp_dir();
    fs::path file = dir / "tasks.txt";
    {
        std::ofstream out(file);
        out << "1\t0\tGood\t\n2\t1\n";
    }
    TaskStore store(file);
    TaskManager manager(store);

    CHECK(manager.skipped_on_load() == 1);
    REQUIRE(manager.list().size() == 1);
    CHECK(manager.list()[0].get_title() == "Good");

    fs::remove_all(dir);
}

TEST_CASE("Save failure is delivered as a warning and memory state stays valid") {
    fs::path dir = make_temp_dir();
    fs::path blocker = dir / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    TaskStore store(blocker / "tasks.txt");
    TaskManager manager(store);

    std::vector<std::string> warnings;
    manager.set_warning_handler([&warnings](const std::string& message) {
        warnings.push_back(message);
    });

    Task task = manager.create("Unsaved", "");
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].rfind("Failed to save: ", 0) == 0);
    CHECK(manager.list().size() == 1);

    CHECK(manager.set_completed(task.get_id(), true));
    CHECK(warnings.size() == 2);
    CHECK(manager.list()[0].is_completed());

    SUBCASE("Without a handler the failure is only logged") {
        manager.set_warning_handler(nullptr);
        CHECK_NOTHROW(manager.remove(task.get_id()));
        CHECK(manager.list().empty());
    }

    fs::remove_all(dir);
}
