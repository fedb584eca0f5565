#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "main_window.hpp"
#include <QApplication>
#include <QTableWidget>
#include <filesystem>
#include <random>
#include <string>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<unsigned> dist;
    fs::path dir = fs::temp_directory_path() / ("todo_simple_window_" + std::to_string(dist(gen)));
    fs::create_directories(dir);
    return dir;
}

static QApplication& application() {
    static int argc = 1;
    static char arg0[] = "main_window_test";
    static char* argv[] = {arg0, nullptr};
    qputenv("QT_QPA_PLATFORM", "offscreen");
    static QApplication app(argc, argv);
    return app;
}

TEST_CASE("Delete target follows the row selection") {
    application();

    fs::path dir = make_temp_dir();
    TaskStore store(dir / "tasks.txt");
    {
        TaskManager manager(store);
        manager.create("Older", "");
        manager.create("Newer", "");

        MainWindow window(manager);
        QTableWidget* table = window.findChild<QTableWidget*>();
        REQUIRE(table != nullptr);
        REQUIRE(table->rowCount() == 2);

        SUBCASE("Nothing selected") {
            table->clearSelection();
            CHECK_FALSE(window.selectedTaskId().has_value());
        }

        SUBCASE("Selected row maps to its task id") {
            table->selectRow(1);
            REQUIRE(window.selectedTaskId().has_value());
            CHECK(*window.selectedTaskId() == 1);
        }

        SUBCASE("Current cell without a selection is not a target") {
            table->setCurrentCell(0, 1);
            table->clearSelection();
            CHECK(table->currentRow() == 0);
            CHECK_FALSE(window.selectedTaskId().has_value());
        }
    }

    fs::remove_all(dir);
}
