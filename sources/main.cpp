#include <QApplication>
#include <QMessageBox>
#include "main_window.hpp"
#include "config_manager.hpp"
#include "task_manager.hpp"
#include "task_store.hpp"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName("todo_simple");
    QCoreApplication::setApplicationName("TodoSimple");

    try {
        ConfigManager config;
        TaskStore store(config.get_tasks_path());
        TaskManager tasks(store);

        MainWindow window(tasks);
        window.show();
        return app.exec();

    } catch (const std::exception& e) {
        QMessageBox::critical(nullptr, "Fatal Error", e.what());
        return 1;
    }
}
