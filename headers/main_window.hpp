#ifndef MAIN_WINDOW_HPP
#define MAIN_WINDOW_HPP

#include "task.hpp"
#include "task_manager.hpp"
#include <optional>
#include <string>
#include <QMainWindow>
#include <QPushButton>
#include <QTableWidget>

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    MainWindow(TaskManager& tasks, QWidget* parent = nullptr);
    virtual ~MainWindow();

    /**
     * @brief Id of the task on the selected row
     * @return std::nullopt when no row is selected
     */
    std::optional<int> selectedTaskId() const;

private slots:
    void onAddButtonClicked();
    void onDeleteButtonClicked();
    void onItemChanged(QTableWidgetItem* item);

private:
    enum Column { DoneColumn = 0, TitleColumn, DescriptionColumn };

    TaskManager& tasks_;

    QTableWidget* taskTable = nullptr;
    QPushButton* addButton = nullptr;
    QPushButton* deleteButton = nullptr;
    bool refreshing_ = false;

    void initUI();
    void refreshTable();
    void formatTaskRow(int row, const Task& task);
    void showSaveWarning(const std::string& message);
    void closeEvent(QCloseEvent* event) override;
};

#endif
