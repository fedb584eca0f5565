#include "main_window.hpp"
#include <QBrush>
#include <QCloseEvent>
#include <QDialog>
#include <QDialogButtonBox>
#include <QFont>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QItemSelectionModel>
#include <QLineEdit>
#include <QMessageBox>
#include <QSettings>
#include <QStatusBar>
#include <QTextEdit>
#include <QVBoxLayout>
#include <QtDebug>
#include <stdexcept>

MainWindow::MainWindow(TaskManager& tasks, QWidget* parent) : QMainWindow(parent), tasks_(tasks) {
    setWindowTitle("To-Do");

    initUI();

    tasks_.set_warning_handler([this](const std::string& message) {
        showSaveWarning(message);
    });

    refreshTable();

    if (tasks_.skipped_on_load() > 0) {
        statusBar()->showMessage(
            QString("Skipped %1 corrupt lines in the task file").arg(static_cast<qulonglong>(tasks_.skipped_on_load())));
    }

    QSettings settings;
    if (!restoreGeometry(settings.value("geometry").toByteArray())) {
        resize(640, 400);
    }
}

MainWindow::~MainWindow() {
    tasks_.set_warning_handler(nullptr);
}

void MainWindow::initUI() {
    QWidget* central = new QWidget(this);
    QVBoxLayout* layout = new QVBoxLayout(central);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(8);

    taskTable = new QTableWidget(0, 3, central);
    taskTable->setHorizontalHeaderLabels({"Done", "Title", "Description"});
    taskTable->setSelectionMode(QAbstractItemView::SingleSelection);
    taskTable->setSelectionBehavior(QAbstractItemView::SelectRows);
    taskTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    taskTable->verticalHeader()->setVisible(false);
    taskTable->verticalHeader()->setDefaultSectionSize(22);
    taskTable->horizontalHeader()->setSectionResizeMode(DoneColumn, QHeaderView::ResizeToContents);
    taskTable->horizontalHeader()->setSectionResizeMode(TitleColumn, QHeaderView::Stretch);
    taskTable->horizontalHeader()->setSectionResizeMode(DescriptionColumn, QHeaderView::Stretch);
    layout->addWidget(taskTable);

    QHBoxLayout* controls = new QHBoxLayout();
    controls->addStretch();
    addButton = new QPushButton("Add", central);
    deleteButton = new QPushButton("Delete", central);
    controls->addWidget(addButton);
    controls->addWidget(deleteButton);
    layout->addLayout(controls);

    setCentralWidget(central);

    connect(addButton, &QPushButton::clicked, this, &MainWindow::onAddButtonClicked);
    connect(deleteButton, &QPushButton::clicked, this, &MainWindow::onDeleteButtonClicked);
    connect(taskTable, &QTableWidget::itemChanged, this, &MainWindow::onItemChanged);
}

void MainWindow::refreshTable() {
    refreshing_ = true;

    const auto& tasks = tasks_.list();
    taskTable->clearContents();
    taskTable->setRowCount(static_cast<int>(tasks.size()));

    for (int row = 0; row < static_cast<int>(tasks.size()); ++row) {
        formatTaskRow(row, tasks[row]);
    }

    refreshing_ = false;
}

void MainWindow::formatTaskRow(int row, const Task& task) {
    QTableWidgetItem* done = new QTableWidgetItem();
    done->setFlags(Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsUserCheckable);
    done->setCheckState(task.is_completed() ? Qt::Checked : Qt::Unchecked);
    done->setData(Qt::UserRole, task.get_id());
    taskTable->setItem(row, DoneColumn, done);

    QTableWidgetItem* title = new QTableWidgetItem(QString::fromStdString(task.get_title()));
    QTableWidgetItem* description = new QTableWidgetItem(QString::fromStdString(task.get_description()));

    for (QTableWidgetItem* item : {title, description}) {
        item->setFlags(Qt::ItemIsEnabled | Qt::ItemIsSelectable);
        QFont font = item->font();
        font.setStrikeOut(task.is_completed());
        item->setFont(font);
        if (task.is_completed()) {
            item->setForeground(QBrush(Qt::gray));
        }
    }

    title->setToolTip(QString::fromStdString(task.get_description()));
    taskTable->setItem(row, TitleColumn, title);
    taskTable->setItem(row, DescriptionColumn, description);
}

void MainWindow::onItemChanged(QTableWidgetItem* item) {
    if (refreshing_ || item->column() != DoneColumn) {
        return;
    }

    const int id = item->data(Qt::UserRole).toInt();
    const bool completed = (item->checkState() == Qt::Checked);

    if (!tasks_.set_completed(id, completed)) {
        qWarning() << "Toggle ignored, no task with id" << id;
    }

    // The table must not be rebuilt from inside its own itemChanged signal
    QMetaObject::invokeMethod(this, [this]() {
        refreshTable();
    }, Qt::QueuedConnection);
}

void MainWindow::onAddButtonClicked() {
    QDialog dialog(this);
    dialog.setWindowTitle("Add Task");
    QFormLayout layout(&dialog);

    QLineEdit titleEdit;
    QTextEdit descEdit;
    descEdit.setAcceptRichText(false);
    descEdit.setLineWrapMode(QTextEdit::WidgetWidth);
    layout.addRow("Title:", &titleEdit);
    layout.addRow("Description:", &descEdit);

    QDialogButtonBox buttons(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    layout.addRow(&buttons);

    connect(&buttons, &QDialogButtonBox::accepted, &dialog, &QDialog::accept);
    connect(&buttons, &QDialogButtonBox::rejected, &dialog, &QDialog::reject);

    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    if (titleEdit.text().trimmed().isEmpty()) {
        QMessageBox::warning(this, "To-Do", "Title is required.");
        return;
    }

    try {
        tasks_.create(titleEdit.text().toStdString(), descEdit.toPlainText().toStdString());
    } catch (const std::exception& e) {
        QMessageBox::critical(this, "Error", "Failed to create task:\n" + QString::fromStdString(e.what()));
        return;
    }

    refreshTable();
}

std::optional<int> MainWindow::selectedTaskId() const {
    const QModelIndexList selected = taskTable->selectionModel()->selectedRows(DoneColumn);
    if (selected.isEmpty()) {
        return std::nullopt;
    }
    return selected.first().data(Qt::UserRole).toInt();
}

void MainWindow::onDeleteButtonClicked() {
    const std::optional<int> selectedId = selectedTaskId();
    if (!selectedId) {
        QMessageBox::information(this, "To-Do", "Select a row to delete.");
        return;
    }

    const int id = *selectedId;
    auto task = tasks_.get_service().find(id);
    if (!task) {
        return;
    }

    QMessageBox::StandardButton reply = QMessageBox::question(
        this,
        "Confirm",
        "Delete: " + QString::fromStdString(task->get_title()) + "?",
        QMessageBox::Ok | QMessageBox::Cancel
    );

    if (reply == QMessageBox::Ok && tasks_.remove(id)) {
        refreshTable();
    }
}

void MainWindow::showSaveWarning(const std::string& message) {
    qWarning() << QString::fromStdString(message);
    QMessageBox::warning(this, "Warning", QString::fromStdString(message));
}

void MainWindow::closeEvent(QCloseEvent* event) {
    QSettings settings;
    settings.setValue("geometry", saveGeometry());

    QMainWindow::closeEvent(event);
}
