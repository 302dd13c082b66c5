#pragma once

#include <QMainWindow>
#include <memory>

#include "todo/core/OperationResult.hpp"

class QCalendarWidget;
class QLabel;
class QLineEdit;
class QListView;
class QListWidget;
class QSplitter;
class QTimeEdit;

namespace todo {
namespace core {
class AppContext;
class TodoListService;
}

namespace ui {

class SettingsDialog;
class TaskListModel;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

private:
    void setupUi();
    QWidget *createSidebar();
    QWidget *createContentPanel();
    QWidget *createReminderPanel();
    void setupShortcuts();
    core::TodoListService &service() const;
    QString currentTitle() const;
    void refreshLists(const QString &selectTitle = QString());
    void showSelectedList();
    void createList();
    void deleteSelectedList();
    void renameCurrentList();
    void addTaskToCurrentList();
    void removeSelectedTask();
    void scheduleReminderForCurrentList();
    void clearReminderForCurrentList();
    void markCurrentListDone();
    void saveAll();
    void openSettingsDialog();
    void handleReminderCleared(const QString &title);
    bool reportResult(const core::OperationResult &result, const QString &caption);

    std::unique_ptr<core::AppContext> m_appContext;
    std::unique_ptr<TaskListModel> m_taskModel;
    std::unique_ptr<SettingsDialog> m_settingsDialog;
    QSplitter *m_splitter = nullptr;
    QListWidget *m_listsWidget = nullptr;
    QLabel *m_titleLabel = nullptr;
    QListView *m_tasksView = nullptr;
    QLineEdit *m_taskInput = nullptr;
    QCalendarWidget *m_calendar = nullptr;
    QTimeEdit *m_timeEdit = nullptr;
    QLabel *m_reminderInfo = nullptr;
    QLineEdit *m_titleEdit = nullptr;
    bool m_refreshing = false;
};

} // namespace ui
} // namespace todo
