#include "todo/ui/MainWindow.hpp"

#include <QAction>
#include <QCalendarWidget>
#include <QDate>
#include <QDateTime>
#include <QFrame>
#include <QHBoxLayout>
#include <QInputDialog>
#include <QItemSelectionModel>
#include <QLabel>
#include <QLineEdit>
#include <QListView>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSplitter>
#include <QStatusBar>
#include <QTime>
#include <QTimeEdit>
#include <QTimer>
#include <QToolButton>
#include <QVBoxLayout>
#include <optional>

#include "todo/core/AppContext.hpp"
#include "todo/core/AppSettings.hpp"
#include "todo/core/Logging.hpp"
#include "todo/core/TodoListService.hpp"
#include "todo/ui/TrayNotificationSink.hpp"
#include "todo/ui/dialogs/SettingsDialog.hpp"
#include "todo/ui/models/TaskListModel.hpp"

namespace todo {
namespace ui {

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(std::make_unique<core::AppContext>(
          std::make_unique<TrayNotificationSink>(core::AppSettings().notificationTimeoutMs())))
    , m_taskModel(std::make_unique<TaskListModel>())
{
    setupUi();

    connect(&service(), &core::TodoListService::listsChanged, this, [this]() { refreshLists(currentTitle()); });
    connect(&service(), &core::TodoListService::reminderCleared, this, &MainWindow::handleReminderCleared);
    connect(&service(), &core::TodoListService::reminderFired, this, [this](const QString &title) {
        statusBar()->showMessage(tr("Reminder for '%1' fired").arg(title), 5000);
    });

    // Reminders are re-armed before the window accepts any input.
    const core::OperationResult loaded = m_appContext->start();
    refreshLists();
    if (!loaded.ok()) {
        QTimer::singleShot(0, this, [this, loaded]() { reportResult(loaded, tr("Load Error")); });
    }
}

MainWindow::~MainWindow()
{
    if (m_splitter) {
        m_appContext->settings().setSplitterSizes(m_splitter->sizes());
    }
    const core::OperationResult saved = service().saveIfModified();
    if (!saved.ok()) {
        qCWarning(lcService) << "Saving on exit failed:" << saved.message;
    }
    m_appContext->stop();
}

void MainWindow::setupUi()
{
    setWindowTitle(tr("Todo Reminder"));
    resize(1000, 650);

    m_splitter = new QSplitter(Qt::Horizontal, this);
    m_splitter->addWidget(createSidebar());
    m_splitter->addWidget(createContentPanel());
    m_splitter->setStretchFactor(0, 0);
    m_splitter->setStretchFactor(1, 1);
    m_splitter->setCollapsible(1, false);

    const QList<int> sizes = m_appContext->settings().splitterSizes();
    if (sizes.size() == m_splitter->count()) {
        m_splitter->setSizes(sizes);
    }

    setCentralWidget(m_splitter);
    setupShortcuts();
    statusBar()->showMessage(tr("Ready"));
}

QWidget *MainWindow::createSidebar()
{
    auto *sidebar = new QFrame(this);
    sidebar->setMinimumWidth(240);
    sidebar->setMaximumWidth(300);
    auto *layout = new QVBoxLayout(sidebar);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(6);

    auto *header = new QLabel(tr("My Lists"), sidebar);
    header->setObjectName(QStringLiteral("sidebarHeader"));
    header->setAlignment(Qt::AlignCenter);
    QFont headerFont = header->font();
    headerFont.setBold(true);
    header->setFont(headerFont);
    layout->addWidget(header);

    m_listsWidget = new QListWidget(sidebar);
    m_listsWidget->setSelectionMode(QAbstractItemView::SingleSelection);
    connect(m_listsWidget, &QListWidget::itemSelectionChanged, this, &MainWindow::showSelectedList);
    layout->addWidget(m_listsWidget, 1);

    auto *buttonRow = new QHBoxLayout();
    auto *newButton = new QPushButton(tr("New"), sidebar);
    connect(newButton, &QPushButton::clicked, this, &MainWindow::createList);
    auto *deleteButton = new QPushButton(tr("Delete"), sidebar);
    connect(deleteButton, &QPushButton::clicked, this, &MainWindow::deleteSelectedList);
    buttonRow->addWidget(newButton);
    buttonRow->addWidget(deleteButton);
    layout->addLayout(buttonRow);

    auto *saveButton = new QPushButton(tr("Save All"), sidebar);
    connect(saveButton, &QPushButton::clicked, this, &MainWindow::saveAll);
    layout->addWidget(saveButton);

    return sidebar;
}

QWidget *MainWindow::createContentPanel()
{
    auto *panel = new QWidget(this);
    auto *layout = new QVBoxLayout(panel);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(6);

    auto *titleBar = new QHBoxLayout();
    m_titleLabel = new QLabel(tr("Select or create a list"), panel);
    m_titleLabel->setObjectName(QStringLiteral("titleLabel"));
    QFont titleFont = m_titleLabel->font();
    titleFont.setPointSizeF(titleFont.pointSizeF() * 1.4);
    titleFont.setBold(true);
    m_titleLabel->setFont(titleFont);
    titleBar->addWidget(m_titleLabel);
    titleBar->addStretch(1);

    auto *markDoneButton = new QPushButton(tr("Mark Done"), panel);
    connect(markDoneButton, &QPushButton::clicked, this, &MainWindow::markCurrentListDone);
    titleBar->addWidget(markDoneButton);

    auto *settingsButton = new QToolButton(panel);
    settingsButton->setText(QString::fromUtf8("\xE2\x98\xB0"));
    settingsButton->setToolTip(tr("Settings"));
    settingsButton->setAutoRaise(true);
    connect(settingsButton, &QToolButton::clicked, this, &MainWindow::openSettingsDialog);
    titleBar->addWidget(settingsButton);
    layout->addLayout(titleBar);

    auto *tasksArea = new QHBoxLayout();
    auto *taskColumn = new QVBoxLayout();

    m_tasksView = new QListView(panel);
    m_tasksView->setModel(m_taskModel.get());
    m_tasksView->setSelectionMode(QAbstractItemView::SingleSelection);
    taskColumn->addWidget(m_tasksView, 1);

    auto *addRow = new QHBoxLayout();
    m_taskInput = new QLineEdit(panel);
    m_taskInput->setPlaceholderText(tr("Add a task and press Add"));
    connect(m_taskInput, &QLineEdit::returnPressed, this, &MainWindow::addTaskToCurrentList);
    auto *addButton = new QPushButton(tr("Add"), panel);
    connect(addButton, &QPushButton::clicked, this, &MainWindow::addTaskToCurrentList);
    addRow->addWidget(m_taskInput, 1);
    addRow->addWidget(addButton);
    taskColumn->addLayout(addRow);

    auto *removeButton = new QPushButton(tr("Remove Selected Task"), panel);
    connect(removeButton, &QPushButton::clicked, this, &MainWindow::removeSelectedTask);
    taskColumn->addWidget(removeButton);

    tasksArea->addLayout(taskColumn, 2);
    tasksArea->addWidget(createReminderPanel(), 1);
    layout->addLayout(tasksArea, 1);

    auto *bottomRow = new QHBoxLayout();
    m_titleEdit = new QLineEdit(panel);
    m_titleEdit->setPlaceholderText(tr("Edit list title (press Rename)"));
    auto *renameButton = new QPushButton(tr("Rename"), panel);
    connect(renameButton, &QPushButton::clicked, this, &MainWindow::renameCurrentList);
    auto *saveListButton = new QPushButton(tr("Save List"), panel);
    connect(saveListButton, &QPushButton::clicked, this, &MainWindow::saveAll);
    bottomRow->addWidget(m_titleEdit, 1);
    bottomRow->addWidget(renameButton);
    bottomRow->addWidget(saveListButton);
    layout->addLayout(bottomRow);

    return panel;
}

QWidget *MainWindow::createReminderPanel()
{
    auto *panel = new QWidget(this);
    auto *layout = new QVBoxLayout(panel);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(6);

    layout->addWidget(new QLabel(tr("Schedule a reminder"), panel));

    m_calendar = new QCalendarWidget(panel);
    m_calendar->setGridVisible(true);
    m_calendar->setMinimumDate(QDate::currentDate());
    layout->addWidget(m_calendar);

    m_timeEdit = new QTimeEdit(panel);
    m_timeEdit->setDisplayFormat(QStringLiteral("HH:mm"));
    m_timeEdit->setTime(QTime::currentTime());
    layout->addWidget(m_timeEdit);

    auto *scheduleButton = new QPushButton(tr("Set Reminder for this list"), panel);
    connect(scheduleButton, &QPushButton::clicked, this, &MainWindow::scheduleReminderForCurrentList);
    layout->addWidget(scheduleButton);

    auto *clearButton = new QPushButton(tr("Clear Reminder"), panel);
    connect(clearButton, &QPushButton::clicked, this, &MainWindow::clearReminderForCurrentList);
    layout->addWidget(clearButton);

    m_reminderInfo = new QLabel(panel);
    layout->addWidget(m_reminderInfo);
    layout->addStretch(1);
    return panel;
}

void MainWindow::setupShortcuts()
{
    auto *saveAction = new QAction(tr("Save"), this);
    saveAction->setShortcut(QKeySequence::Save);
    connect(saveAction, &QAction::triggered, this, &MainWindow::saveAll);
    addAction(saveAction);

    auto *deleteTaskAction = new QAction(tr("Remove Task"), m_tasksView);
    deleteTaskAction->setShortcut(QKeySequence::Delete);
    deleteTaskAction->setShortcutContext(Qt::WidgetShortcut);
    connect(deleteTaskAction, &QAction::triggered, this, &MainWindow::removeSelectedTask);
    m_tasksView->addAction(deleteTaskAction);
}

core::TodoListService &MainWindow::service() const
{
    return m_appContext->service();
}

QString MainWindow::currentTitle() const
{
    if (!m_listsWidget) {
        return {};
    }
    const auto *item = m_listsWidget->currentItem();
    if (!item || !item->isSelected()) {
        return {};
    }
    return item->text();
}

void MainWindow::refreshLists(const QString &selectTitle)
{
    if (m_refreshing) {
        return;
    }
    m_refreshing = true;
    {
        QSignalBlocker blocker(m_listsWidget);
        m_listsWidget->clear();
        for (const auto &list : service().lists()) {
            auto *item = new QListWidgetItem(list.title, m_listsWidget);
            if (list.title == selectTitle) {
                m_listsWidget->setCurrentItem(item);
            }
        }
    }
    m_refreshing = false;
    showSelectedList();
}

void MainWindow::showSelectedList()
{
    const QString title = currentTitle();
    std::optional<data::TaskList> list;
    if (!title.isEmpty()) {
        list = service().list(title);
    }
    if (!list) {
        m_titleLabel->setText(tr("Select or create a list"));
        m_titleEdit->clear();
        m_taskModel->setTasks({});
        m_reminderInfo->clear();
        return;
    }

    m_titleLabel->setText(list->title);
    m_titleEdit->setText(list->title);
    m_taskModel->setTasks(list->tasks);
    if (!list->hasReminder()) {
        m_reminderInfo->setText(tr("No reminder set"));
        return;
    }
    const QDateTime reminder = data::parseReminder(list->reminder);
    if (reminder.isValid()) {
        m_reminderInfo->setText(tr("Reminder: %1").arg(reminder.toString(QStringLiteral("yyyy-MM-dd HH:mm"))));
    } else {
        m_reminderInfo->setText(tr("Reminder: (invalid)"));
    }
}

void MainWindow::createList()
{
    bool ok = false;
    const QString title = QInputDialog::getText(this, tr("New List"), tr("List title:"), QLineEdit::Normal, {}, &ok);
    if (!ok || title.trimmed().isEmpty()) {
        return;
    }
    if (reportResult(service().createList(title), tr("Exists"))) {
        refreshLists(title.trimmed());
    }
}

void MainWindow::deleteSelectedList()
{
    const QString title = currentTitle();
    if (title.isEmpty()) {
        return;
    }
    const auto answer = QMessageBox::question(this, tr("Delete"), tr("Delete list '%1'?").arg(title));
    if (answer != QMessageBox::Yes) {
        return;
    }
    reportResult(service().deleteList(title), tr("Delete"));
}

void MainWindow::renameCurrentList()
{
    const QString oldTitle = currentTitle();
    if (oldTitle.isEmpty()) {
        QMessageBox::information(this, tr("No List"), tr("Select a list to rename."));
        return;
    }
    const QString newTitle = m_titleEdit->text().trimmed();
    if (reportResult(service().renameList(oldTitle, newTitle), tr("Rename"))) {
        refreshLists(newTitle);
    }
}

void MainWindow::addTaskToCurrentList()
{
    const QString title = currentTitle();
    if (title.isEmpty()) {
        QMessageBox::information(this, tr("No List"), tr("Please select a list first."));
        return;
    }
    if (m_taskInput->text().trimmed().isEmpty()) {
        return;
    }
    if (reportResult(service().addTask(title, m_taskInput->text()), tr("Add Task"))) {
        m_taskInput->clear();
    }
}

void MainWindow::removeSelectedTask()
{
    const QString title = currentTitle();
    const QModelIndex index = m_tasksView->currentIndex();
    if (title.isEmpty() || !index.isValid()) {
        return;
    }
    reportResult(service().removeTask(title, index.row()), tr("Removed"));
}

void MainWindow::scheduleReminderForCurrentList()
{
    const QString title = currentTitle();
    if (title.isEmpty()) {
        QMessageBox::information(this, tr("No List"), tr("Select a list to schedule a reminder."));
        return;
    }
    const QTime time = m_timeEdit->time();
    const QDateTime when(m_calendar->selectedDate(), QTime(time.hour(), time.minute(), 0));
    reportResult(service().setReminder(title, when), tr("Invalid"));
}

void MainWindow::clearReminderForCurrentList()
{
    const QString title = currentTitle();
    if (title.isEmpty()) {
        return;
    }
    reportResult(service().clearReminder(title), tr("No Reminder"));
}

void MainWindow::markCurrentListDone()
{
    const QString title = currentTitle();
    if (title.isEmpty()) {
        return;
    }
    reportResult(service().markDone(title), tr("Done"));
}

void MainWindow::saveAll()
{
    reportResult(service().save(), tr("Save Error"));
}

void MainWindow::openSettingsDialog()
{
    if (!m_settingsDialog) {
        m_settingsDialog = std::make_unique<SettingsDialog>(m_appContext->settings(), this);
    }
    m_settingsDialog->exec();
}

void MainWindow::handleReminderCleared(const QString &title)
{
    if (currentTitle() == title) {
        m_reminderInfo->setText(tr("No reminder set"));
    }
}

bool MainWindow::reportResult(const core::OperationResult &result, const QString &caption)
{
    if (!result.ok()) {
        QMessageBox::warning(this, caption, result.message);
        return false;
    }
    if (!result.message.isEmpty()) {
        statusBar()->showMessage(result.message, 4000);
    }
    return true;
}

} // namespace ui
} // namespace todo
