#pragma once

#include <memory>

#include "todo/core/OperationResult.hpp"

namespace todo {
namespace data {
class DataProvider;
}

namespace core {

class AppSettings;
class NotificationSink;
class ReminderScheduler;
class TodoListService;

class AppContext
{
public:
    explicit AppContext(std::unique_ptr<NotificationSink> notificationSink);
    ~AppContext();

    /// Starts the reminder timeline, loads the lists from disk and re-arms
    /// their reminders. Returns the load outcome; a failed load leaves the
    /// application running with an empty store.
    OperationResult start();
    void stop();

    AppSettings &settings();
    TodoListService &service();

private:
    std::unique_ptr<AppSettings> m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<NotificationSink> m_notificationSink;
    std::unique_ptr<ReminderScheduler> m_scheduler;
    std::unique_ptr<TodoListService> m_service;
    bool m_started = false;
};

} // namespace core
} // namespace todo
