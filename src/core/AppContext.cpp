#include "todo/core/AppContext.hpp"

#include "todo/core/AppSettings.hpp"
#include "todo/core/Logging.hpp"
#include "todo/core/NotificationSink.hpp"
#include "todo/core/ReminderScheduler.hpp"
#include "todo/core/TodoListService.hpp"
#include "todo/data/DataProvider.hpp"

namespace todo {
namespace core {

AppContext::AppContext(std::unique_ptr<NotificationSink> notificationSink)
    : m_settings(std::make_unique<AppSettings>())
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings->dataFilePath()))
    , m_notificationSink(std::move(notificationSink))
    , m_scheduler(std::make_unique<ReminderScheduler>())
    , m_service(std::make_unique<TodoListService>(m_dataProvider->listRepository(),
                                                  m_dataProvider->listStorage(),
                                                  *m_scheduler,
                                                  *m_notificationSink))
{
}

AppContext::~AppContext()
{
    stop();
}

OperationResult AppContext::start()
{
    if (m_started) {
        return OperationResult::success();
    }
    m_started = true;
    m_scheduler->start();
    OperationResult loaded = m_service->load();
    const OperationResult rearmed = m_service->rearmReminders();
    if (!rearmed.ok()) {
        qCWarning(lcService) << "Startup rearm could not persist dropped reminders:" << rearmed.message;
    }
    return loaded;
}

void AppContext::stop()
{
    if (!m_started) {
        return;
    }
    m_started = false;
    m_scheduler->stop();
}

AppSettings &AppContext::settings()
{
    return *m_settings;
}

TodoListService &AppContext::service()
{
    return *m_service;
}

} // namespace core
} // namespace todo
