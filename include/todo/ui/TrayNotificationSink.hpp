#pragma once

#include <memory>

#include "todo/core/NotificationSink.hpp"

class QSystemTrayIcon;

namespace todo {
namespace ui {

class TrayNotificationSink : public core::NotificationSink
{
public:
    explicit TrayNotificationSink(int timeoutMs);
    ~TrayNotificationSink() override;

    bool notify(const core::ReminderNotification &notification) override;

private:
    std::unique_ptr<QSystemTrayIcon> m_trayIcon;
    int m_timeoutMs = 10000;
};

} // namespace ui
} // namespace todo
