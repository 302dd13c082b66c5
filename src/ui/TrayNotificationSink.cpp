#include "todo/ui/TrayNotificationSink.hpp"

#include <QApplication>
#include <QStyle>
#include <QSystemTrayIcon>

#include "todo/core/Logging.hpp"

namespace todo {
namespace ui {

TrayNotificationSink::TrayNotificationSink(int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
}

TrayNotificationSink::~TrayNotificationSink() = default;

bool TrayNotificationSink::notify(const core::ReminderNotification &notification)
{
    if (!QSystemTrayIcon::isSystemTrayAvailable() || !QSystemTrayIcon::supportsMessages()) {
        qCWarning(lcNotify) << "System tray notifications are not available on this platform";
        return false;
    }
    if (!m_trayIcon) {
        QIcon icon = QApplication::windowIcon();
        if (icon.isNull()) {
            icon = QApplication::style()->standardIcon(QStyle::SP_MessageBoxInformation);
        }
        m_trayIcon = std::make_unique<QSystemTrayIcon>(icon);
        m_trayIcon->setToolTip(QApplication::applicationName());
    }
    if (!m_trayIcon->isVisible()) {
        m_trayIcon->show();
    }
    m_trayIcon->showMessage(notification.title, notification.body, QSystemTrayIcon::Information, m_timeoutMs);
    qCDebug(lcNotify) << "Shown notification" << notification.title;
    return true;
}

} // namespace ui
} // namespace todo
