#include <QApplication>
#include <QCoreApplication>
#include <QIcon>
#include <QString>
#include <QStyle>

#include "version.h"

#include "todo/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("TodoReminder"));
    QCoreApplication::setApplicationName(QStringLiteral("Todo Reminder"));

    QApplication app(argc, argv);
    const QIcon appIcon = app.style()->standardIcon(QStyle::SP_FileDialogDetailedView);
    app.setWindowIcon(appIcon);

    todo::ui::MainWindow mainWindow;
    mainWindow.setWindowTitle(QObject::tr("Todo Reminder %1").arg(QString::fromLatin1(kTodoReminderVersion)));
    mainWindow.setWindowIcon(appIcon);
    mainWindow.show();

    return app.exec();
}
