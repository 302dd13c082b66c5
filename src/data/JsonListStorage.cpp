#include "todo/data/JsonListStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QObject>
#include <QSaveFile>

#include "todo/core/Logging.hpp"

namespace todo {
namespace data {

namespace {
const QString TasksKey = QStringLiteral("tasks");
const QString ReminderKey = QStringLiteral("reminder");

void setError(QString *errorMessage, const QString &text)
{
    if (errorMessage) {
        *errorMessage = text;
    }
}
} // namespace

JsonListStorage::JsonListStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &JsonListStorage::filePath() const
{
    return m_filePath;
}

void JsonListStorage::setFilePath(QString filePath)
{
    m_filePath = std::move(filePath);
}

bool JsonListStorage::load(std::vector<TaskList> &lists, QString *errorMessage) const
{
    lists.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        qCDebug(lcStorage) << "No data file at" << m_filePath << "- starting empty";
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, QObject::tr("Could not load data: %1").arg(file.errorString()));
        qCWarning(lcStorage) << "Failed to open" << m_filePath << file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QObject::tr("Could not load data: %1 at offset %2")
                                   .arg(parseError.errorString())
                                   .arg(parseError.offset));
        qCWarning(lcStorage) << "Invalid JSON in" << m_filePath << parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        setError(errorMessage, QObject::tr("Could not load data: top level is not an object"));
        qCWarning(lcStorage) << "Unexpected JSON shape in" << m_filePath;
        return false;
    }

    lists = fromJson(doc.object());
    qCInfo(lcStorage) << "Loaded" << lists.size() << "lists from" << m_filePath;
    return true;
}

bool JsonListStorage::save(const std::vector<TaskList> &lists, QString *errorMessage) const
{
    if (m_filePath.isEmpty()) {
        setError(errorMessage, QObject::tr("Could not save data: no file configured"));
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        setError(errorMessage, QObject::tr("Could not save data: cannot create %1").arg(dir.path()));
        qCWarning(lcStorage) << "Failed to create directory" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(errorMessage, QObject::tr("Could not save data: %1").arg(file.errorString()));
        qCWarning(lcStorage) << "Failed to open" << m_filePath << "for writing:" << file.errorString();
        return false;
    }

    const QJsonDocument doc(toJson(lists));
    file.write(doc.toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        setError(errorMessage, QObject::tr("Could not save data: %1").arg(file.errorString()));
        qCWarning(lcStorage) << "Failed to commit" << m_filePath << file.errorString();
        return false;
    }
    qCDebug(lcStorage) << "Saved" << lists.size() << "lists to" << m_filePath;
    return true;
}

QJsonObject JsonListStorage::toJson(const std::vector<TaskList> &lists)
{
    QJsonObject root;
    for (const TaskList &list : lists) {
        QJsonObject entry;
        entry.insert(TasksKey, QJsonArray::fromStringList(list.tasks));
        entry.insert(ReminderKey, list.reminder);
        root.insert(list.title, entry);
    }
    return root;
}

std::vector<TaskList> JsonListStorage::fromJson(const QJsonObject &root)
{
    std::vector<TaskList> lists;
    lists.reserve(static_cast<size_t>(root.size()));
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (it.key().isEmpty()) {
            continue;
        }
        if (!it.value().isObject()) {
            qCWarning(lcStorage) << "Skipping list" << it.key() << "- entry is not an object";
            continue;
        }
        const QJsonObject entry = it.value().toObject();

        TaskList list;
        list.title = it.key();
        const QJsonArray tasks = entry.value(TasksKey).toArray();
        for (const auto &task : tasks) {
            if (task.isString()) {
                list.tasks << task.toString();
            }
        }
        list.reminder = entry.value(ReminderKey).toString();
        lists.push_back(std::move(list));
    }
    return lists;
}

} // namespace data
} // namespace todo
