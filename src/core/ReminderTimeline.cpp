#include "todo/core/ReminderTimeline.hpp"

#include <QTimer>

#include "todo/core/Logging.hpp"

namespace todo {
namespace core {

ReminderTimeline::ReminderTimeline(QObject *parent)
    : QObject(parent)
{
}

ReminderTimeline::~ReminderTimeline()
{
    disarmAll();
}

void ReminderTimeline::arm(const QString &jobId, quint64 token, const QDateTime &fireAt)
{
    disarm(jobId);

    Entry entry;
    entry.token = token;
    entry.fireAt = fireAt;
    entry.timer = new QTimer(this);
    entry.timer->setSingleShot(true);
    entry.timer->setTimerType(Qt::PreciseTimer);
    connect(entry.timer, &QTimer::timeout, this, [this, jobId, token]() { handleTimeout(jobId, token); });

    auto it = m_entries.insert(jobId, entry);
    startChunk(it.value());
    qCDebug(lcScheduler) << "Armed" << jobId << "for" << fireAt;
}

void ReminderTimeline::disarm(const QString &jobId)
{
    auto it = m_entries.find(jobId);
    if (it == m_entries.end()) {
        return;
    }
    it->timer->stop();
    it->timer->deleteLater();
    m_entries.erase(it);
}

void ReminderTimeline::disarmAll()
{
    for (auto &entry : m_entries) {
        entry.timer->stop();
        delete entry.timer;
    }
    m_entries.clear();
}

void ReminderTimeline::startChunk(Entry &entry)
{
    // Far-future reminders are re-checked against the wall clock at least once per chunk.
    const qint64 remaining = QDateTime::currentDateTime().msecsTo(entry.fireAt);
    const qint64 interval = qBound<qint64>(0, remaining, MaxTimerChunkMs);
    entry.timer->start(static_cast<int>(interval));
}

void ReminderTimeline::handleTimeout(const QString &jobId, quint64 token)
{
    auto it = m_entries.find(jobId);
    if (it == m_entries.end() || it->token != token) {
        return;
    }
    if (QDateTime::currentDateTime() < it->fireAt) {
        startChunk(it.value());
        return;
    }
    it->timer->deleteLater();
    m_entries.erase(it);
    emit elapsed(jobId, token);
}

} // namespace core
} // namespace todo
