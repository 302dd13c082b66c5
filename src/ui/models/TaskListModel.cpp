#include "todo/ui/models/TaskListModel.hpp"

#include <QFont>

#include "todo/data/TaskList.hpp"

namespace todo {
namespace ui {

TaskListModel::TaskListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int TaskListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_tasks.size();
}

QVariant TaskListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_tasks.size()) {
        return {};
    }

    const QString &task = m_tasks.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
        return task;
    case Qt::ToolTipRole:
        return tr("Task %1 of %2").arg(index.row() + 1).arg(m_tasks.size());
    case Qt::FontRole: {
        if (!task.startsWith(data::DoneMarker)) {
            return {};
        }
        QFont font;
        font.setStrikeOut(true);
        return font;
    }
    default:
        return {};
    }
}

Qt::ItemFlags TaskListModel::flags(const QModelIndex &index) const
{
    auto defaultFlags = QAbstractListModel::flags(index);
    if (!index.isValid()) {
        return defaultFlags;
    }
    return defaultFlags | Qt::ItemIsSelectable | Qt::ItemIsEnabled;
}

void TaskListModel::setTasks(QStringList tasks)
{
    beginResetModel();
    m_tasks = std::move(tasks);
    endResetModel();
}

QString TaskListModel::taskAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_tasks.size()) {
        return {};
    }
    return m_tasks.at(index.row());
}

} // namespace ui
} // namespace todo
