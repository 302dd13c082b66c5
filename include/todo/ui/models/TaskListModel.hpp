#pragma once

#include <QAbstractListModel>
#include <QStringList>

namespace todo {
namespace ui {

class TaskListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    explicit TaskListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;

    void setTasks(QStringList tasks);
    QString taskAt(const QModelIndex &index) const;

private:
    QStringList m_tasks;
};

} // namespace ui
} // namespace todo
