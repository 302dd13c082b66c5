#pragma once

#include <QMap>

#include "todo/data/ListRepository.hpp"

namespace todo {
namespace data {

class InMemoryListRepository : public ListRepository
{
public:
    InMemoryListRepository();
    ~InMemoryListRepository() override;

    std::vector<TaskList> fetchLists() const override;
    std::optional<TaskList> findByTitle(const QString &title) const override;
    bool contains(const QString &title) const override;
    bool addList(TaskList list) override;
    bool updateList(const TaskList &list) override;
    bool removeList(const QString &title) override;
    bool renameList(const QString &oldTitle, const QString &newTitle) override;
    void replaceAll(std::vector<TaskList> lists) override;

private:
    QMap<QString, TaskList> m_lists;
};

} // namespace data
} // namespace todo
