#pragma once

#include <optional>
#include <vector>

#include "todo/data/TaskList.hpp"

namespace todo {
namespace data {

class ListRepository
{
public:
    virtual ~ListRepository() = default;

    virtual std::vector<TaskList> fetchLists() const = 0;
    virtual std::optional<TaskList> findByTitle(const QString &title) const = 0;
    virtual bool contains(const QString &title) const = 0;
    virtual bool addList(TaskList list) = 0;
    virtual bool updateList(const TaskList &list) = 0;
    virtual bool removeList(const QString &title) = 0;
    virtual bool renameList(const QString &oldTitle, const QString &newTitle) = 0;
    virtual void replaceAll(std::vector<TaskList> lists) = 0;
};

} // namespace data
} // namespace todo
