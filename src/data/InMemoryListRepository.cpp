#include "todo/data/InMemoryListRepository.hpp"

namespace todo {
namespace data {

InMemoryListRepository::InMemoryListRepository() = default;
InMemoryListRepository::~InMemoryListRepository() = default;

std::vector<TaskList> InMemoryListRepository::fetchLists() const
{
    std::vector<TaskList> lists;
    lists.reserve(static_cast<size_t>(m_lists.size()));
    for (const auto &list : m_lists) {
        lists.push_back(list);
    }
    return lists;
}

std::optional<TaskList> InMemoryListRepository::findByTitle(const QString &title) const
{
    auto it = m_lists.constFind(title);
    if (it != m_lists.constEnd()) {
        return it.value();
    }
    return std::nullopt;
}

bool InMemoryListRepository::contains(const QString &title) const
{
    return m_lists.contains(title);
}

bool InMemoryListRepository::addList(TaskList list)
{
    if (list.title.isEmpty() || m_lists.contains(list.title)) {
        return false;
    }
    const QString key = list.title;
    m_lists.insert(key, std::move(list));
    return true;
}

bool InMemoryListRepository::updateList(const TaskList &list)
{
    if (!m_lists.contains(list.title)) {
        return false;
    }
    m_lists.insert(list.title, list);
    return true;
}

bool InMemoryListRepository::removeList(const QString &title)
{
    return m_lists.remove(title) > 0;
}

bool InMemoryListRepository::renameList(const QString &oldTitle, const QString &newTitle)
{
    if (newTitle.isEmpty() || !m_lists.contains(oldTitle) || m_lists.contains(newTitle)) {
        return false;
    }
    TaskList list = m_lists.take(oldTitle);
    list.title = newTitle;
    m_lists.insert(newTitle, std::move(list));
    return true;
}

void InMemoryListRepository::replaceAll(std::vector<TaskList> lists)
{
    m_lists.clear();
    for (auto &list : lists) {
        if (list.title.isEmpty()) {
            continue;
        }
        const QString key = list.title;
        m_lists.insert(key, std::move(list));
    }
}

} // namespace data
} // namespace todo
