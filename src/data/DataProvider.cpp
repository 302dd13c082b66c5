#include "todo/data/DataProvider.hpp"

#include "todo/data/InMemoryListRepository.hpp"
#include "todo/data/JsonListStorage.hpp"

namespace todo {
namespace data {

DataProvider::DataProvider(const QString &dataFilePath)
    : m_listStorage(std::make_unique<JsonListStorage>(dataFilePath))
    , m_listRepository(std::make_unique<InMemoryListRepository>())
{
}

DataProvider::~DataProvider() = default;

ListRepository &DataProvider::listRepository()
{
    return *m_listRepository;
}

JsonListStorage &DataProvider::listStorage()
{
    return *m_listStorage;
}

} // namespace data
} // namespace todo
