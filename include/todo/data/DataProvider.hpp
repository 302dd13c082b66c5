#pragma once

#include <memory>
#include <QString>

namespace todo {
namespace data {

class ListRepository;
class JsonListStorage;

class DataProvider
{
public:
    explicit DataProvider(const QString &dataFilePath);
    ~DataProvider();

    ListRepository &listRepository();
    JsonListStorage &listStorage();

private:
    std::unique_ptr<JsonListStorage> m_listStorage;
    std::unique_ptr<ListRepository> m_listRepository;
};

} // namespace data
} // namespace todo
