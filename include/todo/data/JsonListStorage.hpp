#pragma once

#include <QJsonObject>
#include <QString>
#include <vector>

#include "todo/data/TaskList.hpp"

namespace todo {
namespace data {

/// Reads and writes the whole list mapping as one JSON snapshot file:
/// { "<title>": { "tasks": ["..."], "reminder": "<ISO-8601 or empty>" }, ... }
class JsonListStorage
{
public:
    explicit JsonListStorage(QString filePath);
    ~JsonListStorage() = default;

    const QString &filePath() const;
    void setFilePath(QString filePath);

    /// A missing file loads as an empty mapping. Returns false and leaves
    /// `lists` empty when the file cannot be read or is not a JSON object.
    bool load(std::vector<TaskList> &lists, QString *errorMessage = nullptr) const;
    bool save(const std::vector<TaskList> &lists, QString *errorMessage = nullptr) const;

    static QJsonObject toJson(const std::vector<TaskList> &lists);
    static std::vector<TaskList> fromJson(const QJsonObject &root);

private:
    QString m_filePath;
};

} // namespace data
} // namespace todo
