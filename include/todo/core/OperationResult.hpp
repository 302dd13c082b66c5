#pragma once

#include <QString>

namespace todo {
namespace core {

enum class ListError
{
    None,
    EmptyTitle,
    DuplicateTitle,
    TitleCollision,
    NoSuchList,
    EmptyTask,
    InvalidTaskIndex,
    PastReminder,
    NoReminder,
    SchedulerFailed,
    PersistenceFailed,
};

/// Outcome of a list operation. `message` is meant for the user, on
/// success as well as on failure.
struct OperationResult
{
    ListError error = ListError::None;
    QString message;

    bool ok() const { return error == ListError::None; }

    static OperationResult success(QString message = {}) { return { ListError::None, std::move(message) }; }
    static OperationResult failure(ListError error, QString message) { return { error, std::move(message) }; }
};

} // namespace core
} // namespace todo
