#pragma once

#include <QString>

namespace todo {
namespace core {

/// Every whitespace character of the title becomes '_', prefixed with "reminder__".
QString jobIdForTitle(const QString &title);

} // namespace core
} // namespace todo
