#include "todo/core/JobId.hpp"

namespace todo {
namespace core {

namespace {
constexpr auto JOB_ID_PREFIX = "reminder__";
}

QString jobIdForTitle(const QString &title)
{
    QString normalized = title;
    for (QChar &ch : normalized) {
        if (ch.isSpace()) {
            ch = QLatin1Char('_');
        }
    }
    return QLatin1String(JOB_ID_PREFIX) + normalized;
}

} // namespace core
} // namespace todo
