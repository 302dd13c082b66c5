#include "todo/core/Logging.hpp"

namespace todo {

Q_LOGGING_CATEGORY(lcStorage, "todo.storage")
Q_LOGGING_CATEGORY(lcScheduler, "todo.scheduler")
Q_LOGGING_CATEGORY(lcService, "todo.service")
Q_LOGGING_CATEGORY(lcNotify, "todo.notify")

} // namespace todo
