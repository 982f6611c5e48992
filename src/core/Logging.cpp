#include "todo/core/Logging.hpp"

namespace todo {
namespace core {

Q_LOGGING_CATEGORY(lcData, "todo.data", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCli, "todo.cli", QtInfoMsg)

void enableVerboseLogging()
{
    QLoggingCategory::setFilterRules(QStringLiteral("todo.*.debug=true"));
}

} // namespace core
} // namespace todo
