#pragma once

#include <QLoggingCategory>

namespace todo {
namespace core {

Q_DECLARE_LOGGING_CATEGORY(lcData)
Q_DECLARE_LOGGING_CATEGORY(lcCli)

// Turns on debug output for every todo.* category.
void enableVerboseLogging();

} // namespace core
} // namespace todo
