#pragma once

#include <QLoggingCategory>

namespace tickoff {

Q_DECLARE_LOGGING_CATEGORY(lcStorage)
Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcUi)

namespace core {

// Installs the category filter rules for the process. Debug output of the
// tickoff categories is only enabled when verbose is set.
void configureLogging(bool verbose);

} // namespace core
} // namespace tickoff
