#include "tickoff/core/Logging.hpp"

#include <QString>

namespace tickoff {

Q_LOGGING_CATEGORY(lcStorage, "tickoff.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "tickoff.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcUi, "tickoff.ui", QtInfoMsg)

namespace core {

void configureLogging(bool verbose)
{
    qSetMessagePattern(QStringLiteral("%{if-category}%{category}: %{endif}%{message}"));
    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("tickoff.*.debug=true"));
    }
}

} // namespace core
} // namespace tickoff
