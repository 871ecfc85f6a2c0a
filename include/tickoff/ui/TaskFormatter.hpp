#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "tickoff/core/TaskStore.hpp"

namespace tickoff {
namespace ui {

QString welcomeText(const QString &location);
QString menuText();
QString helpText(const QString &location);
QString farewellText();

QString formatTimestamp(const QDateTime &dt);

// Pending tasks first, then completed ones, followed by a summary line.
QString renderTaskList(const std::optional<core::TaskPartition> &partition);
QString renderPending(const std::vector<data::Task> &pending);
QString renderStats(const core::TaskStats &stats);

QString renderAdded(const core::TaskChange &change);
QString renderRemoved(const core::TaskChange &change);
QString renderCompleted(const core::TaskChange &change);
QString renderCleared(const core::ClearResult &result);
QString renderError(const core::TaskError &error);
QString renderLoadWarning(const QString &warning);

} // namespace ui
} // namespace tickoff
