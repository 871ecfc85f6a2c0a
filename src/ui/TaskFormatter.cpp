#include "tickoff/ui/TaskFormatter.hpp"

#include <QStringList>

namespace tickoff {
namespace ui {

namespace {
constexpr auto DISPLAY_FORMAT = "yyyy-MM-dd HH:mm:ss";

QString rule(QChar c, int width)
{
    return QString(width, c);
}

QString appendPersistence(QString text, const core::PersistenceStatus &persistence)
{
    if (!persistence.saved) {
        text += QLatin1Char('\n') + QStringLiteral("⚠️  %1 (changes are kept for this session only)")
                                        .arg(persistence.warning);
    }
    return text;
}
} // namespace

QString welcomeText(const QString &location)
{
    return QStringLiteral("🚀 Welcome to your Personal To-Do List Manager!\n📁 Tasks are stored in: %1").arg(location);
}

QString menuText()
{
    QStringList lines;
    lines << QString() << rule('=', 50) << QStringLiteral("📝 TO-DO LIST MANAGER") << rule('=', 50)
          << QStringLiteral("1. Add Task") << QStringLiteral("2. View All Tasks")
          << QStringLiteral("3. View Pending Tasks Only") << QStringLiteral("4. Mark Task as Completed")
          << QStringLiteral("5. Remove Task") << QStringLiteral("6. Clear Completed Tasks")
          << QStringLiteral("7. Show Statistics") << QStringLiteral("8. Help") << QStringLiteral("9. Exit")
          << rule('-', 50);
    return lines.join(QLatin1Char('\n'));
}

QString helpText(const QString &location)
{
    QStringList lines;
    lines << QString() << QStringLiteral("📖 HELP - How to use this To-Do List Manager:") << rule('-', 50)
          << QStringLiteral("• Add Task: Enter a description for your new task")
          << QStringLiteral("• View Tasks: See all your tasks with their status")
          << QStringLiteral("• Mark Completed: Enter the task ID to mark it as done")
          << QStringLiteral("• Remove Task: Enter the task ID to delete it permanently")
          << QStringLiteral("• Task IDs: Each task has a unique number in [brackets]")
          << QStringLiteral("• Data Storage: Tasks are automatically saved to '%1'").arg(location) << rule('-', 50);
    return lines.join(QLatin1Char('\n'));
}

QString farewellText()
{
    return QStringLiteral("\n👋 Thank you for using To-Do List Manager!\n💾 All your tasks have been saved automatically.");
}

QString formatTimestamp(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return QStringLiteral("Unknown");
    }
    return dt.toLocalTime().toString(QLatin1String(DISPLAY_FORMAT));
}

QString renderTaskList(const std::optional<core::TaskPartition> &partition)
{
    if (!partition) {
        return QStringLiteral("\n📝 No tasks found! Your to-do list is empty.");
    }

    const auto total = partition->pending.size() + partition->completed.size();
    QStringList lines;
    lines << QString() << QStringLiteral("📋 Your To-Do List (%1 tasks):").arg(total) << rule('-', 60);

    if (!partition->pending.empty()) {
        lines << QStringLiteral("🔄 PENDING TASKS:");
        for (const auto &task : partition->pending) {
            lines << QStringLiteral("  ⏳ [%1] %2").arg(QString::number(task.id), task.description)
                  << QStringLiteral("      Created: %1").arg(formatTimestamp(task.createdAt));
        }
    }
    if (!partition->completed.empty()) {
        lines << QString() << QStringLiteral("✅ COMPLETED TASKS:");
        for (const auto &task : partition->completed) {
            lines << QStringLiteral("  ✓ [%1] %2").arg(QString::number(task.id), task.description)
                  << QStringLiteral("      Completed: %1").arg(formatTimestamp(task.completedAt));
        }
    }

    lines << rule('-', 60)
          << QStringLiteral("📊 Summary: %1 pending, %2 completed")
                 .arg(partition->pending.size())
                 .arg(partition->completed.size());
    return lines.join(QLatin1Char('\n'));
}

QString renderPending(const std::vector<data::Task> &pending)
{
    if (pending.empty()) {
        return QStringLiteral("\n🎉 Great! No pending tasks. You're all caught up!");
    }

    QStringList lines;
    lines << QString() << QStringLiteral("⏳ Pending Tasks (%1):").arg(pending.size()) << rule('-', 40);
    for (const auto &task : pending) {
        lines << QStringLiteral("  [%1] %2").arg(QString::number(task.id), task.description)
              << QStringLiteral("      Created: %1").arg(formatTimestamp(task.createdAt));
    }
    lines << rule('-', 40);
    return lines.join(QLatin1Char('\n'));
}

QString renderStats(const core::TaskStats &stats)
{
    if (stats.total == 0) {
        return QStringLiteral("\n📊 Statistics: No tasks available");
    }

    QStringList lines;
    lines << QString() << QStringLiteral("📊 Task Statistics:")
          << QStringLiteral("  Total tasks: %1").arg(stats.total)
          << QStringLiteral("  Completed: %1").arg(stats.completed)
          << QStringLiteral("  Pending: %1").arg(stats.pending)
          << QStringLiteral("  Completion rate: %1%").arg(QString::number(stats.completionRate, 'f', 1));
    return lines.join(QLatin1Char('\n'));
}

QString renderAdded(const core::TaskChange &change)
{
    return appendPersistence(QStringLiteral("✓ Task added successfully: '%1'").arg(change.task.description),
                             change.persistence);
}

QString renderRemoved(const core::TaskChange &change)
{
    return appendPersistence(QStringLiteral("✓ Task removed: '%1'").arg(change.task.description),
                             change.persistence);
}

QString renderCompleted(const core::TaskChange &change)
{
    return appendPersistence(QStringLiteral("✓ Task marked as completed: '%1'").arg(change.task.description),
                             change.persistence);
}

QString renderCleared(const core::ClearResult &result)
{
    if (result.removed == 0) {
        return QStringLiteral("No completed tasks to clear!");
    }
    return appendPersistence(QStringLiteral("✓ Cleared %1 completed task(s)").arg(result.removed),
                             result.persistence);
}

QString renderError(const core::TaskError &error)
{
    switch (error.kind) {
    case core::ErrorKind::Validation:
        return QStringLiteral("❌ Invalid input: %1").arg(error.message);
    case core::ErrorKind::InvalidArgument:
        return QStringLiteral("❌ Invalid task ID: %1").arg(error.message);
    case core::ErrorKind::NotFound:
    default:
        return QStringLiteral("❌ Not found: %1").arg(error.message);
    }
}

QString renderLoadWarning(const QString &warning)
{
    return QStringLiteral("Warning: %1").arg(warning);
}

} // namespace ui
} // namespace tickoff
