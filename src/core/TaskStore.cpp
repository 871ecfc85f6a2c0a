#include "tickoff/core/TaskStore.hpp"

#include "tickoff/core/Logging.hpp"
#include "tickoff/data/TaskStorage.hpp"

#include <QDateTime>
#include <algorithm>
#include <iterator>

namespace tickoff {
namespace core {

TaskStore::TaskStore(std::shared_ptr<data::TaskStorage> storage)
    : m_storage(std::move(storage))
{
    load();
}

TaskStore::~TaskStore() = default;

Result<TaskChange> TaskStore::add(const QString &description)
{
    const QString trimmed = description.trimmed();
    if (trimmed.isEmpty()) {
        return Result<TaskChange>::failure(ErrorKind::Validation,
                                           QStringLiteral("Task description cannot be empty!"));
    }

    data::Task task;
    task.id = nextId();
    task.description = trimmed;
    task.createdAt = now();
    m_tasks.push_back(task);
    qCDebug(lcStore) << "added task" << task.id;

    return Result<TaskChange>::success(TaskChange{ std::move(task), save() });
}

Result<TaskChange> TaskStore::remove(const QString &idText)
{
    const auto id = parseId(idText);
    if (!id) {
        return Result<TaskChange>::failure(ErrorKind::InvalidArgument,
                                           QStringLiteral("Please enter a valid task ID (number)!"));
    }

    auto it = find(*id);
    if (it == m_tasks.end()) {
        return Result<TaskChange>::failure(ErrorKind::NotFound, QStringLiteral("No task found with ID %1").arg(*id));
    }

    data::Task removed = std::move(*it);
    m_tasks.erase(it);
    qCDebug(lcStore) << "removed task" << removed.id;

    return Result<TaskChange>::success(TaskChange{ std::move(removed), save() });
}

Result<TaskChange> TaskStore::complete(const QString &idText)
{
    const auto id = parseId(idText);
    if (!id) {
        return Result<TaskChange>::failure(ErrorKind::InvalidArgument,
                                           QStringLiteral("Please enter a valid task ID (number)!"));
    }

    auto it = find(*id);
    if (it == m_tasks.end()) {
        return Result<TaskChange>::failure(ErrorKind::NotFound, QStringLiteral("No task found with ID %1").arg(*id));
    }

    // Completing twice refreshes the completion time.
    it->completed = true;
    it->completedAt = now();
    qCDebug(lcStore) << "completed task" << it->id;

    data::Task completed = *it;
    return Result<TaskChange>::success(TaskChange{ std::move(completed), save() });
}

ClearResult TaskStore::clearCompleted()
{
    const auto firstCompleted = std::stable_partition(m_tasks.begin(), m_tasks.end(), [](const data::Task &task) {
        return !task.completed;
    });

    ClearResult result;
    result.removed = static_cast<int>(std::distance(firstCompleted, m_tasks.end()));
    if (result.removed == 0) {
        return result;
    }
    m_tasks.erase(firstCompleted, m_tasks.end());
    qCDebug(lcStore) << "cleared" << result.removed << "completed tasks";

    result.persistence = save();
    return result;
}

std::optional<TaskPartition> TaskStore::listAll() const
{
    if (m_tasks.empty()) {
        return std::nullopt;
    }

    TaskPartition partition;
    for (const auto &task : m_tasks) {
        if (task.completed) {
            partition.completed.push_back(task);
        } else {
            partition.pending.push_back(task);
        }
    }
    return partition;
}

std::vector<data::Task> TaskStore::listPending() const
{
    std::vector<data::Task> pending;
    std::copy_if(m_tasks.begin(), m_tasks.end(), std::back_inserter(pending), [](const data::Task &task) {
        return !task.completed;
    });
    return pending;
}

TaskStats TaskStore::stats() const
{
    TaskStats stats;
    stats.total = static_cast<int>(m_tasks.size());
    stats.completed = static_cast<int>(std::count_if(m_tasks.begin(), m_tasks.end(), [](const data::Task &task) {
        return task.completed;
    }));
    stats.pending = stats.total - stats.completed;
    if (stats.total > 0) {
        stats.completionRate = static_cast<double>(stats.completed) / stats.total * 100.0;
    }
    return stats;
}

const std::vector<data::Task> &TaskStore::tasks() const
{
    return m_tasks;
}

std::optional<data::Task> TaskStore::findById(int id) const
{
    const auto it = std::find_if(m_tasks.begin(), m_tasks.end(), [id](const data::Task &task) {
        return task.id == id;
    });
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return *it;
}

bool TaskStore::hasPending() const
{
    return std::any_of(m_tasks.begin(), m_tasks.end(), [](const data::Task &task) {
        return !task.completed;
    });
}

QString TaskStore::location() const
{
    if (!m_storage) {
        return {};
    }
    return m_storage->location();
}

const QString &TaskStore::loadWarning() const
{
    return m_loadWarning;
}

void TaskStore::load()
{
    m_tasks.clear();
    m_loadWarning.clear();
    if (!m_storage) {
        return;
    }
    m_tasks = m_storage->load(&m_loadWarning);
    if (!m_loadWarning.isEmpty()) {
        m_tasks.clear();
    }
}

PersistenceStatus TaskStore::save()
{
    PersistenceStatus status;
    if (!m_storage) {
        status.saved = false;
        status.warning = QStringLiteral("Error saving tasks: no storage configured");
    } else {
        status.saved = m_storage->save(m_tasks, &status.warning);
    }
    if (!status.saved) {
        qCWarning(lcStore).noquote() << "changes kept in memory only:" << status.warning;
    }
    return status;
}

int TaskStore::nextId() const
{
    int maxId = 0;
    for (const auto &task : m_tasks) {
        maxId = std::max(maxId, task.id);
    }
    return maxId + 1;
}

std::vector<data::Task>::iterator TaskStore::find(int id)
{
    return std::find_if(m_tasks.begin(), m_tasks.end(), [id](const data::Task &task) {
        return task.id == id;
    });
}

std::optional<int> TaskStore::parseId(const QString &idText)
{
    bool ok = false;
    const int id = idText.trimmed().toInt(&ok, 10);
    if (!ok) {
        return std::nullopt;
    }
    return id;
}

QDateTime TaskStore::now()
{
    return QDateTime::fromSecsSinceEpoch(QDateTime::currentSecsSinceEpoch());
}

} // namespace core
} // namespace tickoff
