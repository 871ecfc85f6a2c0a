#pragma once

#include <QString>
#include <memory>
#include <optional>
#include <vector>

#include "tickoff/core/Result.hpp"
#include "tickoff/data/Task.hpp"

namespace tickoff {
namespace data {
class TaskStorage;
}

namespace core {

struct TaskChange
{
    data::Task task;
    PersistenceStatus persistence;
};

struct ClearResult
{
    int removed = 0;
    PersistenceStatus persistence;
};

struct TaskPartition
{
    std::vector<data::Task> pending;
    std::vector<data::Task> completed;
};

struct TaskStats
{
    int total = 0;
    int completed = 0;
    int pending = 0;
    double completionRate = 0.0;
};

// Sole owner of the task list. Every successful mutation is flushed to the
// storage before the call returns; the in-memory list stays authoritative
// when a flush fails.
class TaskStore
{
public:
    explicit TaskStore(std::shared_ptr<data::TaskStorage> storage);
    ~TaskStore();

    Result<TaskChange> add(const QString &description);
    Result<TaskChange> remove(const QString &idText);
    Result<TaskChange> complete(const QString &idText);
    ClearResult clearCompleted();

    // std::nullopt when there are no tasks at all.
    std::optional<TaskPartition> listAll() const;
    std::vector<data::Task> listPending() const;
    TaskStats stats() const;

    const std::vector<data::Task> &tasks() const;
    std::optional<data::Task> findById(int id) const;
    bool hasPending() const;

    QString location() const;
    const QString &loadWarning() const;

private:
    void load();
    PersistenceStatus save();
    int nextId() const;
    std::vector<data::Task>::iterator find(int id);

    static std::optional<int> parseId(const QString &idText);
    static QDateTime now();

    std::shared_ptr<data::TaskStorage> m_storage;
    std::vector<data::Task> m_tasks;
    QString m_loadWarning;
};

} // namespace core
} // namespace tickoff
