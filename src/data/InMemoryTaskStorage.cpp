#include "tickoff/data/InMemoryTaskStorage.hpp"

namespace tickoff {
namespace data {

InMemoryTaskStorage::InMemoryTaskStorage() = default;

InMemoryTaskStorage::InMemoryTaskStorage(std::vector<Task> tasks)
    : m_tasks(std::move(tasks))
{
}

InMemoryTaskStorage::~InMemoryTaskStorage() = default;

std::vector<Task> InMemoryTaskStorage::load(QString *warning)
{
    if (!m_loadWarning.isEmpty()) {
        if (warning) {
            *warning = m_loadWarning;
        }
        return {};
    }
    return m_tasks;
}

bool InMemoryTaskStorage::save(const std::vector<Task> &tasks, QString *errorMessage)
{
    if (m_failSaves) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Error saving tasks: storage is read-only");
        }
        return false;
    }
    m_tasks = tasks;
    ++m_saveCount;
    return true;
}

QString InMemoryTaskStorage::location() const
{
    return QStringLiteral(":memory:");
}

const std::vector<Task> &InMemoryTaskStorage::savedTasks() const
{
    return m_tasks;
}

int InMemoryTaskStorage::saveCount() const
{
    return m_saveCount;
}

void InMemoryTaskStorage::setFailSaves(bool fail)
{
    m_failSaves = fail;
}

void InMemoryTaskStorage::setLoadWarning(const QString &warning)
{
    m_loadWarning = warning;
}

} // namespace data
} // namespace tickoff
